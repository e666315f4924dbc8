//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_PLATFORM_DEFINES_HPP_INCLUDED
#define DTUI_PLATFORM_DEFINES_HPP_INCLUDED

#include "linux/epoll_single_threaded_executor.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>

namespace dtui
{
namespace platform
{

using SingleThreadedExecutor = Linux::EpollSingleThreadedExecutor;

/// Spins the executor once, and then polls its awaitable resources for at most `max_wait`.
///
/// The wait is shortened if the executor has a callback scheduled earlier.
///
/// @return The worst lateness of the callbacks executed during the spin.
///
template <typename Executor>
libcyphal::Duration spinAndPoll(Executor& executor, const libcyphal::Duration max_wait)
{
    const auto spin_result = executor.spinOnce();

    libcyphal::Duration timeout{max_wait};
    if (spin_result.next_exec_time.has_value())
    {
        timeout = std::min(timeout, spin_result.next_exec_time.value() - executor.now());
    }

    if (const auto poll_failure = executor.pollAwaitableResourcesFor(cetl::make_optional(timeout)))
    {
        if (const auto* const err = cetl::get_if<int>(&*poll_failure))
        {
            spdlog::warn("Failed to poll awaitable resources: {}.", std::strerror(*err));
        }
        else
        {
            spdlog::warn("Failed to poll awaitable resources.");
        }
    }

    return spin_result.worst_lateness;
}

/// Waits for the predicate to be fulfilled by spinning the executor and its awaitable resources.
///
template <typename Executor, typename Predicate>
void waitPollingUntil(Executor& executor, Predicate predicate)
{
    spdlog::trace("Waiting for predicate to be fulfilled...");

    libcyphal::Duration worst_lateness{0};
    while (!predicate())
    {
        // Poll awaitable resources but awake at least once per second.
        worst_lateness = std::max(worst_lateness, spinAndPoll(executor, std::chrono::seconds{1}));
    }

    spdlog::trace("Predicate is fulfilled (worst_lateness={}us).",
                  std::chrono::duration_cast<std::chrono::microseconds>(worst_lateness).count());
}

}  // namespace platform
}  // namespace dtui

#endif  // DTUI_PLATFORM_DEFINES_HPP_INCLUDED
