//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define DTUI_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "dtui/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/errors.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace dtui
{
namespace platform
{
namespace Linux  // NOLINT(readability-identifier-naming)
{

/// Single-threaded executor which uses `epoll` to await readiness of file descriptors.
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
    using Base = SingleThreadedExecutor;

public:
    /// Failure of the awaitable resources polling; `errno` of the failed `epoll_wait`,
    /// or `libcyphal::ArgumentError` if there is nothing to wait for and no timeout.
    ///
    using PollFailure = cetl::variant<int, libcyphal::ArgumentError>;

    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
        , total_awaitables_{0}
    {
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor() override
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    CETL_NODISCARD bool isValid() const noexcept
    {
        return epollfd_ >= 0;
    }

    /// Waits for any of registered file descriptors to become ready, and schedules their callbacks.
    ///
    /// An empty `timeout` means "wait forever".
    ///
    CETL_NODISCARD cetl::optional<PollFailure> pollAwaitableResourcesFor(
        const cetl::optional<libcyphal::Duration> timeout) const
    {
        if (total_awaitables_ == 0)
        {
            if (!timeout)
            {
                return PollFailure{libcyphal::ArgumentError{}};
            }
            std::this_thread::sleep_for(std::max(*timeout, libcyphal::Duration::zero()));
            return cetl::nullopt;
        }

        // Convert the timeout (if any) to milliseconds of `epoll_wait`.
        int clamped_timeout_ms = -1;
        if (timeout)
        {
            using PollDuration = std::chrono::milliseconds;

            const auto timeout_ms = std::chrono::duration_cast<PollDuration>(*timeout).count();
            clamped_timeout_ms    = static_cast<int>(
                std::max(static_cast<PollDuration::rep>(0),
                         std::min(timeout_ms, static_cast<PollDuration::rep>(std::numeric_limits<int>::max()))));
        }

        std::array<epoll_event, MaxEvents> evs{};
        const int epoll_result = ::epoll_wait(epollfd_, evs.data(), evs.size(), clamped_timeout_ms);
        if (epoll_result < 0)
        {
            const auto err = errno;
            if (err == EINTR)
            {
                return cetl::nullopt;
            }
            return PollFailure{err};
        }

        const auto approx_now = now();
        for (std::size_t index = 0; index < static_cast<std::size_t>(epoll_result); ++index)
        {
            const auto& ev = evs[index];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
            if (auto* const node = static_cast<AwaitableNode*>(ev.data.ptr))
            {
                node->schedule(Callback::Schedule::Once{approx_now});
            }
        }
        return cetl::nullopt;
    }

    // MARK: - IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        return libcyphal::TimePoint{} +
               std::chrono::duration_cast<libcyphal::Duration>(std::chrono::steady_clock::now().time_since_epoch());
    }

    // MARK: - IPosixExecutorExtension

    CETL_NODISCARD Callback::Any registerAwaitableCallback(Callback::Function&&    function,
                                                           const Trigger::Variant& trigger) override
    {
        AwaitableNode new_cb_node{*this, std::move(function)};

        cetl::visit(cetl::make_overloaded(
                        [&new_cb_node](const Trigger::Readable& readable) {
                            //
                            new_cb_node.setup(readable.fd, EPOLLIN);
                        },
                        [&new_cb_node](const Trigger::Writable& writable) {
                            //
                            new_cb_node.setup(writable.fd, EPOLLOUT);
                        }),
                    trigger);

        insertCallbackNode(new_cb_node);
        return {std::move(new_cb_node)};
    }

protected:
    // MARK: RTTI

    CETL_NODISCARD void* _cast_(const cetl::type_id& id) & noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD const void* _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    static constexpr int MaxEvents = 16;

    class AwaitableNode final : public CallbackNode
    {
    public:
        AwaitableNode(EpollSingleThreadedExecutor& executor, Callback::Function&& function)
            : CallbackNode{executor, std::move(function)}
            , fd_{-1}
            , events_{0}
        {
        }

        ~AwaitableNode() override
        {
            if (fd_ >= 0)
            {
                ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_DEL, fd_, nullptr);
                --getExecutor().total_awaitables_;
            }
        }

        AwaitableNode(AwaitableNode&& other) noexcept
            : CallbackNode(std::move(static_cast<CallbackNode&&>(other)))
            , fd_{std::exchange(other.fd_, -1)}
            , events_{std::exchange(other.events_, 0)}
        {
            // The node has moved, so the epoll user data has to follow it.
            if (fd_ >= 0)
            {
                ::epoll_event ev{events_, {this}};
                ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_MOD, fd_, &ev);
            }
        }

        AwaitableNode(const AwaitableNode&)                      = delete;
        AwaitableNode& operator=(const AwaitableNode&)           = delete;
        AwaitableNode& operator=(AwaitableNode&& other) noexcept = delete;

        void setup(const int fd, const std::uint32_t events) noexcept
        {
            CETL_DEBUG_ASSERT(fd >= 0, "");
            CETL_DEBUG_ASSERT(events != 0, "");

            fd_     = fd;
            events_ = events;

            ::epoll_event ev{events_, {this}};
            if (0 == ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_ADD, fd_, &ev))
            {
                ++getExecutor().total_awaitables_;
            }
            else
            {
                fd_ = -1;
            }
        }

    private:
        EpollSingleThreadedExecutor& getExecutor() noexcept
        {
            // No lint b/c we know for sure that the executor is of `EpollSingleThreadedExecutor` type.
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-static-cast-downcast)
            return static_cast<EpollSingleThreadedExecutor&>(executor());
        }

        int           fd_;
        std::uint32_t events_;

    };  // AwaitableNode

    int         epollfd_;
    std::size_t total_awaitables_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace dtui

#endif  // DTUI_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
