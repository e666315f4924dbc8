//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define DTUI_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace dtui
{
namespace platform
{

/// Executor extension which allows to await readiness of POSIX file descriptors.
///
/// Obtained from a `libcyphal::IExecutor` with `cetl::rtti_cast`. Bus connection sockets
/// and the console input are both driven through it.
///
class IPosixExecutorExtension
{
    // 5B0C5E0A-6C2F-4C43-9C1E-2F6D0B8A74D1
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x5B, 0x0C, 0x5E, 0x0A, 0x6C, 0x2F, 0x4C, 0x43, 0x9C, 0x1E, 0x2F, 0x6D, 0x0B, 0x8A, 0x74, 0xD1>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    /// Registers a callback which is scheduled every time the trigger condition is met.
    ///
    /// The same file descriptor must not be registered twice. Resetting the returned
    /// callback handle stops awaiting of the descriptor.
    ///
    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace dtui

#endif  // DTUI_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
