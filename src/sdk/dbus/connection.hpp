//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_DBUS_CONNECTION_HPP_INCLUDED
#define DTUI_SDK_DBUS_CONNECTION_HPP_INCLUDED

#include "dtui/platform/posix_executor_extension.hpp"
#include "dtui/sdk/bus_client.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <dbus/dbus.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace dtui
{
namespace sdk
{
namespace dbus
{

struct MessageDeleter
{
    void operator()(DBusMessage* const message) const noexcept
    {
        dbus_message_unref(message);
    }
};
using MessagePtr = std::unique_ptr<DBusMessage, MessageDeleter>;

/// RAII holder of `DBusError`.
///
struct ScopedError final
{
    ScopedError()
    {
        dbus_error_init(&raw);
    }
    ~ScopedError()
    {
        dbus_error_free(&raw);
    }

    ScopedError(ScopedError&&)                 = delete;
    ScopedError(const ScopedError&)            = delete;
    ScopedError& operator=(ScopedError&&)      = delete;
    ScopedError& operator=(const ScopedError&) = delete;

    bool isSet() const noexcept
    {
        return dbus_error_is_set(&raw) != FALSE;
    }

    DBusError raw{};

};  // ScopedError

/// Private libdbus connection driven by a single-threaded executor.
///
/// libdbus watches become awaitable (readable) or repeating (writable) executor callbacks,
/// libdbus timeouts become repeating executor callbacks, and queued incoming messages are
/// dispatched from an executor callback. Nothing here blocks except `make`.
///
class Connection final
{
public:
    using Ptr = std::shared_ptr<Connection>;

    struct MakeResult
    {
        using Success = Ptr;
        using Failure = BusError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Opens (and registers on the bus) a new private connection.
    ///
    CETL_NODISCARD static MakeResult::Var make(libcyphal::IExecutor& executor, const BusAddress& address);

    Connection(libcyphal::IExecutor&              executor,
               platform::IPosixExecutorExtension& posix_executor_ext,
               DBusConnection*                    raw_connection);

    Connection(Connection&&)                 = delete;
    Connection(const Connection&)            = delete;
    Connection& operator=(Connection&&)      = delete;
    Connection& operator=(const Connection&) = delete;

    ~Connection();

    libcyphal::IExecutor& executor() const noexcept
    {
        return executor_;
    }

    std::string uniqueName() const;

    bool isConnected() const noexcept;

    /// Outcome of a method call on the wire: either a reply (which might be an error reply),
    /// or a local failure to send.
    ///
    using Reply        = cetl::variant<MessagePtr, BusError>;
    using ReplyHandler = std::function<void(Reply&&)>;

    /// Pending method call; destroying it cancels the call, and its handler is never called.
    ///
    class PendingReply
    {
    public:
        using Ptr = std::unique_ptr<PendingReply>;

        PendingReply(PendingReply&&)                 = delete;
        PendingReply(const PendingReply&)            = delete;
        PendingReply& operator=(PendingReply&&)      = delete;
        PendingReply& operator=(const PendingReply&) = delete;

        virtual ~PendingReply() = default;

    protected:
        PendingReply() = default;

    };  // PendingReply

    /// Sends a method call, and calls the handler (later, from the executor) with the reply.
    ///
    /// A null message, or a failure to send, is reported to the handler as a `Transport` error.
    ///
    CETL_NODISCARD PendingReply::Ptr sendWithReply(MessagePtr message, ReplyHandler handler);

    /// Reports the given failure to the handler (later, from the executor).
    ///
    CETL_NODISCARD PendingReply::Ptr failLater(BusError error, ReplyHandler handler);

    /// Sends a message which expects no reply.
    ///
    bool sendNoReply(MessagePtr message);

    using SignalHandler   = std::function<void(DBusMessage& signal)>;
    using SignalHandlerId = std::uint64_t;

    /// Adds a handler of every incoming signal message.
    ///
    SignalHandlerId addSignalHandler(SignalHandler handler);
    void            removeSignalHandler(const SignalHandlerId handler_id);

    /// Converts an error reply to `BusError`.
    ///
    BusError toBusError(DBusMessage& error_reply) const;

private:
    class WatchEntry;
    class TimeoutEntry;
    class PendingReplyImpl;
    class FailedReplyImpl;

    bool setupMainLoop();
    void scheduleDispatch();
    void dispatch();

    static dbus_bool_t addWatch(DBusWatch* watch, void* data);
    static void        removeWatch(DBusWatch* watch, void* data);
    static void        toggleWatch(DBusWatch* watch, void* data);
    static dbus_bool_t addTimeout(DBusTimeout* timeout, void* data);
    static void        removeTimeout(DBusTimeout* timeout, void* data);
    static void        toggleTimeout(DBusTimeout* timeout, void* data);
    static void        onDispatchStatus(DBusConnection* connection, DBusDispatchStatus status, void* data);

    static DBusHandlerResult filterMessage(DBusConnection* connection, DBusMessage* message, void* data);

    // MARK: Data members:

    libcyphal::IExecutor&                                 executor_;
    platform::IPosixExecutorExtension&                    posix_executor_ext_;
    DBusConnection*                                       raw_connection_;
    common::LoggerPtr                                     logger_;
    libcyphal::IExecutor::Callback::Any                   dispatch_callback_;
    std::map<DBusWatch*, std::unique_ptr<WatchEntry>>     watches_;
    std::map<DBusTimeout*, std::unique_ptr<TimeoutEntry>> timeouts_;
    std::map<SignalHandlerId, SignalHandler>              signal_handlers_;
    SignalHandlerId                                       next_signal_handler_id_;

};  // Connection

}  // namespace dbus
}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_DBUS_CONNECTION_HPP_INCLUDED
