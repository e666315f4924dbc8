//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "connection.hpp"

#include "common_helpers.hpp"
#include "dtui/platform/posix_executor_extension.hpp"
#include "dtui/sdk/bus_client.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <dbus/dbus.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace dbus
{
namespace
{

/// libdbus can't tell writability of its socket through a separate epoll registration
/// (the socket is already registered for reading), so enabled writable watches are polled.
///
constexpr std::chrono::milliseconds WritablePollPeriod{10};

BusError makeBusError(const BusError::Kind kind, const ScopedError& error, std::string fallback_message)
{
    return BusError{kind,
                    (error.raw.name != nullptr) ? error.raw.name : "",
                    (error.raw.message != nullptr) ? error.raw.message : std::move(fallback_message)};
}

}  // namespace

class Connection::WatchEntry final
{
public:
    WatchEntry(Connection& connection, DBusWatch* const watch)
        : connection_{connection}
        , watch_{watch}
    {
    }

    void update()
    {
        callback_.reset();
        if (dbus_watch_get_enabled(watch_) == FALSE)
        {
            return;
        }

        const int      fd    = dbus_watch_get_unix_fd(watch_);
        const unsigned flags = dbus_watch_get_flags(watch_);
        if ((flags & DBUS_WATCH_READABLE) != 0U)
        {
            callback_ = connection_.posix_executor_ext_.registerAwaitableCallback(  //
                [this](const auto&) {
                    //
                    handle(DBUS_WATCH_READABLE);
                },
                platform::IPosixExecutorExtension::Trigger::Readable{fd});
        }
        else if ((flags & DBUS_WATCH_WRITABLE) != 0U)
        {
            callback_ = connection_.executor_.registerCallback([this](const auto&) {
                //
                handle(DBUS_WATCH_WRITABLE);
            });
            callback_.schedule(
                libcyphal::IExecutor::Callback::Schedule::Repeat{connection_.executor_.now(), WritablePollPeriod});
        }
    }

private:
    void handle(const unsigned flags)
    {
        // Handling might remove (and so destroy) this very entry.
        auto& connection = connection_;
        if (dbus_watch_handle(watch_, flags) == FALSE)
        {
            connection.logger_->warn("Connection: not enough memory to handle watch (flags={}).", flags);
        }
        connection.scheduleDispatch();
    }

    Connection&                         connection_;
    DBusWatch*                          watch_;
    libcyphal::IExecutor::Callback::Any callback_;

};  // WatchEntry

class Connection::TimeoutEntry final
{
public:
    TimeoutEntry(Connection& connection, DBusTimeout* const timeout)
        : connection_{connection}
        , timeout_{timeout}
    {
    }

    void update()
    {
        callback_.reset();
        if (dbus_timeout_get_enabled(timeout_) == FALSE)
        {
            return;
        }

        const auto interval = std::chrono::milliseconds{dbus_timeout_get_interval(timeout_)};

        callback_ = connection_.executor_.registerCallback([this](const auto&) {
            //
            auto& connection = connection_;
            if (dbus_timeout_handle(timeout_) == FALSE)
            {
                connection.logger_->warn("Connection: not enough memory to handle timeout.");
            }
            connection.scheduleDispatch();
        });
        callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Repeat{connection_.executor_.now() + interval, interval});
    }

private:
    Connection&                         connection_;
    DBusTimeout*                        timeout_;
    libcyphal::IExecutor::Callback::Any callback_;

};  // TimeoutEntry

class Connection::PendingReplyImpl final : public PendingReply
{
public:
    PendingReplyImpl(DBusPendingCall* const pending, ReplyHandler&& handler)
        : pending_{pending}
        , handler_{std::move(handler)}
    {
    }

    PendingReplyImpl(PendingReplyImpl&&)                 = delete;
    PendingReplyImpl(const PendingReplyImpl&)            = delete;
    PendingReplyImpl& operator=(PendingReplyImpl&&)      = delete;
    PendingReplyImpl& operator=(const PendingReplyImpl&) = delete;

    ~PendingReplyImpl() override
    {
        dbus_pending_call_cancel(pending_);
        dbus_pending_call_unref(pending_);
    }

    bool arm()
    {
        return dbus_pending_call_set_notify(pending_, &PendingReplyImpl::onNotify, this, nullptr) != FALSE;
    }

    ReplyHandler takeHandler()
    {
        return std::move(handler_);
    }

private:
    static void onNotify(DBusPendingCall* const pending, void* const data)
    {
        auto* const self = static_cast<PendingReplyImpl*>(data);

        MessagePtr reply{dbus_pending_call_steal_reply(pending)};

        // The handler might destroy this pending reply.
        auto handler = std::move(self->handler_);
        if (!handler)
        {
            return;
        }
        common::performWithoutThrowing([&handler, &reply] {
            //
            if (reply)
            {
                handler(Reply{std::move(reply)});
                return;
            }
            handler(Reply{BusError{BusError::Kind::Transport, "", "no reply message"}});
        });
    }

    DBusPendingCall* pending_;
    ReplyHandler     handler_;

};  // PendingReplyImpl

/// Reports a local failure to the handler from an executor callback.
///
class Connection::FailedReplyImpl final : public PendingReply
{
public:
    FailedReplyImpl(libcyphal::IExecutor& executor, BusError&& error, ReplyHandler&& handler)
        : error_{std::move(error)}
        , handler_{std::move(handler)}
    {
        callback_ = executor.registerCallback([this](const auto&) {
            //
            auto handler = std::move(handler_);
            if (handler)
            {
                common::performWithoutThrowing([this, &handler] {
                    //
                    handler(Reply{std::move(error_)});
                });
            }
        });
        callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{executor.now()});
    }

    FailedReplyImpl(FailedReplyImpl&&)                 = delete;
    FailedReplyImpl(const FailedReplyImpl&)            = delete;
    FailedReplyImpl& operator=(FailedReplyImpl&&)      = delete;
    FailedReplyImpl& operator=(const FailedReplyImpl&) = delete;

    ~FailedReplyImpl() override = default;

private:
    BusError                            error_;
    ReplyHandler                        handler_;
    libcyphal::IExecutor::Callback::Any callback_;

};  // FailedReplyImpl

Connection::MakeResult::Var Connection::make(libcyphal::IExecutor& executor, const BusAddress& address)
{
    auto logger = common::getLogger("bus");

    auto* const posix_executor_ext = cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor);
    if (posix_executor_ext == nullptr)
    {
        return BusError{BusError::Kind::Transport, "", "executor doesn't support awaiting of file descriptors"};
    }

    ScopedError     error;
    DBusConnection* raw_connection = nullptr;
    switch (address.kind)
    {
    case BusAddress::Kind::System:
        logger->debug("Connection::make() - connecting to the system bus...");
        raw_connection = dbus_bus_get_private(DBUS_BUS_SYSTEM, &error.raw);
        break;
    case BusAddress::Kind::Session:
        logger->debug("Connection::make() - connecting to the session bus...");
        raw_connection = dbus_bus_get_private(DBUS_BUS_SESSION, &error.raw);
        break;
    case BusAddress::Kind::Custom:
        logger->debug("Connection::make() - connecting to '{}'...", address.address);
        raw_connection = dbus_connection_open_private(address.address.c_str(), &error.raw);
        if ((raw_connection != nullptr) && (dbus_bus_register(raw_connection, &error.raw) == FALSE))
        {
            dbus_connection_close(raw_connection);
            dbus_connection_unref(raw_connection);
            raw_connection = nullptr;
        }
        break;
    }
    if (raw_connection == nullptr)
    {
        auto bus_error = makeBusError(BusError::Kind::Transport, error, "can't connect to the bus");
        logger->error("Failed to connect to the bus: {}.", bus_error.message);
        return bus_error;
    }

    // A lost bus connection must not terminate the whole process.
    dbus_connection_set_exit_on_disconnect(raw_connection, FALSE);

    auto connection = std::make_shared<Connection>(executor, *posix_executor_ext, raw_connection);
    if (!connection->setupMainLoop())
    {
        return BusError{BusError::Kind::Transport, "", "not enough memory to set up the bus connection"};
    }

    logger->info("Connected to the bus as '{}'.", connection->uniqueName());
    return connection;
}

Connection::Connection(libcyphal::IExecutor&              executor,
                       platform::IPosixExecutorExtension& posix_executor_ext,
                       DBusConnection* const              raw_connection)
    : executor_{executor}
    , posix_executor_ext_{posix_executor_ext}
    , raw_connection_{raw_connection}
    , logger_{common::getLogger("bus")}
    , next_signal_handler_id_{0}
{
    CETL_DEBUG_ASSERT(raw_connection_ != nullptr, "");
}

Connection::~Connection()
{
    logger_->trace("Connection::~Connection().");

    dispatch_callback_.reset();

    dbus_connection_remove_filter(raw_connection_, &Connection::filterMessage, this);
    dbus_connection_set_dispatch_status_function(raw_connection_, nullptr, nullptr, nullptr);
    dbus_connection_close(raw_connection_);

    // Resetting of the functions removes all remaining watches and timeouts.
    dbus_connection_set_watch_functions(raw_connection_, nullptr, nullptr, nullptr, nullptr, nullptr);
    dbus_connection_set_timeout_functions(raw_connection_, nullptr, nullptr, nullptr, nullptr, nullptr);
    dbus_connection_unref(raw_connection_);

    watches_.clear();
    timeouts_.clear();
}

std::string Connection::uniqueName() const
{
    const char* const name = dbus_bus_get_unique_name(raw_connection_);
    return (name != nullptr) ? name : "";
}

bool Connection::isConnected() const noexcept
{
    return dbus_connection_get_is_connected(raw_connection_) != FALSE;
}

bool Connection::setupMainLoop()
{
    dispatch_callback_ = executor_.registerCallback([this](const auto&) {
        //
        dispatch();
    });

    if ((dbus_connection_set_watch_functions(raw_connection_,
                                             &Connection::addWatch,
                                             &Connection::removeWatch,
                                             &Connection::toggleWatch,
                                             this,
                                             nullptr) == FALSE) ||
        (dbus_connection_set_timeout_functions(raw_connection_,
                                               &Connection::addTimeout,
                                               &Connection::removeTimeout,
                                               &Connection::toggleTimeout,
                                               this,
                                               nullptr) == FALSE) ||
        (dbus_connection_add_filter(raw_connection_, &Connection::filterMessage, this, nullptr) == FALSE))
    {
        logger_->error("Connection: failed to install main loop functions.");
        return false;
    }
    dbus_connection_set_dispatch_status_function(raw_connection_, &Connection::onDispatchStatus, this, nullptr);

    // Messages might be queued already (f.e. during bus registration).
    scheduleDispatch();
    return true;
}

void Connection::scheduleDispatch()
{
    dispatch_callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{executor_.now()});
}

void Connection::dispatch()
{
    while (dbus_connection_dispatch(raw_connection_) == DBUS_DISPATCH_DATA_REMAINS)
    {
        // Keep dispatching.
    }
}

Connection::PendingReply::Ptr Connection::sendWithReply(MessagePtr message, ReplyHandler handler)
{
    if (!message)
    {
        return std::make_unique<FailedReplyImpl>(executor_,
                                                 BusError{BusError::Kind::Transport, "", "can't build the message"},
                                                 std::move(handler));
    }

    DBusPendingCall* pending = nullptr;
    if ((dbus_connection_send_with_reply(raw_connection_, message.get(), &pending, DBUS_TIMEOUT_INFINITE) == FALSE) ||
        (pending == nullptr))
    {
        const auto kind = isConnected() ? BusError::Kind::Transport : BusError::Kind::Disconnected;
        const char* const member = dbus_message_get_member(message.get());
        logger_->warn("Connection: failed to send '{}' message.", (member != nullptr) ? member : "");
        return std::make_unique<FailedReplyImpl>(executor_,
                                                 BusError{kind, "", "can't send the message"},
                                                 std::move(handler));
    }

    auto pending_reply = std::make_unique<PendingReplyImpl>(pending, std::move(handler));
    if (!pending_reply->arm())
    {
        return std::make_unique<FailedReplyImpl>(executor_,
                                                 BusError{BusError::Kind::Transport, "", "not enough memory"},
                                                 pending_reply->takeHandler());
    }
    return pending_reply;
}

Connection::PendingReply::Ptr Connection::failLater(BusError error, ReplyHandler handler)
{
    return std::make_unique<FailedReplyImpl>(executor_, std::move(error), std::move(handler));
}

bool Connection::sendNoReply(MessagePtr message)
{
    if (!message)
    {
        return false;
    }
    dbus_message_set_no_reply(message.get(), TRUE);
    return dbus_connection_send(raw_connection_, message.get(), nullptr) != FALSE;
}

Connection::SignalHandlerId Connection::addSignalHandler(SignalHandler handler)
{
    const auto handler_id = next_signal_handler_id_++;
    signal_handlers_.emplace(handler_id, std::move(handler));
    return handler_id;
}

void Connection::removeSignalHandler(const SignalHandlerId handler_id)
{
    signal_handlers_.erase(handler_id);
}

BusError Connection::toBusError(DBusMessage& error_reply) const
{
    const char* const name = dbus_message_get_error_name(&error_reply);

    const char* text = nullptr;
    if (dbus_message_get_args(&error_reply, nullptr, DBUS_TYPE_STRING, &text, DBUS_TYPE_INVALID) == FALSE)
    {
        text = nullptr;
    }

    const auto kind = isConnected() ? BusError::Kind::Remote : BusError::Kind::Disconnected;
    return BusError{kind, (name != nullptr) ? name : "", (text != nullptr) ? text : ""};
}

dbus_bool_t Connection::addWatch(DBusWatch* const watch, void* const data)
{
    auto* const self = static_cast<Connection*>(data);
    return common::performWithoutThrowing([self, watch] {
               //
               auto& entry = self->watches_[watch];
               entry       = std::make_unique<WatchEntry>(*self, watch);
               entry->update();
           })
               ? TRUE
               : FALSE;
}

void Connection::removeWatch(DBusWatch* const watch, void* const data)
{
    auto* const self = static_cast<Connection*>(data);
    self->watches_.erase(watch);
}

void Connection::toggleWatch(DBusWatch* const watch, void* const data)
{
    auto* const self = static_cast<Connection*>(data);

    const auto it = self->watches_.find(watch);
    if (it != self->watches_.end())
    {
        common::performWithoutThrowing([&it] {
            //
            it->second->update();
        });
    }
}

dbus_bool_t Connection::addTimeout(DBusTimeout* const timeout, void* const data)
{
    auto* const self = static_cast<Connection*>(data);
    return common::performWithoutThrowing([self, timeout] {
               //
               auto& entry = self->timeouts_[timeout];
               entry       = std::make_unique<TimeoutEntry>(*self, timeout);
               entry->update();
           })
               ? TRUE
               : FALSE;
}

void Connection::removeTimeout(DBusTimeout* const timeout, void* const data)
{
    auto* const self = static_cast<Connection*>(data);
    self->timeouts_.erase(timeout);
}

void Connection::toggleTimeout(DBusTimeout* const timeout, void* const data)
{
    auto* const self = static_cast<Connection*>(data);

    const auto it = self->timeouts_.find(timeout);
    if (it != self->timeouts_.end())
    {
        common::performWithoutThrowing([&it] {
            //
            it->second->update();
        });
    }
}

void Connection::onDispatchStatus(DBusConnection* const, const DBusDispatchStatus status, void* const data)
{
    // Dispatching is not allowed from within this function, so it's deferred.
    if (status == DBUS_DISPATCH_DATA_REMAINS)
    {
        static_cast<Connection*>(data)->scheduleDispatch();
    }
}

DBusHandlerResult Connection::filterMessage(DBusConnection* const, DBusMessage* const message, void* const data)
{
    auto* const self = static_cast<Connection*>(data);
    if (dbus_message_get_type(message) != DBUS_MESSAGE_TYPE_SIGNAL)
    {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    if (dbus_message_is_signal(message, DBUS_INTERFACE_LOCAL, "Disconnected") != FALSE)
    {
        self->logger_->warn("Connection: disconnected from the bus.");
    }

    // Handlers might be added or removed while handling.
    std::vector<SignalHandler> handlers;
    common::performWithoutThrowing([self, &handlers] {
        //
        handlers.reserve(self->signal_handlers_.size());
        for (const auto& id_and_handler : self->signal_handlers_)
        {
            handlers.push_back(id_and_handler.second);
        }
    });
    for (const auto& handler : handlers)
    {
        common::performWithoutThrowing([&handler, message] {
            //
            handler(*message);
        });
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

}  // namespace dbus
}  // namespace sdk
}  // namespace dtui
