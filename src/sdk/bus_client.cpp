//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <dtui/sdk/bus_client.hpp>

#include "dbus/connection.hpp"
#include "dbus/message_codec.hpp"
#include "logging.hpp"

#include <dtui/sdk/execution.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <dbus/dbus.h>
#include <spdlog/fmt/fmt.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace
{

using dbus::Connection;
using dbus::MessagePtr;

constexpr const char* BusService       = DBUS_SERVICE_DBUS;
constexpr const char* BusPath          = DBUS_PATH_DBUS;
constexpr const char* BusInterface     = DBUS_INTERFACE_DBUS;
constexpr const char* PropsInterface   = DBUS_INTERFACE_PROPERTIES;
constexpr const char* IntrospInterface = DBUS_INTERFACE_INTROSPECTABLE;

BusError invalidArgument(std::string message)
{
    return BusError{BusError::Kind::Transport, DBUS_ERROR_INVALID_ARGS, std::move(message)};
}

using BuildResult = cetl::variant<MessagePtr, BusError>;

/// Builds a method call message.
///
/// libdbus treats invalid names as programming errors, so all of them are validated upfront.
///
BuildResult buildMethodCall(const MemberRef& method, const std::vector<Value>& args)
{
    if (dbus_validate_bus_name(method.service.c_str(), nullptr) == FALSE)
    {
        return invalidArgument(fmt::format("'{}' is not a valid bus name", method.service));
    }
    if (dbus_validate_path(method.path.c_str(), nullptr) == FALSE)
    {
        return invalidArgument(fmt::format("'{}' is not a valid object path", method.path));
    }
    if (dbus_validate_interface(method.interface.c_str(), nullptr) == FALSE)
    {
        return invalidArgument(fmt::format("'{}' is not a valid interface name", method.interface));
    }
    if (dbus_validate_member(method.member.c_str(), nullptr) == FALSE)
    {
        return invalidArgument(fmt::format("'{}' is not a valid member name", method.member));
    }

    MessagePtr message{dbus_message_new_method_call(method.service.c_str(),
                                                    method.path.c_str(),
                                                    method.interface.c_str(),
                                                    method.member.c_str())};
    if (!message)
    {
        return BusError{BusError::Kind::Transport, DBUS_ERROR_NO_MEMORY, "can't allocate a message"};
    }
    if (auto failure = dbus::appendValues(*message, args))
    {
        return invalidArgument(std::move(*failure));
    }
    return message;
}

/// Adapter of a method call round trip to a sender.
///
/// The reply body is converted to the result by the given function.
///
template <typename Result>
class MethodCallSender final : public SenderOf<Result>
{
public:
    using Convert = std::function<Result(std::vector<Value>&& body)>;

    MethodCallSender(cetl::string_view   op_name,
                     Connection::Ptr     connection,
                     BuildResult&&       request,
                     Convert             convert,
                     common::LoggerPtr   logger)
        : op_name_{op_name}
        , connection_{std::move(connection)}
        , request_{std::move(request)}
        , convert_{std::move(convert)}
        , logger_{std::move(logger)}
    {
    }

    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        logger_->trace("Submitting `{}` operation.", op_name_);

        auto handler = [this, receiver = std::move(receiver)](Connection::Reply&& reply) mutable {
            //
            logger_->trace("Received result of `{}` operation.", op_name_);
            receiver(toResult(std::move(reply)));
        };

        if (auto* const build_failure = cetl::get_if<BusError>(&request_))
        {
            pending_ = connection_->failLater(std::move(*build_failure), std::move(handler));
            return;
        }
        pending_ = connection_->sendWithReply(cetl::get<MessagePtr>(std::move(request_)), std::move(handler));
    }

private:
    Result toResult(Connection::Reply&& reply)
    {
        if (auto* const failure = cetl::get_if<BusError>(&reply))
        {
            return std::move(*failure);
        }

        auto& message = *cetl::get<MessagePtr>(reply);
        if (dbus_message_get_type(&message) == DBUS_MESSAGE_TYPE_ERROR)
        {
            auto bus_error = connection_->toBusError(message);
            logger_->debug("`{}` operation failed: {} ({}).", op_name_, bus_error.message, bus_error.name);
            return bus_error;
        }

        auto body = dbus::decodeBody(message);
        if (auto* const failure = cetl::get_if<std::string>(&body))
        {
            logger_->warn("Failed to decode reply of `{}` operation: {}.", op_name_, *failure);
            return BusError{BusError::Kind::Transport, "", std::move(*failure)};
        }
        return convert_(cetl::get<std::vector<Value>>(std::move(body)));
    }

    cetl::string_view             op_name_;
    Connection::Ptr               connection_;
    BuildResult                   request_;
    Convert                       convert_;
    common::LoggerPtr             logger_;
    Connection::PendingReply::Ptr pending_;

};  // MethodCallSender

BusError unexpectedReply(const char* const what)
{
    return BusError{BusError::Kind::Transport, "", fmt::format("unexpected reply: expected {}", what)};
}

const std::string* singleString(const std::vector<Value>& body)
{
    if (body.size() != 1)
    {
        return nullptr;
    }
    if (const auto* const str = body.front().getIf<Value::Str>())
    {
        return &str->value;
    }
    return nullptr;
}

/// Shared state of an established subscription; it outlives the subscription
/// while its signal handler copy is being executed.
///
struct SignalFilter final
{
    SignalMatch              match;
    std::string              sender;  ///< Unique name of the emitter; empty if not known.
    BusClient::SignalHandler handler;
    common::LoggerPtr        logger;
    bool                     is_active{true};

    bool matches(DBusMessage& message) const
    {
        if (!match.path.empty() && (dbus_message_has_path(&message, match.path.c_str()) == FALSE))
        {
            return false;
        }
        if (!match.interface.empty() && (dbus_message_has_interface(&message, match.interface.c_str()) == FALSE))
        {
            return false;
        }
        if (!match.member.empty() && (dbus_message_has_member(&message, match.member.c_str()) == FALSE))
        {
            return false;
        }
        return sender.empty() || (dbus_message_has_sender(&message, sender.c_str()) != FALSE);
    }

    void onSignal(DBusMessage& message)
    {
        if (!is_active || !matches(message))
        {
            return;
        }

        auto body = dbus::decodeBody(message);
        if (const auto* const failure = cetl::get_if<std::string>(&body))
        {
            logger->warn("Dropping signal which can't be decoded: {}.", *failure);
            return;
        }

        const auto orEmpty = [](const char* const str) { return (str != nullptr) ? std::string{str} : std::string{}; };
        handler(SignalEvent{orEmpty(dbus_message_get_sender(&message)),
                            orEmpty(dbus_message_get_path(&message)),
                            orEmpty(dbus_message_get_interface(&message)),
                            orEmpty(dbus_message_get_member(&message)),
                            cetl::get<std::vector<Value>>(std::move(body))});
    }

};  // SignalFilter

/// Asks the bus to drop the match rule of the filter; the reply is not awaited.
///
void removeMatch(Connection& connection, const SignalFilter& filter)
{
    const auto rule = filter.match.toRule();

    auto        args    = std::vector<Value>{Value::makeString(rule)};
    auto        msg     = buildMethodCall({BusService, BusPath, BusInterface, "RemoveMatch"}, args);
    auto* const message = cetl::get_if<MessagePtr>(&msg);
    if ((message == nullptr) || !connection.sendNoReply(std::move(*message)))
    {
        filter.logger->warn("Failed to send `RemoveMatch` for '{}'.", rule);
    }
}

class SubscriptionImpl final : public BusClient::Subscription
{
public:
    SubscriptionImpl(Connection::Ptr connection, std::shared_ptr<SignalFilter> filter)
        : connection_{std::move(connection)}
        , filter_{std::move(filter)}
        , handler_id_{connection_->addSignalHandler([filter = filter_](DBusMessage& message) {
            //
            filter->onSignal(message);
        })}
    {
        filter_->logger->debug("Subscribed to signals ('{}').", filter_->match.toRule());
    }

    SubscriptionImpl(SubscriptionImpl&&)                 = delete;
    SubscriptionImpl(const SubscriptionImpl&)            = delete;
    SubscriptionImpl& operator=(SubscriptionImpl&&)      = delete;
    SubscriptionImpl& operator=(const SubscriptionImpl&) = delete;

    ~SubscriptionImpl() override
    {
        filter_->is_active = false;
        connection_->removeSignalHandler(handler_id_);

        filter_->logger->debug("Unsubscribing from signals ('{}').", filter_->match.toRule());
        removeMatch(*connection_, *filter_);
    }

private:
    Connection::Ptr                 connection_;
    std::shared_ptr<SignalFilter>   filter_;
    Connection::SignalHandlerId     handler_id_;

};  // SubscriptionImpl

/// Establishes a signal subscription.
///
/// If the match names a well-known service, its current owner is resolved first
/// because signals carry unique names of their senders. Then the match rule is added.
///
class SubscribeSender final : public SenderOf<BusClient::Subscribe::Result>
{
public:
    using Result = BusClient::Subscribe::Result;

    SubscribeSender(Connection::Ptr connection, std::shared_ptr<SignalFilter> filter)
        : connection_{std::move(connection)}
        , filter_{std::move(filter)}
        , is_match_requested_{false}
    {
    }

    SubscribeSender(SubscribeSender&&)                 = delete;
    SubscribeSender(const SubscribeSender&)            = delete;
    SubscribeSender& operator=(SubscribeSender&&)      = delete;
    SubscribeSender& operator=(const SubscribeSender&) = delete;

    ~SubscribeSender() override
    {
        // The bus might add the rule even though nobody waits for its `AddMatch` reply anymore.
        pending_.reset();
        if (is_match_requested_)
        {
            filter_->logger->debug("Subscription to '{}' is abandoned.", filter_->match.toRule());
            removeMatch(*connection_, *filter_);
        }
    }

    void submitImpl(std::function<void(Result&&)>&& receiver) override
    {
        receiver_ = std::move(receiver);

        const auto& service = filter_->match.service;
        if (service.empty() || (service.front() == ':'))
        {
            filter_->sender = service;
            addMatch();
            return;
        }

        filter_->logger->trace("Resolving owner of '{}'.", service);
        auto args = std::vector<Value>{Value::makeString(service)};
        pending_  = connection_->sendWithReply(  //
            asMessage(buildMethodCall({BusService, BusPath, BusInterface, "GetNameOwner"}, args)),
            [this](Connection::Reply&& reply) {
                //
                onNameOwner(std::move(reply));
            });
    }

private:
    MessagePtr asMessage(BuildResult&& build_result)
    {
        if (auto* const message = cetl::get_if<MessagePtr>(&build_result))
        {
            return std::move(*message);
        }
        filter_->logger->warn("Can't build bus message: {}.", cetl::get<BusError>(build_result).message);
        return nullptr;
    }

    void onNameOwner(Connection::Reply&& reply)
    {
        if (auto* const message_ptr = cetl::get_if<MessagePtr>(&reply))
        {
            const char* owner = nullptr;
            if ((dbus_message_get_type(message_ptr->get()) == DBUS_MESSAGE_TYPE_METHOD_RETURN) &&
                (dbus_message_get_args(message_ptr->get(), nullptr, DBUS_TYPE_STRING, &owner, DBUS_TYPE_INVALID) !=
                 FALSE))
            {
                filter_->sender = owner;
            }
        }
        if (filter_->sender.empty())
        {
            // Not running right now; signals are then filtered by the bus only.
            filter_->logger->debug("Owner of '{}' is unknown.", filter_->match.service);
        }
        addMatch();
    }

    void addMatch()
    {
        auto args    = std::vector<Value>{Value::makeString(filter_->match.toRule())};
        auto message = asMessage(buildMethodCall({BusService, BusPath, BusInterface, "AddMatch"}, args));

        is_match_requested_ = (message != nullptr);
        pending_            = connection_->sendWithReply(std::move(message), [this](Connection::Reply&& reply) {
            //
            onAddMatch(std::move(reply));
        });
    }

    void onAddMatch(Connection::Reply&& reply)
    {
        // From now on the rule is either owned by a subscription, or was never added.
        is_match_requested_ = false;

        auto receiver = std::move(receiver_);
        if (auto* const failure = cetl::get_if<BusError>(&reply))
        {
            receiver(std::move(*failure));
            return;
        }

        auto& message = *cetl::get<MessagePtr>(reply);
        if (dbus_message_get_type(&message) == DBUS_MESSAGE_TYPE_ERROR)
        {
            receiver(connection_->toBusError(message));
            return;
        }
        receiver(std::make_unique<SubscriptionImpl>(connection_, filter_));
    }

    Connection::Ptr                       connection_;
    std::shared_ptr<SignalFilter>         filter_;
    std::function<void(Result&&)>         receiver_;
    Connection::PendingReply::Ptr         pending_;
    bool                                  is_match_requested_;

};  // SubscribeSender

class BusClientImpl final : public BusClient
{
public:
    explicit BusClientImpl(Connection::Ptr connection)
        : connection_{std::move(connection)}
        , logger_{common::getLogger("bus")}
    {
    }

    // MARK: - BusClient

    std::string uniqueName() const override
    {
        return connection_->uniqueName();
    }

    SenderOf<ListNames::Result>::Ptr listNames() override
    {
        logger_->trace("BusClient::listNames().");

        return makeSender<ListNames::Result>(  //
            "ListNames",
            buildMethodCall({BusService, BusPath, BusInterface, "ListNames"}, {}),
            [](std::vector<Value>&& body) -> ListNames::Result {
                //
                const Value::Array* array = (body.size() == 1) ? body.front().getIf<Value::Array>() : nullptr;
                if (array == nullptr)
                {
                    return unexpectedReply("'as'");
                }
                ListNames::Success names;
                for (const auto& item : array->items)
                {
                    if (const auto* const name = item.getIf<Value::Str>())
                    {
                        names.push_back(name->value);
                    }
                }
                return names;
            });
    }

    SenderOf<Introspect::Result>::Ptr introspect(const std::string& service, const std::string& path) override
    {
        logger_->trace("BusClient::introspect(service='{}', path='{}').", service, path);

        return makeSender<Introspect::Result>(  //
            "Introspect",
            buildMethodCall({service, path, IntrospInterface, "Introspect"}, {}),
            [](std::vector<Value>&& body) -> Introspect::Result {
                //
                if (const auto* const xml = singleString(body))
                {
                    return *xml;
                }
                return unexpectedReply("'s'");
            });
    }

    SenderOf<Call::Result>::Ptr callMethod(const MemberRef& method, std::vector<Value> args) override
    {
        logger_->trace("BusClient::callMethod('{}' {} {}.{}).",
                       method.service,
                       method.path,
                       method.interface,
                       method.member);

        return makeSender<Call::Result>(  //
            "Call",
            buildMethodCall(method, args),
            [](std::vector<Value>&& body) -> Call::Result {
                //
                return std::move(body);
            });
    }

    SenderOf<GetProperty::Result>::Ptr getProperty(const MemberRef& property) override
    {
        logger_->trace("BusClient::getProperty('{}' {} {}.{}).",
                       property.service,
                       property.path,
                       property.interface,
                       property.member);

        const auto args = std::vector<Value>{Value::makeString(property.interface), Value::makeString(property.member)};
        return makeSender<GetProperty::Result>(  //
            "Get",
            buildMethodCall({property.service, property.path, PropsInterface, "Get"}, args),
            [](std::vector<Value>&& body) -> GetProperty::Result {
                //
                const Value::Variant* variant = (body.size() == 1) ? body.front().getIf<Value::Variant>() : nullptr;
                if (variant == nullptr)
                {
                    return unexpectedReply("'v'");
                }
                return *variant->inner;
            });
    }

    SenderOf<SetProperty::Result>::Ptr setProperty(const MemberRef& property, Value value) override
    {
        logger_->trace("BusClient::setProperty('{}' {} {}.{}).",
                       property.service,
                       property.path,
                       property.interface,
                       property.member);

        const auto args = std::vector<Value>{Value::makeString(property.interface),
                                             Value::makeString(property.member),
                                             Value::makeVariant(std::move(value))};
        return makeSender<SetProperty::Result>(  //
            "Set",
            buildMethodCall({property.service, property.path, PropsInterface, "Set"}, args),
            [](std::vector<Value>&&) -> SetProperty::Result {
                //
                return Done{};
            });
    }

    SenderOf<GetAllProperties::Result>::Ptr getAllProperties(const std::string& service,
                                                             const std::string& path,
                                                             const std::string& interface) override
    {
        logger_->trace("BusClient::getAllProperties('{}' {} {}).", service, path, interface);

        const auto args = std::vector<Value>{Value::makeString(interface)};
        return makeSender<GetAllProperties::Result>(  //
            "GetAll",
            buildMethodCall({service, path, PropsInterface, "GetAll"}, args),
            [](std::vector<Value>&& body) -> GetAllProperties::Result {
                //
                const Value::Dict* dict = (body.size() == 1) ? body.front().getIf<Value::Dict>() : nullptr;
                if (dict == nullptr)
                {
                    return unexpectedReply("'a{sv}'");
                }
                GetAllProperties::Success properties;
                for (const auto& entry : dict->entries)
                {
                    const auto* const name    = entry.first.getIf<Value::Str>();
                    const auto* const variant = entry.second.getIf<Value::Variant>();
                    if ((name == nullptr) || (variant == nullptr))
                    {
                        return unexpectedReply("'a{sv}'");
                    }
                    properties.emplace_back(name->value, *variant->inner);
                }
                return properties;
            });
    }

    SenderOf<Subscribe::Result>::Ptr subscribeSignal(const SignalMatch& match, SignalHandler handler) override
    {
        logger_->trace("BusClient::subscribeSignal('{}').", match.toRule());

        auto filter     = std::make_shared<SignalFilter>();
        filter->match   = match;
        filter->handler = std::move(handler);
        filter->logger  = logger_;
        return std::make_unique<SubscribeSender>(connection_, std::move(filter));
    }

private:
    template <typename Result, typename Convert>
    typename SenderOf<Result>::Ptr makeSender(cetl::string_view op_name, BuildResult&& request, Convert&& convert)
    {
        return std::make_unique<MethodCallSender<Result>>(op_name,
                                                          connection_,
                                                          std::move(request),
                                                          std::forward<Convert>(convert),
                                                          logger_);
    }

    Connection::Ptr   connection_;
    common::LoggerPtr logger_;

};  // BusClientImpl

}  // namespace

std::string SignalMatch::toRule() const
{
    std::string rule{"type='signal'"};
    const auto  append = [&rule](const char* const key, const std::string& value) {
        //
        if (!value.empty())
        {
            rule += fmt::format(",{}='{}'", key, value);
        }
    };
    append("sender", service);
    append("path", path);
    append("interface", interface);
    append("member", member);
    return rule;
}

BusClient::MakeResult::Var BusClient::make(libcyphal::IExecutor& executor, const BusAddress& address)
{
    auto maybe_connection = Connection::make(executor, address);
    if (auto* const failure = cetl::get_if<Connection::MakeResult::Failure>(&maybe_connection))
    {
        return std::move(*failure);
    }
    return std::make_shared<BusClientImpl>(cetl::get<Connection::MakeResult::Success>(std::move(maybe_connection)));
}

}  // namespace sdk
}  // namespace dtui
