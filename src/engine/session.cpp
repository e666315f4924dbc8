//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session.hpp"

#include "dbus/introspection_parser.hpp"
#include "engine_types.hpp"
#include "logging.hpp"
#include "orchestrator/call_orchestrator.hpp"
#include "results_channel.hpp"
#include "topology/topology_tree.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/introspection.hpp>
#include <dtui/sdk/signature.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace engine
{

Session::Session(libcyphal::IExecutor& executor, sdk::BusClient::Ptr bus_client, const Options& options)
    : logger_{common::getLogger("engine")}
    , options_{options}
    , orchestrator_{executor, std::move(bus_client), channel_, options.calls}
{
    logger_->debug("Session (filter='{}', unique_names={}, timeout={}ms, max_in_flight={}).",
                   options_.filter,
                   options_.show_unique_names,
                   std::chrono::duration_cast<std::chrono::milliseconds>(options_.calls.timeout).count(),
                   options_.calls.max_in_flight_per_service);
}

const sdk::InterfaceDescriptor* Session::findInterface(const std::string& service,
                                                       const std::string& path,
                                                       const std::string& interface) const
{
    const auto* const node = tree_.findNode(service, path);
    if ((node == nullptr) || (node->state != FetchState::Populated))
    {
        return nullptr;
    }
    return node->findInterface(interface);
}

const sdk::MethodDescriptor* Session::findMethod(const sdk::MemberRef& method) const
{
    const auto* const interface = findInterface(method.service, method.path, method.interface);
    return (interface != nullptr) ? interface->findMethod(method.member) : nullptr;
}

const sdk::PropertyDescriptor* Session::findProperty(const sdk::MemberRef& property) const
{
    const auto* const interface = findInterface(property.service, property.path, property.interface);
    return (interface != nullptr) ? interface->findProperty(property.member) : nullptr;
}

RequestId Session::refreshServices()
{
    const auto request_id = orchestrator_.listNames();
    pending_.emplace(request_id, Listing{});
    return request_id;
}

bool Session::expand(const std::string& service, const std::string& path)
{
    const auto* const node = tree_.findNode(service, path);
    if ((node == nullptr) || (node->state != FetchState::Unfetched))
    {
        return false;
    }
    return startFetch(service, path);
}

bool Session::refresh(const std::string& service, const std::string& path)
{
    return startFetch(service, path);
}

bool Session::cancelFetch(const std::string& service, const std::string& path)
{
    const auto pending_it = std::find_if(pending_.cbegin(), pending_.cend(), [&service, &path](const auto& id_pending) {
        //
        const auto* const fetch = cetl::get_if<Fetch>(&id_pending.second);
        return (fetch != nullptr) && (fetch->service == service) && (fetch->path == path);
    });
    if (pending_it == pending_.cend())
    {
        return false;
    }
    return cancel(pending_it->first);
}

bool Session::startFetch(const std::string& service, const std::string& path)
{
    if (!tree_.beginFetch(service, path))
    {
        return false;
    }
    const auto request_id = orchestrator_.introspect(service, path);
    pending_.emplace(request_id, Fetch{service, path});
    return true;
}

Session::Submit::Var Session::submitCall(const CallRequest& request)
{
    const auto* const method = findMethod({request.service, request.path, request.interface, request.member});
    if (method == nullptr)
    {
        return reject(Rejection::Kind::UnknownMember,
                      fmt::format("unknown method '{}.{}' at '{}' of '{}'",
                                  request.interface,
                                  request.member,
                                  request.path,
                                  request.service));
    }

    const auto in_signatures = method->inSignatures();
    if (request.args.size() != in_signatures.size())
    {
        return reject(Rejection::Kind::ArityMismatch,
                      fmt::format("'{}' takes {} argument(s), {} given",
                                  method->label(),
                                  in_signatures.size(),
                                  request.args.size()));
    }
    for (std::size_t i = 0; i < in_signatures.size(); ++i)
    {
        if (!sdk::conforms(request.args[i], in_signatures[i]))
        {
            return reject(Rejection::Kind::TypeMismatch,
                          fmt::format("argument #{} of '{}' has to be of type '{}', not '{}'",
                                      i + 1,
                                      method->label(),
                                      in_signatures[i].render(),
                                      request.args[i].signature().render()));
        }
    }

    return track(orchestrator_.call(request));
}

Session::Submit::Var Session::getProperty(const sdk::MemberRef& property)
{
    const auto* const descriptor = findProperty(property);
    if (descriptor == nullptr)
    {
        return reject(Rejection::Kind::UnknownMember,
                      fmt::format("unknown property '{}.{}' at '{}' of '{}'",
                                  property.interface,
                                  property.member,
                                  property.path,
                                  property.service));
    }
    if (!descriptor->isReadable())
    {
        return reject(Rejection::Kind::NotReadable, fmt::format("property '{}' is write-only", descriptor->name));
    }

    return track(orchestrator_.getProperty(property));
}

Session::Submit::Var Session::setProperty(const sdk::MemberRef& property, const sdk::Value& value)
{
    const auto* const descriptor = findProperty(property);
    if (descriptor == nullptr)
    {
        return reject(Rejection::Kind::UnknownMember,
                      fmt::format("unknown property '{}.{}' at '{}' of '{}'",
                                  property.interface,
                                  property.member,
                                  property.path,
                                  property.service));
    }
    if (!descriptor->isWritable())
    {
        return reject(Rejection::Kind::NotWritable, fmt::format("property '{}' is read-only", descriptor->name));
    }
    if (!sdk::conforms(value, descriptor->signature))
    {
        return reject(Rejection::Kind::TypeMismatch,
                      fmt::format("property '{}' is of type '{}', not '{}'",
                                  descriptor->name,
                                  descriptor->signature.render(),
                                  value.signature().render()));
    }

    return track(orchestrator_.setProperty(property, value));
}

Session::Submit::Var Session::getAllProperties(const std::string& service,
                                               const std::string& path,
                                               const std::string& interface)
{
    if (findInterface(service, path, interface) == nullptr)
    {
        return reject(Rejection::Kind::UnknownMember,
                      fmt::format("unknown interface '{}' at '{}' of '{}'", interface, path, service));
    }

    return track(orchestrator_.getAllProperties(service, path, interface));
}

Session::Submit::Var Session::subscribe(const sdk::SignalMatch& match)
{
    // Only a signal of an introspected interface can be checked; anything else is up to the bus.
    if (!match.interface.empty() && !match.member.empty())
    {
        const auto* const interface = findInterface(match.service, match.path, match.interface);
        if ((interface != nullptr) && (interface->findSignal(match.member) == nullptr))
        {
            return reject(Rejection::Kind::UnknownMember,
                          fmt::format("unknown signal '{}.{}' at '{}' of '{}'",
                                      match.interface,
                                      match.member,
                                      match.path,
                                      match.service));
        }
    }

    return track(orchestrator_.subscribe(match));
}

bool Session::unsubscribe(const RequestId subscription_id)
{
    if (!orchestrator_.isSubscribed(subscription_id))
    {
        return false;
    }
    logger_->debug("Unsubscribing #{}.", subscription_id);
    return orchestrator_.cancel(subscription_id);
}

bool Session::cancel(const RequestId request_id)
{
    const auto pending_it = pending_.find(request_id);
    if (pending_it == pending_.end())
    {
        return false;
    }
    logger_->debug("Cancelling request #{}.", request_id);

    if (const auto* const fetch = cetl::get_if<Fetch>(&pending_it->second))
    {
        (void) tree_.cancelFetch(fetch->service, fetch->path);
    }
    pending_.erase(pending_it);
    return orchestrator_.cancel(request_id);
}

bool Session::isPending(const RequestId request_id) const
{
    return pending_.find(request_id) != pending_.cend();
}

std::vector<Event::Var> Session::poll()
{
    std::vector<Event::Var> events;

    while (auto message = channel_.tryReceive())
    {
        cetl::visit(cetl::make_overloaded(
                        [this, &events](ResultsMessage::Completed& completed) {
                            //
                            applyCompleted(completed, events);
                        },
                        [this, &events](const ResultsMessage::TimedOut& timed_out) {
                            //
                            applyTimedOut(timed_out.id, events);
                        },
                        [this, &events](ResultsMessage::SignalArrived& arrived) {
                            //
                            if (!orchestrator_.isSubscribed(arrived.subscription_id))
                            {
                                logger_->trace("Dropping signal of gone subscription #{}.", arrived.subscription_id);
                                return;
                            }
                            events.emplace_back(Event::SignalReceived{arrived.subscription_id, std::move(arrived.event)});
                        }),
                    *message);
    }
    return events;
}

Session::Submit::Var Session::track(const RequestId request_id)
{
    pending_.emplace(request_id, Operation{});
    return request_id;
}

Session::Submit::Var Session::reject(const Rejection::Kind kind, std::string message) const
{
    logger_->debug("Rejected ({}): {}.", toString(kind), message);
    return Rejection{kind, std::move(message)};
}

void Session::applyCompleted(ResultsMessage::Completed& completed, std::vector<Event::Var>& events)
{
    const auto request_id = completed.id;

    const auto pending_it = pending_.find(request_id);
    if ((pending_it == pending_.end()) || !orchestrator_.finish(request_id))
    {
        logger_->trace("Dropping result of cancelled request #{}.", request_id);
        return;
    }
    const auto pending = std::move(pending_it->second);
    pending_.erase(pending_it);

    using sdk::BusClient;

    cetl::visit(
        cetl::make_overloaded(
            [this, &events](BusClient::ListNames::Result& result) {
                //
                applyListing(result, events);
            },
            [this, &events, &pending, request_id](BusClient::Introspect::Result& result) {
                //
                if (const auto* const fetch = cetl::get_if<Fetch>(&pending))
                {
                    applyFetch(*fetch, result, events);
                    return;
                }
                logger_->warn("Unexpected introspection result of request #{}.", request_id);
            },
            [&events, request_id](BusClient::Call::Result& result) {
                //
                if (auto* const values = cetl::get_if<BusClient::Call::Success>(&result))
                {
                    events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::Ok{std::move(*values)}});
                    return;
                }
                const auto& failure = cetl::get<BusClient::Call::Failure>(result);
                events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::fromBusError(failure)});
            },
            [&events, request_id](BusClient::GetProperty::Result& result) {
                //
                if (auto* const value = cetl::get_if<BusClient::GetProperty::Success>(&result))
                {
                    events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::Ok{{std::move(*value)}}});
                    return;
                }
                const auto& failure = cetl::get<BusClient::GetProperty::Failure>(result);
                events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::fromBusError(failure)});
            },
            [&events, request_id](const BusClient::SetProperty::Result& result) {
                //
                if (const auto* const failure = cetl::get_if<BusClient::SetProperty::Failure>(&result))
                {
                    events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::fromBusError(*failure)});
                    return;
                }
                events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::Ok{}});
            },
            [this, &events, request_id](BusClient::GetAllProperties::Result& result) {
                //
                auto* const properties = cetl::get_if<BusClient::GetAllProperties::Success>(&result);
                if (properties == nullptr)
                {
                    const auto& failure = cetl::get<BusClient::GetAllProperties::Failure>(result);
                    events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::fromBusError(failure)});
                    return;
                }

                std::vector<std::pair<sdk::Value, sdk::Value>> entries;
                entries.reserve(properties->size());
                for (auto& name_value : *properties)
                {
                    entries.emplace_back(sdk::Value::makeString(std::move(name_value.first)),
                                         sdk::Value::makeVariant(std::move(name_value.second)));
                }
                auto dict = sdk::Value::makeDict(sdk::TypeSignature::makeBasic(sdk::BasicType::String),
                                                 sdk::TypeSignature::makeVariant(),
                                                 std::move(entries));
                if (!dict)
                {
                    logger_->warn("Request #{}: properties can't be represented as a dict.", request_id);
                    events.emplace_back(Event::OperationCompleted{
                        request_id,
                        CallOutcome::LocalFailure{CallOutcome::LocalFailure::Kind::Transport,
                                                  "malformed properties reply"}});
                    return;
                }
                events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::Ok{{std::move(*dict)}}});
            },
            [this, &events, request_id](BusClient::Subscribe::Result& result) {
                //
                if (auto* const subscription = cetl::get_if<BusClient::Subscribe::Success>(&result))
                {
                    logger_->debug("Subscription #{} is established.", request_id);
                    orchestrator_.adoptSubscription(request_id, std::move(*subscription));
                    events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::Ok{}});
                    return;
                }
                const auto& failure = cetl::get<BusClient::Subscribe::Failure>(result);
                events.emplace_back(Event::OperationCompleted{request_id, CallOutcome::fromBusError(failure)});
            }),
        completed.payload);
}

void Session::applyTimedOut(const RequestId request_id, std::vector<Event::Var>& events)
{
    const auto pending_it = pending_.find(request_id);
    if ((pending_it == pending_.end()) || !orchestrator_.finish(request_id))
    {
        logger_->trace("Dropping timeout of cancelled request #{}.", request_id);
        return;
    }
    const auto pending = std::move(pending_it->second);
    pending_.erase(pending_it);

    const auto timeout_ms  = std::chrono::duration_cast<std::chrono::milliseconds>(options_.calls.timeout).count();
    auto       description = fmt::format("no reply within {} ms", timeout_ms);
    logger_->debug("Request #{} timed out.", request_id);

    cetl::visit(cetl::make_overloaded(
                    [&events, &description](const Listing&) {
                        //
                        events.emplace_back(Event::ServicesListed{
                            sdk::BusError{sdk::BusError::Kind::Timeout, {}, std::move(description)}});
                    },
                    [this, &events, &description](const Fetch& fetch) {
                        //
                        if (tree_.failFetch(fetch.service, fetch.path, "timed out: " + description))
                        {
                            events.emplace_back(Event::NodeChanged{fetch.service, fetch.path});
                        }
                    },
                    [&events, &description, request_id](const Operation&) {
                        //
                        events.emplace_back(Event::OperationCompleted{
                            request_id,
                            CallOutcome::LocalFailure{CallOutcome::LocalFailure::Kind::Timeout,
                                                      std::move(description)}});
                    }),
                pending);
}

void Session::applyListing(sdk::BusClient::ListNames::Result& result, std::vector<Event::Var>& events)
{
    if (const auto* const failure = cetl::get_if<sdk::BusClient::ListNames::Failure>(&result))
    {
        logger_->warn("Failed to list names: {}.", failure->message);
        events.emplace_back(Event::ServicesListed{*failure});
        return;
    }

    auto names = filterNames(std::move(cetl::get<sdk::BusClient::ListNames::Success>(result)));
    logger_->debug("Listed {} service(s).", names.size());

    cancelFetches();
    tree_.refreshAll();
    tree_.replaceServices(std::move(names));
    events.emplace_back(Event::ServicesListed{});
}

void Session::applyFetch(const Fetch&                        fetch,
                         sdk::BusClient::Introspect::Result& result,
                         std::vector<Event::Var>&            events)
{
    bool changed = false;
    if (const auto* const failure = cetl::get_if<sdk::BusClient::Introspect::Failure>(&result))
    {
        auto message = failure->name.empty() ? failure->message
                                             : fmt::format("{}: {}", failure->name, failure->message);
        changed = tree_.failFetch(fetch.service, fetch.path, std::move(message));
    }
    else
    {
        const auto& xml    = cetl::get<sdk::BusClient::Introspect::Success>(result);
        auto        parsed = common::dbus::IntrospectionParser::parse(xml);
        if (auto* const data = cetl::get_if<common::dbus::IntrospectionParser::Result::Success>(&parsed))
        {
            changed = tree_.completeFetch(fetch.service, fetch.path, std::move(*data));
        }
        else
        {
            const auto& problem = cetl::get<common::dbus::IntrospectionParser::Result::Failure>(parsed);
            logger_->warn("Bad introspection of '{}' at '{}': {}.", fetch.service, fetch.path, problem);
            changed = tree_.failFetch(fetch.service, fetch.path, "bad introspection data: " + problem);
        }
    }

    if (changed)
    {
        events.emplace_back(Event::NodeChanged{fetch.service, fetch.path});
    }
}

std::vector<std::string> Session::filterNames(std::vector<std::string> names) const
{
    const auto is_hidden = [this](const std::string& name) {
        //
        if (!options_.show_unique_names && !name.empty() && (name.front() == ':'))
        {
            return true;
        }
        return !options_.filter.empty() && (name.find(options_.filter) == std::string::npos);
    };
    names.erase(std::remove_if(names.begin(), names.end(), is_hidden), names.end());
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

void Session::cancelFetches()
{
    for (auto it = pending_.begin(); it != pending_.end();)
    {
        if (cetl::get_if<Fetch>(&it->second) != nullptr)
        {
            (void) orchestrator_.cancel(it->first);
            it = pending_.erase(it);
            continue;
        }
        ++it;
    }
}

}  // namespace engine
}  // namespace dtui
