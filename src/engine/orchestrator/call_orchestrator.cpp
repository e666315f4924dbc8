//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "call_orchestrator.hpp"

#include "engine_types.hpp"
#include "logging.hpp"
#include "results_channel.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/execution.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace dtui
{
namespace engine
{
namespace
{

constexpr const char* BusDaemon = "org.freedesktop.DBus";

}  // namespace

CallOrchestrator::CallOrchestrator(libcyphal::IExecutor& executor,
                                   sdk::BusClient::Ptr   bus_client,
                                   ResultsChannel&       channel,
                                   const Options&        options)
    : executor_{executor}
    , bus_client_{std::move(bus_client)}
    , channel_{channel}
    , options_{options}
    , logger_{common::getLogger("orchestrator")}
    , next_request_id_{1}
{
    CETL_DEBUG_ASSERT(bus_client_, "");

    if (options_.max_in_flight_per_service == 0)
    {
        logger_->warn("In-flight cap can't be zero - using 1.");
        options_.max_in_flight_per_service = 1;
    }
}

CallOrchestrator::~CallOrchestrator()
{
    logger_->trace("~CallOrchestrator() (requests={}, subscriptions={}).", requests_.size(), subscriptions_.size());

    subscriptions_.clear();
    requests_.clear();
}

template <typename Result, typename MakeSender>
RequestId CallOrchestrator::enqueue(const std::string& destination, const char* const op_name, MakeSender&& make_sender)
{
    const auto request_id = next_request_id_++;
    logger_->debug("Request #{} `{}` (destination='{}').", request_id, op_name, destination);

    auto* const channel = &channel_;

    Request request{destination,
                    [channel, make = std::forward<MakeSender>(make_sender)](const RequestId id) -> Operation {
                        //
                        typename sdk::SenderOf<Result>::Ptr sender = make(id);
                        sender->submit([channel, id](Result&& result) {
                            //
                            channel->post(ResultsMessage::Completed{id, Payload{std::move(result)}});
                        });
                        return std::shared_ptr<sdk::SenderOf<Result>>{std::move(sender)};
                    },
                    nullptr,
                    {}};
    auto& stored = requests_.emplace(request_id, std::move(request)).first->second;

    if (inFlight(destination) < options_.max_in_flight_per_service)
    {
        dispatch(request_id, stored);
    }
    else
    {
        logger_->debug("Request #{} waits for a free slot (destination='{}', queued={}).",
                       request_id,
                       destination,
                       queued(destination) + 1);
        waiting_[destination].push_back(request_id);
    }
    return request_id;
}

void CallOrchestrator::dispatch(const RequestId request_id, Request& request)
{
    logger_->trace("Dispatching request #{}.", request_id);

    ++in_flight_[request.destination];
    request.operation = request.start(request_id);

    request.timeout_callback = executor_.registerCallback([this, request_id](const auto&) {
        //
        logger_->debug("Request #{} has timed out.", request_id);
        channel_.post(ResultsMessage::TimedOut{request_id});
    });
    request.timeout_callback.schedule(
        libcyphal::IExecutor::Callback::Schedule::Once{executor_.now() + options_.timeout});
}

void CallOrchestrator::dispatchWaiting(const std::string& destination)
{
    const auto waiting_it = waiting_.find(destination);
    if (waiting_it == waiting_.end())
    {
        return;
    }

    auto& queue = waiting_it->second;
    while (!queue.empty() && (inFlight(destination) < options_.max_in_flight_per_service))
    {
        const auto request_id = queue.front();
        queue.pop_front();

        const auto request_it = requests_.find(request_id);
        if (request_it != requests_.end())
        {
            dispatch(request_id, request_it->second);
        }
    }
    if (queue.empty())
    {
        waiting_.erase(waiting_it);
    }
}

RequestId CallOrchestrator::listNames()
{
    return enqueue<sdk::BusClient::ListNames::Result>(  //
        BusDaemon,
        "ListNames",
        [client = bus_client_](RequestId) { return client->listNames(); });
}

RequestId CallOrchestrator::introspect(const std::string& service, const std::string& path)
{
    return enqueue<sdk::BusClient::Introspect::Result>(  //
        service,
        "Introspect",
        [client = bus_client_, service, path](RequestId) { return client->introspect(service, path); });
}

RequestId CallOrchestrator::call(const CallRequest& request)
{
    return enqueue<sdk::BusClient::Call::Result>(  //
        request.service,
        "Call",
        [client = bus_client_, request](RequestId) {
            //
            return client->callMethod({request.service, request.path, request.interface, request.member},
                                      request.args);
        });
}

RequestId CallOrchestrator::getProperty(const sdk::MemberRef& property)
{
    return enqueue<sdk::BusClient::GetProperty::Result>(  //
        property.service,
        "Get",
        [client = bus_client_, property](RequestId) { return client->getProperty(property); });
}

RequestId CallOrchestrator::setProperty(const sdk::MemberRef& property, const sdk::Value& value)
{
    return enqueue<sdk::BusClient::SetProperty::Result>(  //
        property.service,
        "Set",
        [client = bus_client_, property, value](RequestId) { return client->setProperty(property, value); });
}

RequestId CallOrchestrator::getAllProperties(const std::string& service,
                                             const std::string& path,
                                             const std::string& interface)
{
    return enqueue<sdk::BusClient::GetAllProperties::Result>(  //
        service,
        "GetAll",
        [client = bus_client_, service, path, interface](RequestId) {
            //
            return client->getAllProperties(service, path, interface);
        });
}

RequestId CallOrchestrator::subscribe(const sdk::SignalMatch& match)
{
    auto* const channel = &channel_;
    return enqueue<sdk::BusClient::Subscribe::Result>(  //
        BusDaemon,
        "Subscribe",
        [client = bus_client_, match, channel](const RequestId id) {
            //
            return client->subscribeSignal(match, [channel, id](sdk::SignalEvent&& event) {
                //
                channel->post(ResultsMessage::SignalArrived{id, std::move(event)});
            });
        });
}

bool CallOrchestrator::finish(const RequestId request_id)
{
    const auto request_it = requests_.find(request_id);
    if (request_it == requests_.end())
    {
        logger_->trace("Discarding result of unknown request #{}.", request_id);
        return false;
    }

    const bool was_dispatched = request_it->second.operation != nullptr;
    const auto destination    = request_it->second.destination;
    requests_.erase(request_it);

    logger_->trace("Request #{} is finished.", request_id);
    if (was_dispatched)
    {
        const auto in_flight_it = in_flight_.find(destination);
        if ((in_flight_it != in_flight_.end()) && (--in_flight_it->second == 0))
        {
            in_flight_.erase(in_flight_it);
        }
        dispatchWaiting(destination);
    }
    return true;
}

void CallOrchestrator::adoptSubscription(const RequestId request_id, sdk::BusClient::Subscription::Ptr subscription)
{
    CETL_DEBUG_ASSERT(subscription, "");
    subscriptions_[request_id] = std::move(subscription);
}

bool CallOrchestrator::isSubscribed(const RequestId request_id) const
{
    return subscriptions_.find(request_id) != subscriptions_.cend();
}

bool CallOrchestrator::cancel(const RequestId request_id)
{
    const auto subscription_it = subscriptions_.find(request_id);
    if (subscription_it != subscriptions_.end())
    {
        logger_->debug("Cancelling subscription #{}.", request_id);
        subscriptions_.erase(subscription_it);
        return true;
    }

    const auto request_it = requests_.find(request_id);
    if (request_it == requests_.end())
    {
        return false;
    }
    logger_->debug("Cancelling request #{}.", request_id);

    if (request_it->second.operation == nullptr)
    {
        const auto waiting_it = waiting_.find(request_it->second.destination);
        if (waiting_it != waiting_.end())
        {
            auto& queue = waiting_it->second;
            queue.erase(std::remove(queue.begin(), queue.end(), request_id), queue.end());
        }
        requests_.erase(request_it);
        return true;
    }
    return finish(request_id);
}

bool CallOrchestrator::isPending(const RequestId request_id) const
{
    return requests_.find(request_id) != requests_.cend();
}

std::size_t CallOrchestrator::inFlight(const std::string& service) const
{
    const auto it = in_flight_.find(service);
    return (it != in_flight_.cend()) ? it->second : 0;
}

std::size_t CallOrchestrator::busyDestinations() const noexcept
{
    return in_flight_.size();
}

std::size_t CallOrchestrator::queued(const std::string& service) const
{
    const auto it = waiting_.find(service);
    return (it != waiting_.cend()) ? it->second.size() : 0;
}

}  // namespace engine
}  // namespace dtui
