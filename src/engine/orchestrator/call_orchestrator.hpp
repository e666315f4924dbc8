//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_ENGINE_CALL_ORCHESTRATOR_HPP_INCLUDED
#define DTUI_ENGINE_CALL_ORCHESTRATOR_HPP_INCLUDED

#include "engine_types.hpp"
#include "logging.hpp"
#include "results_channel.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace dtui
{
namespace engine
{

/// Schedules bus operations on behalf of the session.
///
/// Every operation gets a `RequestId` and completes by posting exactly one message
/// (`Completed` or `TimedOut`) to the results channel, unless it's cancelled first.
/// At most `max_in_flight_per_service` operations per destination are on the wire;
/// the rest wait in FIFO order. A timeout starts when an operation is put on the wire.
///
/// The orchestrator never interprets results. The session, while applying a message,
/// calls `finish` to release the operation (and its slot).
///
class CallOrchestrator final
{
public:
    struct Options
    {
        libcyphal::Duration timeout{std::chrono::seconds{5}};
        std::size_t         max_in_flight_per_service{4};
    };

    CallOrchestrator(libcyphal::IExecutor& executor,
                     sdk::BusClient::Ptr   bus_client,
                     ResultsChannel&       channel,
                     const Options&        options);

    CallOrchestrator(CallOrchestrator&&)                 = delete;
    CallOrchestrator(const CallOrchestrator&)            = delete;
    CallOrchestrator& operator=(CallOrchestrator&&)      = delete;
    CallOrchestrator& operator=(const CallOrchestrator&) = delete;

    ~CallOrchestrator();

    const Options& options() const noexcept
    {
        return options_;
    }

    RequestId listNames();
    RequestId introspect(const std::string& service, const std::string& path);
    RequestId call(const CallRequest& request);
    RequestId getProperty(const sdk::MemberRef& property);
    RequestId setProperty(const sdk::MemberRef& property, const sdk::Value& value);
    RequestId getAllProperties(const std::string& service, const std::string& path, const std::string& interface);

    /// Establishes a signal subscription.
    ///
    /// Its `Completed` message carries the subscription; after `adoptSubscription`
    /// matching signals arrive as `SignalArrived` messages with the same id.
    ///
    RequestId subscribe(const sdk::SignalMatch& match);

    /// Releases a completed (or timed out) operation, and dispatches waiting ones.
    ///
    /// @return `false` if the id is unknown (cancelled or already finished) - the message should be discarded.
    ///
    bool finish(const RequestId request_id);

    /// Keeps an established subscription alive until it's cancelled.
    ///
    void adoptSubscription(const RequestId request_id, sdk::BusClient::Subscription::Ptr subscription);

    bool isSubscribed(const RequestId request_id) const;

    /// Forgets a request (queued, on the wire, or an established subscription).
    /// Nothing is delivered for it afterwards.
    ///
    /// @return `false` if the id is unknown.
    ///
    bool cancel(const RequestId request_id);

    bool isPending(const RequestId request_id) const;

    std::size_t inFlight(const std::string& service) const;
    std::size_t queued(const std::string& service) const;

    /// Number of destinations with at least one operation on the wire.
    std::size_t busyDestinations() const noexcept;

private:
    /// Keeps an operation alive; destroying it cancels the operation.
    using Operation = std::shared_ptr<void>;
    using Starter   = std::function<Operation(RequestId)>;

    struct Request
    {
        std::string                         destination;
        Starter                             start;
        Operation                           operation;
        libcyphal::IExecutor::Callback::Any timeout_callback;
    };

    template <typename Result, typename MakeSender>
    RequestId enqueue(const std::string& destination, const char* const op_name, MakeSender&& make_sender);

    void dispatch(const RequestId request_id, Request& request);
    void dispatchWaiting(const std::string& destination);

    // MARK: Data members:

    libcyphal::IExecutor&                                       executor_;
    sdk::BusClient::Ptr                                         bus_client_;
    ResultsChannel&                                             channel_;
    Options                                                     options_;
    common::LoggerPtr                                           logger_;
    RequestId                                                   next_request_id_;
    std::map<RequestId, Request>                                requests_;
    std::map<std::string, std::size_t>                          in_flight_;
    std::map<std::string, std::deque<RequestId>>                waiting_;
    std::map<RequestId, sdk::BusClient::Subscription::Ptr>      subscriptions_;

};  // CallOrchestrator

}  // namespace engine
}  // namespace dtui

#endif  // DTUI_ENGINE_CALL_ORCHESTRATOR_HPP_INCLUDED
