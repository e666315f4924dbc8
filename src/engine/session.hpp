//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_ENGINE_SESSION_HPP_INCLUDED
#define DTUI_ENGINE_SESSION_HPP_INCLUDED

#include "engine_types.hpp"
#include "logging.hpp"
#include "orchestrator/call_orchestrator.hpp"
#include "results_channel.hpp"
#include "topology/topology_tree.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/introspection.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dtui
{
namespace engine
{

/// Things the presentation should react to, as returned by `Session::poll`.
///
struct Event
{
    /// The service list was replaced (or the listing failed, and the old list is kept).
    struct ServicesListed
    {
        cetl::optional<sdk::BusError> error;
    };

    /// A node finished fetching; see its state in the topology.
    struct NodeChanged
    {
        std::string service;
        std::string path;
    };

    struct OperationCompleted
    {
        RequestId        id;
        CallOutcome::Var outcome;
    };

    struct SignalReceived
    {
        RequestId        subscription_id;
        sdk::SignalEvent event;
    };

    using Var = cetl::variant<ServicesListed, NodeChanged, OperationCompleted, SignalReceived>;
};

/// The presentation facade of the engine.
///
/// Owns the topology and every pending request. Intents only schedule work;
/// results are applied (in arrival order) exclusively by `poll`, which is the only
/// place where the topology or pending state changes as a result of bus activity.
///
class Session final
{
public:
    struct Options
    {
        std::string               filter;  ///< Substring which listed names have to contain; empty matches all.
        bool                      show_unique_names{false};
        CallOrchestrator::Options calls;
    };

    struct Submit
    {
        using Success = RequestId;
        using Failure = Rejection;
        using Var     = cetl::variant<Success, Failure>;
    };

    Session(libcyphal::IExecutor& executor, sdk::BusClient::Ptr bus_client, const Options& options);

    Session(Session&&)                 = delete;
    Session(const Session&)            = delete;
    Session& operator=(Session&&)      = delete;
    Session& operator=(const Session&) = delete;

    ~Session() = default;

    const std::vector<std::string>& services() const noexcept
    {
        return tree_.services();
    }

    const TopologyTree& topology() const noexcept
    {
        return tree_;
    }

    const Options& options() const noexcept
    {
        return options_;
    }

    /// Looks up a member of a populated node; `nullptr` if the node isn't populated or has no such member.
    ///
    const sdk::MethodDescriptor*   findMethod(const sdk::MemberRef& method) const;
    const sdk::PropertyDescriptor* findProperty(const sdk::MemberRef& property) const;
    const sdk::InterfaceDescriptor* findInterface(const std::string& service,
                                                  const std::string& path,
                                                  const std::string& interface) const;

    /// Re-lists the bus names. Applying the listing is a full topology refresh.
    ///
    RequestId refreshServices();

    /// Starts fetching an `Unfetched` node.
    ///
    /// @return `false` if the node is unknown, or isn't `Unfetched` (f.e. it's already being fetched).
    ///
    bool expand(const std::string& service, const std::string& path);

    /// Re-fetches a node, replacing its interfaces and children.
    ///
    /// @return `false` if the node is unknown, or is already being fetched.
    ///
    bool refresh(const std::string& service, const std::string& path);

    /// Cancels the fetch of a node, which returns to the state it had before the fetch.
    ///
    bool cancelFetch(const std::string& service, const std::string& path);

    Submit::Var submitCall(const CallRequest& request);
    Submit::Var getProperty(const sdk::MemberRef& property);
    Submit::Var setProperty(const sdk::MemberRef& property, const sdk::Value& value);
    Submit::Var getAllProperties(const std::string& service, const std::string& path, const std::string& interface);

    /// Subscribes to signals. Once `OperationCompleted` reports `Ok`, matching signals
    /// are reported as `SignalReceived` with the same id, until `unsubscribe`.
    ///
    Submit::Var subscribe(const sdk::SignalMatch& match);

    bool unsubscribe(const RequestId subscription_id);

    /// Cancels a pending request; nothing will be reported for it.
    ///
    /// A cancelled node fetch returns the node to its previous state.
    ///
    bool cancel(const RequestId request_id);

    bool isPending(const RequestId request_id) const;

    std::size_t pendingCount() const noexcept
    {
        return pending_.size();
    }

    /// Applies all available results, in arrival order. Never blocks.
    ///
    std::vector<Event::Var> poll();

private:
    struct Listing
    {};
    struct Fetch
    {
        std::string service;
        std::string path;
    };
    struct Operation
    {};
    using Pending = cetl::variant<Listing, Fetch, Operation>;

    bool        startFetch(const std::string& service, const std::string& path);
    Submit::Var track(const RequestId request_id);
    Submit::Var reject(const Rejection::Kind kind, std::string message) const;

    void applyCompleted(ResultsMessage::Completed& completed, std::vector<Event::Var>& events);
    void applyTimedOut(const RequestId request_id, std::vector<Event::Var>& events);
    void applyListing(sdk::BusClient::ListNames::Result& result, std::vector<Event::Var>& events);
    void applyFetch(const Fetch& fetch, sdk::BusClient::Introspect::Result& result, std::vector<Event::Var>& events);

    std::vector<std::string> filterNames(std::vector<std::string> names) const;
    void                     cancelFetches();

    // MARK: Data members:

    common::LoggerPtr            logger_;
    Options                      options_;
    ResultsChannel               channel_;
    TopologyTree                 tree_;
    CallOrchestrator             orchestrator_;
    std::map<RequestId, Pending> pending_;

};  // Session

}  // namespace engine
}  // namespace dtui

#endif  // DTUI_ENGINE_SESSION_HPP_INCLUDED
