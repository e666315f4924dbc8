//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_ENGINE_TOPOLOGY_TREE_HPP_INCLUDED
#define DTUI_ENGINE_TOPOLOGY_TREE_HPP_INCLUDED

#include "logging.hpp"

#include <dtui/sdk/introspection.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace engine
{

enum class FetchState : std::uint8_t
{
    Unfetched,
    Fetching,
    Populated,
    Errored,
};

const char* toString(const FetchState state) noexcept;

struct ObjectNode
{
    std::string                           path;
    const ObjectNode*                     parent;    ///< Null for the root (`/`) node.
    std::vector<std::string>              children;  ///< Child path segments, in discovery order.
    std::vector<sdk::InterfaceDescriptor> interfaces;
    FetchState                            state;
    std::string                           error;  ///< Valid if `Errored`.

    const sdk::InterfaceDescriptor* findInterface(const cetl::string_view name) const;
};

/// Forest of object trees, one per listed service.
///
/// Nodes are fetched lazily: a node is introspected only on request, and completing
/// a fetch only creates its direct children (as `Unfetched`). At most one fetch is
/// in flight per (service, path). A failed fetch affects only its own node.
///
class TopologyTree final
{
public:
    static constexpr const char* RootPath = "/";

    TopologyTree();

    /// Replaces the listed services. Each one exposes an `Unfetched` root node;
    /// object trees of services which are still listed are kept.
    ///
    void replaceServices(std::vector<std::string> service_names);

    /// Drops every object node (and so every in-flight fetch); listed services get fresh root nodes.
    ///
    void refreshAll();

    const std::vector<std::string>& services() const noexcept
    {
        return services_;
    }

    bool hasService(const std::string& service) const;

    const ObjectNode* findNode(const std::string& service, const std::string& path) const;

    /// Nodes of the direct children of a node, in order of its child list.
    ///
    std::vector<const ObjectNode*> childrenOf(const std::string& service, const std::string& path) const;

    /// Moves a node to `Fetching`.
    ///
    /// @return `false` (and does nothing) if there is no such node, or it's already being fetched.
    ///
    bool beginFetch(const std::string& service, const std::string& path);

    /// Populates a node with its introspection results.
    ///
    /// @return `false` if there was no fetch in flight for the node (f.e. it was cancelled).
    ///
    bool completeFetch(const std::string& service, const std::string& path, sdk::IntrospectionData data);

    /// Marks a node as `Errored`.
    ///
    bool failFetch(const std::string& service, const std::string& path, std::string error);

    /// Abandons a fetch in flight; the node returns to its state before the fetch.
    ///
    bool cancelFetch(const std::string& service, const std::string& path);

    bool isFetching(const std::string& service, const std::string& path) const;

    std::size_t fetchesInFlight() const noexcept
    {
        return in_flight_.size();
    }

private:
    using NodeKey = std::pair<std::string, std::string>;  // service & path

    struct NodeEntry
    {
        ObjectNode node;
        FetchState state_before_fetch;
    };
    using ServiceNodes = std::map<std::string, std::unique_ptr<NodeEntry>>;

    NodeEntry* findEntry(const std::string& service, const std::string& path);
    NodeEntry& ensureNode(ServiceNodes& nodes, const std::string& path, const ObjectNode* parent);
    bool       endFetch(const std::string& service, const std::string& path);

    static std::string childPath(const std::string& parent_path, const std::string& segment);

    // MARK: Data members:

    common::LoggerPtr                   logger_;
    std::vector<std::string>            services_;
    std::map<std::string, ServiceNodes> nodes_;
    std::set<NodeKey>                   in_flight_;

};  // TopologyTree

}  // namespace engine
}  // namespace dtui

#endif  // DTUI_ENGINE_TOPOLOGY_TREE_HPP_INCLUDED
