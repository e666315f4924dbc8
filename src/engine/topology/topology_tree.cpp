//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "topology_tree.hpp"

#include "logging.hpp"

#include <dtui/sdk/introspection.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace engine
{

const char* toString(const FetchState state) noexcept
{
    switch (state)
    {
    case FetchState::Unfetched:
        return "Unfetched";
    case FetchState::Fetching:
        return "Fetching";
    case FetchState::Populated:
        return "Populated";
    case FetchState::Errored:
        return "Errored";
    }
    return "?";
}

const sdk::InterfaceDescriptor* ObjectNode::findInterface(const cetl::string_view name) const
{
    const auto it = std::find_if(interfaces.cbegin(), interfaces.cend(), [name](const auto& interface) {
        //
        return interface.name == name;
    });
    return (it != interfaces.cend()) ? &*it : nullptr;
}

TopologyTree::TopologyTree()
    : logger_{common::getLogger("topology")}
{
}

void TopologyTree::replaceServices(std::vector<std::string> service_names)
{
    logger_->debug("Replacing services (count={}).", service_names.size());

    services_ = std::move(service_names);

    // Forget trees (and fetches) of services which are gone.
    for (auto it = nodes_.begin(); it != nodes_.end();)
    {
        if (hasService(it->first))
        {
            ++it;
            continue;
        }
        for (auto key_it = in_flight_.begin(); key_it != in_flight_.end();)
        {
            key_it = (key_it->first == it->first) ? in_flight_.erase(key_it) : std::next(key_it);
        }
        it = nodes_.erase(it);
    }

    for (const auto& service : services_)
    {
        ensureNode(nodes_[service], RootPath, nullptr);
    }
}

void TopologyTree::refreshAll()
{
    logger_->debug("Dropping all object nodes (fetches_in_flight={}).", in_flight_.size());

    in_flight_.clear();
    nodes_.clear();
    for (const auto& service : services_)
    {
        ensureNode(nodes_[service], RootPath, nullptr);
    }
}

bool TopologyTree::hasService(const std::string& service) const
{
    return std::find(services_.cbegin(), services_.cend(), service) != services_.cend();
}

const ObjectNode* TopologyTree::findNode(const std::string& service, const std::string& path) const
{
    const auto service_it = nodes_.find(service);
    if (service_it == nodes_.cend())
    {
        return nullptr;
    }
    const auto node_it = service_it->second.find(path);
    return (node_it != service_it->second.cend()) ? &node_it->second->node : nullptr;
}

std::vector<const ObjectNode*> TopologyTree::childrenOf(const std::string& service, const std::string& path) const
{
    std::vector<const ObjectNode*> result;
    if (const auto* const node = findNode(service, path))
    {
        for (const auto& segment : node->children)
        {
            if (const auto* const child = findNode(service, childPath(path, segment)))
            {
                result.push_back(child);
            }
        }
    }
    return result;
}

bool TopologyTree::beginFetch(const std::string& service, const std::string& path)
{
    auto* const entry = findEntry(service, path);
    if (entry == nullptr)
    {
        logger_->debug("Can't fetch unknown node (service='{}', path='{}').", service, path);
        return false;
    }
    if (!in_flight_.emplace(service, path).second)
    {
        logger_->trace("Node is already being fetched (service='{}', path='{}').", service, path);
        return false;
    }

    logger_->trace("Node {} -> Fetching (service='{}', path='{}').", toString(entry->node.state), service, path);
    entry->state_before_fetch = entry->node.state;
    entry->node.state         = FetchState::Fetching;
    return true;
}

bool TopologyTree::completeFetch(const std::string& service, const std::string& path, sdk::IntrospectionData data)
{
    if (!endFetch(service, path))
    {
        return false;
    }
    auto* const entry = findEntry(service, path);
    CETL_DEBUG_ASSERT(entry != nullptr, "");

    auto& nodes = nodes_[service];
    auto& node  = entry->node;

    node.children.clear();
    for (auto& segment : data.children)
    {
        const auto child_path = childPath(path, segment);
        if (segment.empty() || (segment.find('/') != std::string::npos) || !sdk::isValidObjectPath(child_path))
        {
            logger_->warn("Skipping invalid child '{}' of '{}' (service='{}').", segment, path, service);
            continue;
        }
        ensureNode(nodes, child_path, &node);
        node.children.push_back(std::move(segment));
    }
    node.interfaces = std::move(data.interfaces);
    node.error.clear();
    node.state = FetchState::Populated;

    logger_->debug("Node -> Populated (service='{}', path='{}', interfaces={}, children={}).",
                   service,
                   path,
                   node.interfaces.size(),
                   node.children.size());
    return true;
}

bool TopologyTree::failFetch(const std::string& service, const std::string& path, std::string error)
{
    if (!endFetch(service, path))
    {
        return false;
    }
    auto* const entry = findEntry(service, path);
    CETL_DEBUG_ASSERT(entry != nullptr, "");

    logger_->debug("Node -> Errored (service='{}', path='{}'): {}.", service, path, error);
    entry->node.state = FetchState::Errored;
    entry->node.error = std::move(error);
    return true;
}

bool TopologyTree::cancelFetch(const std::string& service, const std::string& path)
{
    if (!endFetch(service, path))
    {
        return false;
    }
    auto* const entry = findEntry(service, path);
    CETL_DEBUG_ASSERT(entry != nullptr, "");

    logger_->trace("Node fetch is cancelled -> {} (service='{}', path='{}').",
                   toString(entry->state_before_fetch),
                   service,
                   path);
    entry->node.state = entry->state_before_fetch;
    return true;
}

bool TopologyTree::isFetching(const std::string& service, const std::string& path) const
{
    return in_flight_.find(NodeKey{service, path}) != in_flight_.cend();
}

TopologyTree::NodeEntry* TopologyTree::findEntry(const std::string& service, const std::string& path)
{
    const auto service_it = nodes_.find(service);
    if (service_it == nodes_.end())
    {
        return nullptr;
    }
    const auto node_it = service_it->second.find(path);
    return (node_it != service_it->second.end()) ? node_it->second.get() : nullptr;
}

TopologyTree::NodeEntry& TopologyTree::ensureNode(ServiceNodes& nodes, const std::string& path, const ObjectNode* parent)
{
    auto& entry = nodes[path];
    if (!entry)
    {
        entry = std::make_unique<NodeEntry>(
            NodeEntry{ObjectNode{path, parent, {}, {}, FetchState::Unfetched, {}}, FetchState::Unfetched});
    }
    return *entry;
}

bool TopologyTree::endFetch(const std::string& service, const std::string& path)
{
    return in_flight_.erase(NodeKey{service, path}) > 0;
}

std::string TopologyTree::childPath(const std::string& parent_path, const std::string& segment)
{
    if (parent_path == RootPath)
    {
        return parent_path + segment;
    }
    return parent_path + "/" + segment;
}

}  // namespace engine
}  // namespace dtui
