#pragma once

#include "tg_types.hpp"
#include "node.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace tg {

/**
 * @brief Immutable registry of nodes plus their adjacency.
 *
 * - labels: caller-chosen names for the nodes explicitly added.
 * - nodes: every node reachable from a labelled node, labelled or hidden.
 * - sources / dependants: the adjacency in both directions, by identity.
 *
 * add() never mutates; it returns a new graph and leaves this one valid.
 */
class TIDEGRAPH_API Graph {
public:
    Graph() = default;

    // Throws ConfigurationError on a duplicate label or null node,
    // StructuralError on an identity collision or a cycle.
    Graph add(const std::string& label, const NodePtr& node) const;

    bool has_label(const std::string& label) const;
    std::optional<NodeId> find_label(const std::string& label) const;
    // Throws ConfigurationError(NotFound) for an unknown label.
    NodeId id_of(const std::string& label) const;

    bool has_node(NodeId id) const;
    const Node& node(NodeId id) const;
    const std::vector<std::string>& labels_of(NodeId id) const;
    // First label of the node, or "#<id>" for hidden nodes.
    std::string describe(NodeId id) const;

    std::vector<NodeId> input_ids() const;

    const std::map<std::string, NodeId>& labels() const { return labels_; }
    const std::unordered_map<NodeId, NodePtr>& nodes() const { return nodes_; }
    const Adjacency& sources() const { return sources_; }
    const Adjacency& dependants() const { return dependants_; }

private:
    void insert_node(const NodePtr& node);

    std::map<std::string, NodeId> labels_;
    std::unordered_map<NodeId, std::vector<std::string>> labels_by_id_;
    std::unordered_map<NodeId, NodePtr> nodes_;
    Adjacency sources_;
    Adjacency dependants_;
};

// Folds add() over the entries.
TIDEGRAPH_API Graph make_graph(const std::map<std::string, NodePtr>& labelled = {});

// Depth-first walk from `start` along `adjacency`, keeping the current
// path; true when an identity already on the path is reached again.
TIDEGRAPH_API bool has_cycle_from(const Adjacency& adjacency, NodeId start);

} // namespace tg
