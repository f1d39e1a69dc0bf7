#include "kernel/services/graph_traversal_service.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace tg {

namespace {

size_t depth_util(const Graph& graph, NodeId node_id,
                  const std::unordered_set<NodeId>& frontier,
                  const std::unordered_set<NodeId>& reachable,
                  std::unordered_map<NodeId, size_t>& depth) {
    auto known = depth.find(node_id);
    if (known != depth.end()) {
        return known->second;
    }
    size_t d = 0;
    if (!frontier.count(node_id)) {
        // Sources outside the reachable set keep their cached value and
        // do not constrain the level.
        for (NodeId source_id : graph.sources().at(node_id)) {
            if (reachable.count(source_id)) {
                d = std::max(d, depth_util(graph, source_id, frontier, reachable, depth) + 1);
            }
        }
    }
    depth[node_id] = d;
    return d;
}

void label_paths_util(const Graph& graph, NodeId node_id,
                      std::vector<std::string>& trail,
                      std::set<LabelPath>& out) {
    const auto& labels = graph.labels_of(node_id);
    if (!labels.empty()) {
        for (const auto& label : labels) {
            LabelPath path;
            path.reserve(trail.size() + 1);
            path.push_back(label);
            path.insert(path.end(), trail.rbegin(), trail.rend());
            out.insert(std::move(path));
        }
        return;
    }
    for (NodeId dependant_id : graph.dependants().at(node_id)) {
        const Node& dependant = graph.node(dependant_id);
        for (const auto& [local_label, source] : dependant.sources()) {
            if (source->id() != node_id) {
                continue;
            }
            trail.push_back(local_label);
            label_paths_util(graph, dependant_id, trail, out);
            trail.pop_back();
        }
    }
}

void print_dep_tree_recursive(const Graph& graph, std::ostream& os,
                              NodeId node_id, int level,
                              const std::string& via) {
    auto indent = [&](int l) {
        for (int i = 0; i < l; ++i) {
            os << "  ";
        }
    };

    const Node& node = graph.node(node_id);
    indent(level);
    os << "- ";
    if (!via.empty()) {
        os << "(" << via << ") ";
    }
    os << graph.describe(node_id) << " ["
       << (node.is_input() ? "input" : "compute") << " #" << node_id << "]\n";

    for (const auto& [local_label, source] : node.sources()) {
        print_dep_tree_recursive(graph, os, source->id(), level + 1, local_label);
    }
}

}  // namespace

Schedule GraphTraversalService::levels(
    const Graph& graph, const std::optional<std::vector<NodeId>>& inputs) const {
    std::vector<NodeId> start = inputs ? *inputs : graph.input_ids();
    std::unordered_set<NodeId> frontier;
    for (NodeId id : start) {
        if (!graph.has_node(id)) {
            throw GraphError(GraphErrc::NotFound,
                             "Node " + std::to_string(id) + " not in graph.");
        }
        frontier.insert(id);
    }

    std::unordered_set<NodeId> reachable(frontier.begin(), frontier.end());
    std::deque<NodeId> queue(frontier.begin(), frontier.end());
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        for (NodeId dependant_id : graph.dependants().at(current)) {
            if (reachable.insert(dependant_id).second) {
                queue.push_back(dependant_id);
            }
        }
    }

    std::unordered_map<NodeId, size_t> depth;
    Schedule result;
    for (NodeId id : reachable) {
        size_t d = depth_util(graph, id, frontier, reachable, depth);
        if (result.size() <= d) {
            result.resize(d + 1);
        }
        result[d].push_back(id);
    }
    for (auto& level : result) {
        std::sort(level.begin(), level.end());
    }
    return result;
}

std::set<LabelPath> GraphTraversalService::label_paths(const Graph& graph,
                                                       NodeId node_id) const {
    if (!graph.has_node(node_id)) {
        throw GraphError(GraphErrc::NotFound,
                         "Node " + std::to_string(node_id) + " not in graph.");
    }
    std::set<LabelPath> out;
    std::vector<std::string> trail;
    label_paths_util(graph, node_id, trail, out);
    return out;
}

std::vector<NodeId> GraphTraversalService::dependants_of(const Graph& graph,
                                                         NodeId node_id) const {
    auto it = graph.dependants().find(node_id);
    if (it == graph.dependants().end()) {
        throw GraphError(GraphErrc::NotFound,
                         "Node " + std::to_string(node_id) + " not in graph.");
    }
    std::vector<NodeId> out(it->second.begin(), it->second.end());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<NodeId> GraphTraversalService::ending_nodes(const Graph& graph) const {
    std::vector<NodeId> ends;
    for (const auto& pair : graph.dependants()) {
        if (pair.second.empty()) {
            ends.push_back(pair.first);
        }
    }
    std::sort(ends.begin(), ends.end());
    return ends;
}

void GraphTraversalService::print_dependency_tree(const Graph& graph,
                                                  std::ostream& os) const {
    os << "Dependency Tree (from ending nodes):\n";
    if (graph.nodes().empty()) {
        os << "(Graph is empty)\n";
        return;
    }
    for (NodeId end_id : ending_nodes(graph)) {
        print_dep_tree_recursive(graph, os, end_id, 0, "");
    }
}

void GraphTraversalService::print_dependency_tree(const Graph& graph,
                                                  std::ostream& os,
                                                  const std::string& start_label) const {
    os << "Dependency Tree (starting from '" << start_label << "'):\n";
    auto id = graph.find_label(start_label);
    if (!id) {
        os << "(Label '" << start_label << "' not found in graph)\n";
        return;
    }
    print_dep_tree_recursive(graph, os, *id, 0, "");
}

}  // namespace tg
