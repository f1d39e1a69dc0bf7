#include "graph_model.hpp"

#include <algorithm>
#include <unordered_set>

namespace tg {

namespace {

bool cycle_util(const Adjacency& adjacency, NodeId node_id,
                std::unordered_set<NodeId>& path,
                std::unordered_set<NodeId>& finished) {
  if (path.count(node_id)) {
    return true;
  }
  if (finished.count(node_id)) {
    return false;
  }
  path.insert(node_id);
  auto it = adjacency.find(node_id);
  if (it != adjacency.end()) {
    for (NodeId next : it->second) {
      if (cycle_util(adjacency, next, path, finished)) {
        return true;
      }
    }
  }
  path.erase(node_id);
  finished.insert(node_id);
  return false;
}

const std::vector<std::string> kNoLabels;

}  // namespace

bool has_cycle_from(const Adjacency& adjacency, NodeId start) {
  std::unordered_set<NodeId> path;
  std::unordered_set<NodeId> finished;
  return cycle_util(adjacency, start, path, finished);
}

Graph Graph::add(const std::string& label, const NodePtr& node) const {
  if (!node) {
    throw ConfigurationError(GraphErrc::NotFound,
                             "Cannot add a null node under label '" + label + "'.");
  }
  if (has_label(label)) {
    throw ConfigurationError(GraphErrc::DuplicateLabel,
                             "Label '" + label + "' already exists.");
  }

  Graph next(*this);
  next.insert_node(node);
  next.labels_[label] = node->id();
  next.labels_by_id_[node->id()].push_back(label);

  if (has_cycle_from(next.sources_, node->id())) {
    throw StructuralError(GraphErrc::Cycle,
                          "Adding '" + label + "' creates a cycle.");
  }
  return next;
}

void Graph::insert_node(const NodePtr& node) {
  auto existing = nodes_.find(node->id());
  if (existing != nodes_.end()) {
    if (existing->second != node) {
      throw StructuralError(
          GraphErrc::IdentityCollision,
          "Node id " + std::to_string(node->id()) +
              " is already taken by a different node.");
    }
    return;
  }

  sources_[node->id()];
  dependants_[node->id()];
  for (const auto& entry : node->sources()) {
    const NodePtr& source = entry.second;
    insert_node(source);
    sources_[node->id()].insert(source->id());
    dependants_[source->id()].insert(node->id());
  }
  // A source chain may have registered a different node under this id.
  auto claimed = nodes_.find(node->id());
  if (claimed != nodes_.end() && claimed->second != node) {
    throw StructuralError(
        GraphErrc::IdentityCollision,
        "Node id " + std::to_string(node->id()) +
            " is already taken by a different node.");
  }
  nodes_[node->id()] = node;
}

bool Graph::has_label(const std::string& label) const {
  return labels_.count(label) > 0;
}

std::optional<NodeId> Graph::find_label(const std::string& label) const {
  auto it = labels_.find(label);
  if (it == labels_.end()) return std::nullopt;
  return it->second;
}

NodeId Graph::id_of(const std::string& label) const {
  auto it = labels_.find(label);
  if (it == labels_.end()) {
    throw ConfigurationError(GraphErrc::NotFound,
                             "Label '" + label + "' not in graph.");
  }
  return it->second;
}

bool Graph::has_node(NodeId id) const {
  return nodes_.count(id) > 0;
}

const Node& Graph::node(NodeId id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw GraphError(GraphErrc::NotFound,
                     "Node " + std::to_string(id) + " not in graph.");
  }
  return *it->second;
}

const std::vector<std::string>& Graph::labels_of(NodeId id) const {
  auto it = labels_by_id_.find(id);
  return it == labels_by_id_.end() ? kNoLabels : it->second;
}

std::string Graph::describe(NodeId id) const {
  const auto& labels = labels_of(id);
  if (!labels.empty()) return labels.front();
  return "#" + std::to_string(id);
}

std::vector<NodeId> Graph::input_ids() const {
  std::vector<NodeId> ids;
  for (const auto& pair : nodes_) {
    if (pair.second->is_input()) ids.push_back(pair.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

Graph make_graph(const std::map<std::string, NodePtr>& labelled) {
  Graph graph;
  for (const auto& [label, node] : labelled) {
    graph = graph.add(label, node);
  }
  return graph;
}

}  // namespace tg
