#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <vector>

#include "graph_model.hpp"

namespace tg {

class GraphTraversalService {
 public:
  // Level 0 holds `inputs` (every input node when omitted); each other
  // node sits one level below the deepest of its sources reachable from
  // them. Nodes within a level are sorted by identity.
  Schedule levels(const Graph& graph,
                  const std::optional<std::vector<NodeId>>& inputs =
                      std::nullopt) const;

  // Every path from a labelled ancestor down to `node_id`, spelled as
  // [ancestor label, local source label, ..., local source label].
  std::set<LabelPath> label_paths(const Graph& graph, NodeId node_id) const;

  std::vector<NodeId> dependants_of(const Graph& graph, NodeId node_id) const;
  std::vector<NodeId> ending_nodes(const Graph& graph) const;

  void print_dependency_tree(const Graph& graph, std::ostream& os) const;
  void print_dependency_tree(const Graph& graph, std::ostream& os,
                             const std::string& start_label) const;
};

}  // namespace tg
