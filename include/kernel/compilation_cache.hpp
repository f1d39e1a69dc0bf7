#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>

#include "graph_model.hpp"

namespace tg {

class Processor;

using InputLabels = std::set<std::string>;

// Schedules keyed by the set of input labels of a processing call. Never
// modified in place: with() returns an extended copy.
class TIDEGRAPH_API CompilationCache {
public:
    std::shared_ptr<const Schedule> find(const InputLabels& labels) const;
    bool contains(const InputLabels& labels) const { return entries_.count(labels) > 0; }
    size_t size() const { return entries_.size(); }

    CompilationCache with(const InputLabels& labels,
                          std::shared_ptr<const Schedule> schedule) const;

private:
    std::map<InputLabels, std::shared_ptr<const Schedule>> entries_;
};

// Throws ConfigurationError for an unknown label or one naming a compute node.
TIDEGRAPH_API std::vector<NodeId> resolve_input_labels(const Graph& graph,
                                                       const InputLabels& labels);

// Resolves `labels` and runs the processor's compile step.
TIDEGRAPH_API std::shared_ptr<const Schedule> compile_schedule(const Graph& graph,
                                                               const Processor& processor,
                                                               const InputLabels& labels);

}  // namespace tg
