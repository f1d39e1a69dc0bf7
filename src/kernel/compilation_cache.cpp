#include "kernel/compilation_cache.hpp"

#include "kernel/processor.hpp"

namespace tg {

std::shared_ptr<const Schedule> CompilationCache::find(const InputLabels& labels) const {
    auto it = entries_.find(labels);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

CompilationCache CompilationCache::with(const InputLabels& labels,
                                        std::shared_ptr<const Schedule> schedule) const {
    CompilationCache next(*this);
    next.entries_[labels] = std::move(schedule);
    return next;
}

std::vector<NodeId> resolve_input_labels(const Graph& graph, const InputLabels& labels) {
    std::vector<NodeId> ids;
    ids.reserve(labels.size());
    for (const auto& label : labels) {
        NodeId id = graph.id_of(label);
        if (!graph.node(id).is_input()) {
            throw ConfigurationError(GraphErrc::WrongNodeKind,
                                     "Label '" + label + "' names a compute node, not an input.");
        }
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<const Schedule> compile_schedule(const Graph& graph,
                                                 const Processor& processor,
                                                 const InputLabels& labels) {
    return std::make_shared<const Schedule>(
        processor.compile(graph, resolve_input_labels(graph, labels)));
}

}  // namespace tg
