// Tidegraph kernel: Context implementation
#include "kernel/context.hpp"

namespace tg {

Context::Context(Graph graph, std::shared_ptr<const Processor> processor)
    : graph_(std::make_shared<const Graph>(std::move(graph))),
      processor_(processor ? std::move(processor)
                           : std::make_shared<const SequentialProcessor>()),
      values_(std::make_shared<const ValueMap>()) {}

Context Context::precompile(const InputLabels& labels) const {
    if (compilations_.contains(labels)) {
        return *this;
    }
    Context next(*this);
    next.compilations_ = compilations_.with(labels, compile_schedule(*graph_, *processor_, labels));
    return next;
}

Context Context::process(const std::map<std::string, Value>& inputs) const {
    InputLabels labels;
    for (const auto& entry : inputs) {
        labels.insert(entry.first);
    }

    Context next = precompile(labels);
    auto schedule = next.compilations_.find(labels);

    InputValues input_values;
    for (const auto& [label, value] : inputs) {
        // Caller-held nodes share storage with the batch; keep our own copy.
        input_values.emplace(graph_->id_of(label), YAML::Clone(value));
    }

    next.values_ = std::make_shared<const ValueMap>(
        processor_->execute(*graph_, *schedule, *values_, input_values));
    return next;
}

std::optional<Value> Context::value(const std::string& label) const {
    NodeId id = graph_->id_of(label);
    if (graph_->node(id).is_input()) {
        return std::nullopt;
    }
    auto it = values_->find(id);
    if (it == values_->end()) {
        return std::nullopt;
    }
    return YAML::Clone(it->second);
}

std::map<std::string, Value> Context::values() const {
    std::map<std::string, Value> out;
    for (const auto& [label, id] : graph_->labels()) {
        auto it = values_->find(id);
        if (it != values_->end()) {
            out.emplace(label, YAML::Clone(it->second));
        }
    }
    return out;
}

Context make_context(Graph graph, std::shared_ptr<const Processor> processor) {
    return Context(std::move(graph), std::move(processor));
}

}  // namespace tg
