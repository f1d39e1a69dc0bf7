// Tidegraph kernel: processing context
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "graph_model.hpp"
#include "kernel/compilation_cache.hpp"
#include "kernel/processor.hpp"

namespace tg {

/**
 * @brief A graph bound to a processor, plus accumulated values and
 * cached schedules.
 *
 * A Context is a value: process() and precompile() return a new context
 * and leave this one usable. Contexts derived from the same lineage share
 * storage but never write to it, so they can be used from different
 * threads independently.
 *
 * Only compute-node values are stored. Input values live for the
 * duration of the process() call that supplies them.
 */
class TIDEGRAPH_API Context {
public:
    // A null processor selects the SequentialProcessor.
    explicit Context(Graph graph, std::shared_ptr<const Processor> processor = nullptr);

    // Caches the schedule for `labels`; returns *this unchanged on a hit.
    Context precompile(const InputLabels& labels) const;

    // Runs one batch on deep copies of `inputs`. Every label must name an input node
    // (ConfigurationError otherwise). Throws ComputationError when a
    // handler fails; this context stays as it was.
    Context process(const std::map<std::string, Value>& inputs) const;

    // Throws ConfigurationError for an unknown label. Input labels and
    // never-computed nodes yield std::nullopt. Returned values are deep
    // copies; writing to them never reaches this context.
    std::optional<Value> value(const std::string& label) const;
    // Labels of every compute node holding a value.
    std::map<std::string, Value> values() const;

    const Graph& graph() const { return *graph_; }
    const Processor& processor() const { return *processor_; }
    const CompilationCache& compilations() const { return compilations_; }
    const ValueMap& node_values() const { return *values_; }

private:
    std::shared_ptr<const Graph> graph_;
    std::shared_ptr<const Processor> processor_;
    std::shared_ptr<const ValueMap> values_;
    CompilationCache compilations_;
};

TIDEGRAPH_API Context make_context(Graph graph,
                                   std::shared_ptr<const Processor> processor = nullptr);

}  // namespace tg
