// Tidegraph kernel: compile/execute strategies
#pragma once

#include <memory>
#include <vector>

#include "graph_model.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "kernel/services/graph_traversal_service.hpp"

namespace tg {

class WorkerPool;

struct ProcessorOptions {
    bool quiet = true;
    // When set, one ComputeEvent is recorded per evaluated node.
    std::shared_ptr<GraphEventService> events;
};

/**
 * @brief Extension point for execution strategies.
 *
 * compile() turns a set of input identities into a schedule that excludes
 * the inputs themselves. execute() runs a schedule against the current
 * values and one batch of input values, and returns the full new value
 * map: nodes outside the schedule keep their current value.
 *
 * Both must leave their arguments untouched; a failing execute() throws
 * and commits nothing.
 */
class TIDEGRAPH_API Processor {
public:
    explicit Processor(ProcessorOptions options = {});
    virtual ~Processor() = default;

    virtual const char* name() const = 0;
    virtual Schedule compile(const Graph& graph, const std::vector<NodeId>& inputs) const = 0;
    virtual ValueMap execute(const Graph& graph, const Schedule& schedule,
                             const ValueMap& current, const InputValues& inputs) const = 0;

    bool is_quiet() const { return options_.quiet; }
    const std::shared_ptr<GraphEventService>& events() const { return options_.events; }

protected:
    // evaluate_node() plus console logging and event recording.
    Value evaluate(const Graph& graph, NodeId node_id,
                   const ValueMap& running, const InputValues& inputs) const;

    GraphTraversalService traversal_;

private:
    ProcessorOptions options_;
};

/**
 * @brief Computes one compute node against the running values.
 *
 * Each source is looked up in `running` first and then in `inputs`; a
 * source found in neither is passed as a null value. The handler gets
 * deep copies of its source values and of the node's previous value
 * (null on first computation), so whatever it returns shares no storage
 * with stored values.
 * Any fault raised by the handler is rethrown as a ComputationError
 * carrying the label paths to the node.
 */
TIDEGRAPH_API Value evaluate_node(const Graph& graph, NodeId node_id,
                                  const ValueMap& running, const InputValues& inputs);

// Replaces (never assigns through) the value stored for `node_id`.
TIDEGRAPH_API void store_value(ValueMap& values, NodeId node_id, const Value& value);

// Runs every node in one flattened level, in order, feeding each result
// to the nodes after it.
class TIDEGRAPH_API SequentialProcessor : public Processor {
public:
    explicit SequentialProcessor(ProcessorOptions options = {});

    const char* name() const override { return "sequential"; }
    Schedule compile(const Graph& graph, const std::vector<NodeId>& inputs) const override;
    ValueMap execute(const Graph& graph, const Schedule& schedule,
                     const ValueMap& current, const InputValues& inputs) const override;
};

// Runs each level on the worker pool against a snapshot taken before the
// level started, then merges the level's results before the next one.
class TIDEGRAPH_API ParallelProcessor : public Processor {
public:
    explicit ParallelProcessor(unsigned int num_workers = 0, ProcessorOptions options = {});
    ~ParallelProcessor() override;

    const char* name() const override { return "parallel"; }
    Schedule compile(const Graph& graph, const std::vector<NodeId>& inputs) const override;
    ValueMap execute(const Graph& graph, const Schedule& schedule,
                     const ValueMap& current, const InputValues& inputs) const override;

    unsigned int num_workers() const;

private:
    std::unique_ptr<WorkerPool> pool_;
};

}  // namespace tg
