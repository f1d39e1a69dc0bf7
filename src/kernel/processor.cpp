// Tidegraph kernel: sequential and level-parallel processors
#include "kernel/processor.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include "kernel/worker_pool.hpp"

namespace tg {

namespace {

Schedule drop_input_level(Schedule levels) {
    if (!levels.empty()) {
        levels.erase(levels.begin());
    }
    return levels;
}

}  // namespace

void store_value(ValueMap& values, NodeId node_id, const Value& value) {
    // YAML::Node::operator= writes through shared storage, which would
    // alter maps copied from this one.
    values.erase(node_id);
    values.emplace(node_id, value);
}

Value evaluate_node(const Graph& graph, NodeId node_id,
                    const ValueMap& running, const InputValues& inputs) {
    const Node& node = graph.node(node_id);
    if (node.is_input()) {
        throw GraphError(GraphErrc::WrongNodeKind,
                         "Node " + graph.describe(node_id) +
                             " is an input node and cannot be evaluated.");
    }

    SourceValues source_values;
    for (const auto& [local_label, source] : node.sources()) {
        // Sibling tasks of a level read the same stored nodes, and yaml-cpp
        // updates cached state even on const reads; each handler gets a copy.
        auto computed = running.find(source->id());
        if (computed != running.end()) {
            source_values.emplace(local_label, YAML::Clone(computed->second));
            continue;
        }
        auto supplied = inputs.find(source->id());
        source_values.emplace(local_label, supplied != inputs.end()
                                               ? YAML::Clone(supplied->second)
                                               : Value());
    }

    auto stored = running.find(node_id);
    const Value previous =
        stored != running.end() ? YAML::Clone(stored->second) : Value();

    try {
        return node.handler()(previous, source_values);
    } catch (const std::exception& e) {
        GraphTraversalService traversal;
        throw ComputationError(node_id, traversal.label_paths(graph, node_id),
                               std::current_exception(),
                               "Node " + graph.describe(node_id) +
                                   " failed: " + std::string(e.what()));
    } catch (...) {
        GraphTraversalService traversal;
        throw ComputationError(node_id, traversal.label_paths(graph, node_id),
                               std::current_exception(),
                               "Node " + graph.describe(node_id) +
                                   " failed: unknown exception");
    }
}

Processor::Processor(ProcessorOptions options) : options_(std::move(options)) {}

Value Processor::evaluate(const Graph& graph, NodeId node_id,
                          const ValueMap& running, const InputValues& inputs) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    if (!options_.quiet) {
        std::cout << "Computing node " << graph.describe(node_id) << " (" << name()
                  << ") on thread " << std::this_thread::get_id() << "..." << std::endl;
    }

    Value result = evaluate_node(graph, node_id, running, inputs);

    if (options_.events) {
        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end_time - start_time;
        options_.events->push(node_id, graph.describe(node_id), "computed", elapsed.count());
    }
    return result;
}

SequentialProcessor::SequentialProcessor(ProcessorOptions options)
    : Processor(std::move(options)) {}

Schedule SequentialProcessor::compile(const Graph& graph,
                                      const std::vector<NodeId>& inputs) const {
    Schedule levels = drop_input_level(traversal_.levels(graph, inputs));
    Level flat;
    for (const auto& level : levels) {
        flat.insert(flat.end(), level.begin(), level.end());
    }
    Schedule schedule;
    if (!flat.empty()) {
        schedule.push_back(std::move(flat));
    }
    return schedule;
}

ValueMap SequentialProcessor::execute(const Graph& graph, const Schedule& schedule,
                                      const ValueMap& current,
                                      const InputValues& inputs) const {
    if (events()) events()->begin_batch();
    ValueMap running = current;
    for (const auto& level : schedule) {
        for (NodeId node_id : level) {
            Value result = evaluate(graph, node_id, running, inputs);
            store_value(running, node_id, result);
        }
    }
    return running;
}

ParallelProcessor::ParallelProcessor(unsigned int num_workers, ProcessorOptions options)
    : Processor(std::move(options)), pool_(std::make_unique<WorkerPool>(num_workers)) {}

ParallelProcessor::~ParallelProcessor() = default;

unsigned int ParallelProcessor::num_workers() const {
    return pool_->size();
}

Schedule ParallelProcessor::compile(const Graph& graph,
                                    const std::vector<NodeId>& inputs) const {
    return drop_input_level(traversal_.levels(graph, inputs));
}

ValueMap ParallelProcessor::execute(const Graph& graph, const Schedule& schedule,
                                    const ValueMap& current,
                                    const InputValues& inputs) const {
    if (events()) events()->begin_batch();
    ValueMap running = current;
    for (const auto& level : schedule) {
        std::vector<Value> results(level.size());
        if (level.size() == 1) {
            results[0].reset(evaluate(graph, level[0], running, inputs));
        } else {
            const ValueMap& snapshot = running;
            std::vector<Task> tasks;
            tasks.reserve(level.size());
            for (size_t i = 0; i < level.size(); ++i) {
                tasks.push_back([this, &graph, &snapshot, &inputs, &level, &results, i] {
                    results[i].reset(evaluate(graph, level[i], snapshot, inputs));
                });
            }
            // Blocks until the whole level is done; rethrows the first failure.
            pool_->run_batch(std::move(tasks));
        }
        for (size_t i = 0; i < level.size(); ++i) {
            store_value(running, level[i], results[i]);
        }
    }
    return running;
}

}  // namespace tg
