// FILE: cli/graph_cli.cpp
#include <getopt.h>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cli/print_cli_help.hpp"
#include "engine_config.hpp"
#include "graph_model.hpp"
#include "kernel/context.hpp"
#include "kernel/ops.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "kernel/services/graph_io_service.hpp"
#include "kernel/services/graph_traversal_service.hpp"

using namespace tg;

namespace {

void print_schedule(const Graph& graph, const InputLabels& labels, const Schedule& schedule) {
    std::cout << "Schedule for {";
    bool first = true;
    for (const auto& label : labels) {
        if (!first) std::cout << ", ";
        std::cout << label;
        first = false;
    }
    std::cout << "}:\n";
    for (size_t i = 0; i < schedule.size(); ++i) {
        std::cout << "  level " << i << ":";
        for (NodeId id : schedule[i]) std::cout << " " << graph.describe(id);
        std::cout << "\n";
    }
}

void print_values(size_t batch_index, const Context& ctx) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "batch" << YAML::Value << batch_index;
    out << YAML::Key << "values" << YAML::Value << YAML::BeginMap;
    for (const auto& [label, value] : ctx.values()) {
        out << YAML::Key << label << YAML::Value << value;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    std::cout << "---\n" << out.c_str() << "\n";
}

void print_events(GraphEventService& events) {
    for (const auto& [name, t] : events.totals()) {
        std::cout << "  [timer] " << name << ": " << t.count << " run(s), "
                  << t.total_ms << " ms\n";
    }
    for (const auto& ev : events.drain()) {
        std::cout << "  [event] batch " << ev.batch << " " << ev.name << " (#" << ev.id
                  << ", " << ev.source << ", thread " << ev.thread << "): "
                  << ev.elapsed_ms << " ms\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    EngineConfig config;
    std::string custom_config_path;
    std::string graph_path;
    std::string batches_path;
    bool force_parallel = false;
    std::optional<unsigned int> threads;
    bool show_tree = false;
    bool show_schedule = false;
    bool show_timer = false;
    bool verbose = false;

    const char* const short_opts = "hg:b:Pj:pstv";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"graph", required_argument, nullptr, 'g'},
        {"batches", required_argument, nullptr, 'b'}, {"parallel", no_argument, nullptr, 'P'},
        {"threads", required_argument, nullptr, 'j'}, {"print", no_argument, nullptr, 'p'},
        {"schedule", no_argument, nullptr, 's'}, {"timer", no_argument, nullptr, 't'},
        {"verbose", no_argument, nullptr, 'v'}, {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(); return 0;
        case 'g': graph_path = optarg; break;
        case 'b': batches_path = optarg; break;
        case 'P': force_parallel = true; break;
        case 'j':
            try {
                threads = static_cast<unsigned int>(std::stoul(optarg));
            } catch (const std::exception&) {
                std::cerr << "Invalid thread count '" << optarg << "'.\n";
                return 1;
            }
            break;
        case 'p': show_tree = true; break;
        case 's': show_schedule = true; break;
        case 't': show_timer = true; break;
        case 'v': verbose = true; break;
        case 2001: custom_config_path = optarg; break;
        default: print_cli_help(); return 1;
        }
    }

    if (graph_path.empty()) {
        std::cerr << "No graph given; use -g <graph.yaml>.\n";
        print_cli_help();
        return 1;
    }

    std::string config_to_load = custom_config_path.empty() ? kDefaultConfigPath : custom_config_path;
    load_or_create_config(config_to_load, config);
    if (force_parallel) config.processor = "parallel";
    if (threads) config.worker_threads = *threads;
    if (verbose) config.quiet = false;
    if (show_timer) config.record_events = true;

    ops::register_builtin();

    try {
        GraphIOService io;
        Graph graph = io.load(graph_path);
        if (!config.quiet) {
            std::cout << "Loaded graph from " << graph_path << " ("
                      << graph.nodes().size() << " nodes)\n";
        }
        if (show_tree) {
            GraphTraversalService().print_dependency_tree(graph, std::cout);
        }

        auto events = std::make_shared<GraphEventService>();
        Context ctx = make_configured_context(std::move(graph), config, events);

        std::vector<Batch> batches;
        if (!batches_path.empty()) batches = io.load_batches(batches_path);

        for (size_t i = 0; i < batches.size(); ++i) {
            if (show_schedule) {
                InputLabels labels;
                for (const auto& entry : batches[i]) labels.insert(entry.first);
                ctx = ctx.precompile(labels);
                print_schedule(ctx.graph(), labels, *ctx.compilations().find(labels));
            }
            ctx = ctx.process(batches[i]);
            print_values(i + 1, ctx);
            if (show_timer) print_events(*events);
        }
    } catch (const ComputationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        for (const auto& path : e.paths()) {
            std::cerr << "  path: " << format_path(path) << "\n";
        }
        try {
            e.rethrow_cause();
        } catch (const std::exception& cause) {
            std::cerr << "  cause: " << cause.what() << "\n";
        } catch (...) {
            std::cerr << "  cause: non-standard exception\n";
        }
        return 3;
    } catch (const GraphError& e) {
        std::cerr << "Error (" << to_string(e.code()) << "): " << e.what() << "\n";
        return 2;
    }

    return 0;
}
