// Engine configuration YAML read/write implementation
#include "engine_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "kernel/context.hpp"
#include "kernel/processor.hpp"

namespace tg {

bool write_config_to_file(const EngineConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Tidegraph engine configuration.";
    root["processor"] = config.processor;
    root["worker_threads"] = config.worker_threads;
    root["quiet"] = config.quiet;
    root["record_events"] = config.record_events;
    root["precompile"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& labels : config.precompile) {
        root["precompile"].push_back(labels);
    }

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, EngineConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["processor"]) config.processor = root["processor"].as<std::string>();
            if (root["worker_threads"]) config.worker_threads = root["worker_threads"].as<unsigned int>();
            if (root["quiet"]) config.quiet = root["quiet"].as<bool>();
            if (root["record_events"]) config.record_events = root["record_events"].as<bool>();
            if (root["precompile"] && root["precompile"].IsSequence()) {
                config.precompile = root["precompile"].as<std::vector<std::vector<std::string>>>();
            }
            if (!config.quiet) {
                std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
            std::string loaded = config.loaded_config_path;
            config = EngineConfig{};
            config.loaded_config_path = loaded;
        }
    } else if (config_path == kDefaultConfigPath) {
        std::cout << "Configuration file '" << kDefaultConfigPath
                  << "' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, kDefaultConfigPath)) {
            config.loaded_config_path = fs::absolute(kDefaultConfigPath).string();
        } else {
            std::cerr << "Warning: Could not write default config to '"
                      << kDefaultConfigPath << "'." << std::endl;
        }
    }
}

std::shared_ptr<const Processor> make_processor(const EngineConfig& config,
                                                std::shared_ptr<GraphEventService> events) {
    ProcessorOptions options;
    options.quiet = config.quiet;
    if (config.record_events) {
        options.events = events ? std::move(events) : std::make_shared<GraphEventService>();
    }
    if (config.processor == "sequential") {
        return std::make_shared<SequentialProcessor>(options);
    }
    if (config.processor == "parallel") {
        return std::make_shared<ParallelProcessor>(config.worker_threads, options);
    }
    throw ConfigurationError(GraphErrc::InvalidParameter,
                             "Unknown processor '" + config.processor +
                                 "' (expected 'sequential' or 'parallel').");
}

Context make_configured_context(Graph graph, const EngineConfig& config,
                                std::shared_ptr<GraphEventService> events) {
    Context ctx(std::move(graph), make_processor(config, std::move(events)));
    for (const auto& labels : config.precompile) {
        ctx = ctx.precompile(InputLabels(labels.begin(), labels.end()));
    }
    return ctx;
}

} // namespace tg
