// Engine configuration definition and YAML I/O
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tg_types.hpp"

namespace tg {

class Context;
class Graph;
class GraphEventService;
class Processor;

struct EngineConfig {
    std::string loaded_config_path;
    std::string processor = "sequential";
    // 0 selects the hardware concurrency.
    unsigned int worker_threads = 0;
    bool quiet = true;
    bool record_events = false;
    // Input label sets compiled when a configured context is created.
    std::vector<std::vector<std::string>> precompile;
};

inline constexpr const char* kDefaultConfigPath = "tidegraph.yaml";

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "tidegraph.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, EngineConfig& config);

// Throws ConfigurationError(InvalidParameter) for an unknown processor name.
std::shared_ptr<const Processor> make_processor(const EngineConfig& config,
                                                std::shared_ptr<GraphEventService> events = nullptr);

// Builds a context with the configured processor and precompiles the
// configured label sets.
Context make_configured_context(Graph graph, const EngineConfig& config,
                                std::shared_ptr<GraphEventService> events = nullptr);

} // namespace tg
