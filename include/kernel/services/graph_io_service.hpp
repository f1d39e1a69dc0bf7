#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "graph_model.hpp"

namespace tg {

using Batch = std::map<std::string, Value>;

/**
 * @brief Builds graphs and input batches from YAML documents.
 *
 * A graph document is a sequence of entries:
 *
 *   - name: price
 *     type: input
 *   - name: window
 *     op: stream:latest_n
 *     params: {n: 2}
 *     sources: {input: price}
 *     hidden: true
 *
 * `type` defaults to compute. Every entry not marked hidden is labelled
 * with its name. Compute handlers come from OpRegistry.
 */
class GraphIOService {
 public:
  Graph load(const std::filesystem::path& yaml_path,
             IdGenerator& ids = IdGenerator::global()) const;
  Graph load_string(const std::string& yaml_text,
                    IdGenerator& ids = IdGenerator::global()) const;
  Graph from_yaml(const YAML::Node& root,
                  IdGenerator& ids = IdGenerator::global()) const;

  // A sequence of maps, label -> value.
  std::vector<Batch> load_batches(const std::filesystem::path& yaml_path) const;
  std::vector<Batch> batches_from_yaml(const YAML::Node& root) const;
};

}  // namespace tg
