#include "kernel/services/graph_io_service.hpp"

#include <yaml-cpp/yaml.h>

#include <functional>
#include <unordered_map>

#include "kernel/param_utils.hpp"

namespace tg {

namespace {

struct EntrySpec {
  std::string name;
  bool input = false;
  bool hidden = false;
  std::string op;
  YAML::Node params;
  std::map<std::string, std::string> sources;  // local label -> entry name
};

EntrySpec parse_entry(const YAML::Node& n) {
  if (!n.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "Graph entry is not a map.");
  }
  EntrySpec spec;
  spec.name = read_str_or(n, "name", "");
  if (spec.name.empty()) {
    throw GraphError(GraphErrc::InvalidYaml, "Graph entry without a name.");
  }
  std::string type = read_str_or(n, "type", "compute");
  if (type != "input" && type != "compute") {
    throw GraphError(GraphErrc::InvalidYaml,
                     "Entry '" + spec.name + "' has unknown type '" + type + "'.");
  }
  spec.input = type == "input";
  spec.hidden = read_flag(n, "hidden", false);
  if (spec.input) {
    return spec;
  }

  auto op = read_str(n, "op");
  if (!op) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "Compute entry '" + spec.name + "' has no op.");
  }
  spec.op = *op;
  spec.params = n["params"] ? YAML::Clone(n["params"]) : YAML::Node(YAML::NodeType::Map);
  const YAML::Node sources = n["sources"];
  if (!sources || !sources.IsMap() || sources.size() == 0) {
    throw ConfigurationError(GraphErrc::EmptySources,
                             "Entry '" + spec.name + "' needs a non-empty sources map.");
  }
  for (auto it = sources.begin(); it != sources.end(); ++it) {
    spec.sources[it->first.as<std::string>()] = it->second.as<std::string>();
  }
  return spec;
}

}  // namespace

Graph GraphIOService::load(const std::filesystem::path& yaml_path,
                           IdGenerator& ids) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path.string());
  } catch (const YAML::BadFile& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " +
                                        yaml_path.string() + ": " + e.what());
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml, "Failed to parse YAML file " +
                                                 yaml_path.string() + ": " + e.what());
  }
  return from_yaml(root, ids);
}

Graph GraphIOService::load_string(const std::string& yaml_text,
                                  IdGenerator& ids) const {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml,
                     std::string("Failed to parse graph YAML: ") + e.what());
  }
  return from_yaml(root, ids);
}

Graph GraphIOService::from_yaml(const YAML::Node& root, IdGenerator& ids) const {
  if (!root.IsSequence()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "YAML root is not a sequence of nodes.");
  }

  std::vector<EntrySpec> entries;
  std::unordered_map<std::string, size_t> index;
  try {
    for (const auto& n : root) {
      EntrySpec spec = parse_entry(n);
      if (index.count(spec.name)) {
        throw ConfigurationError(GraphErrc::DuplicateLabel,
                                 "Entry '" + spec.name + "' is defined twice.");
      }
      index[spec.name] = entries.size();
      entries.push_back(std::move(spec));
    }
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml,
                     std::string("Malformed graph entry: ") + e.what());
  }

  // Entry positions stand in for identities while checking the shape.
  Adjacency adjacency;
  for (size_t i = 0; i < entries.size(); ++i) {
    auto& targets = adjacency[i];
    for (const auto& [local_label, source_name] : entries[i].sources) {
      auto it = index.find(source_name);
      if (it == index.end()) {
        throw ConfigurationError(GraphErrc::NotFound,
                                 "Entry '" + entries[i].name + "' refers to unknown node '" +
                                     source_name + "' as '" + local_label + "'.");
      }
      targets.insert(it->second);
    }
  }
  for (size_t i = 0; i < entries.size(); ++i) {
    if (has_cycle_from(adjacency, i)) {
      throw StructuralError(GraphErrc::Cycle,
                            "Graph definition has a cycle through '" + entries[i].name + "'.");
    }
  }

  std::vector<NodePtr> built(entries.size());
  std::function<NodePtr(size_t)> build = [&](size_t i) -> NodePtr {
    if (built[i]) {
      return built[i];
    }
    const EntrySpec& spec = entries[i];
    if (spec.input) {
      built[i] = make_input_node(ids);
      return built[i];
    }
    auto factory = OpRegistry::instance().find(spec.op);
    if (!factory) {
      throw ConfigurationError(GraphErrc::NoOperation,
                               "No operation registered for '" + spec.op +
                                   "' (entry '" + spec.name + "').");
    }
    SourceMap sources;
    for (const auto& [local_label, source_name] : spec.sources) {
      sources[local_label] = build(index.at(source_name));
    }
    built[i] = make_compute_node(std::move(sources), (*factory)(spec.params), ids);
    return built[i];
  };

  Graph graph;
  for (size_t i = 0; i < entries.size(); ++i) {
    NodePtr node = build(i);
    if (!entries[i].hidden) {
      graph = graph.add(entries[i].name, node);
    }
  }
  return graph;
}

std::vector<Batch> GraphIOService::load_batches(const std::filesystem::path& yaml_path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path.string());
  } catch (const YAML::BadFile& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " +
                                        yaml_path.string() + ": " + e.what());
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml, "Failed to parse YAML file " +
                                                 yaml_path.string() + ": " + e.what());
  }
  return batches_from_yaml(root);
}

std::vector<Batch> GraphIOService::batches_from_yaml(const YAML::Node& root) const {
  if (!root.IsSequence()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "YAML root is not a sequence of input batches.");
  }
  std::vector<Batch> batches;
  batches.reserve(root.size());
  for (const auto& n : root) {
    if (!n.IsMap()) {
      throw GraphError(GraphErrc::InvalidYaml, "Input batch is not a map.");
    }
    Batch batch;
    for (auto it = n.begin(); it != n.end(); ++it) {
      batch.emplace(it->first.as<std::string>(), YAML::Clone(it->second));
    }
    batches.push_back(std::move(batch));
  }
  return batches;
}

}  // namespace tg
