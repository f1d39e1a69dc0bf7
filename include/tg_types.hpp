#pragma once
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tg {
namespace fs = std::filesystem;

// Node values are dynamic documents. A null node stands for "absent".
using Value = YAML::Node;

using NodeId = std::uint64_t;
using LabelPath = std::vector<std::string>;

// local source label -> current value of that source
using SourceValues = std::map<std::string, Value>;
// (previous value, source values) -> new value
using Handler = std::function<Value(const Value&, const SourceValues&)>;

using ValueMap = std::unordered_map<NodeId, Value>;
using InputValues = std::unordered_map<NodeId, Value>;

// A batch of mutually independent nodes; a schedule runs levels in order.
using Level = std::vector<NodeId>;
using Schedule = std::vector<Level>;
using Adjacency = std::unordered_map<NodeId, std::unordered_set<NodeId>>;

#if defined(_WIN32)
    #if defined(TIDEGRAPH_LIB_BUILD)
        #define TIDEGRAPH_API __declspec(dllexport)
    #else
        #define TIDEGRAPH_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(TIDEGRAPH_LIB_BUILD)
        #define TIDEGRAPH_API __attribute__((visibility("default")))
    #else
        #define TIDEGRAPH_API
    #endif
#endif

enum class GraphErrc {
    Unknown = 1, NotFound, Cycle, DuplicateLabel, IdentityCollision,
    EmptySources, WrongNodeKind, InvalidYaml, Io, NoOperation,
    InvalidParameter, ComputeError,
};

const char* to_string(GraphErrc code);

struct TIDEGRAPH_API GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

// Caller misuse, detected before any handler runs.
struct TIDEGRAPH_API ConfigurationError : public GraphError {
    ConfigurationError(GraphErrc code, const std::string& what)
        : GraphError(code, what) {}
};

// Graph assembly would break acyclicity or node identity.
struct TIDEGRAPH_API StructuralError : public GraphError {
    StructuralError(GraphErrc code, const std::string& what)
        : GraphError(code, what) {}
};

/**
 * @brief A node handler failed during processing.
 *
 * Carries every label path from a labelled ancestor down to the failing
 * node, and the original fault as the cause.
 */
class TIDEGRAPH_API ComputationError : public GraphError {
public:
    ComputationError(NodeId node, std::set<LabelPath> paths,
                     std::exception_ptr cause, const std::string& what)
        : GraphError(GraphErrc::ComputeError, what),
          node_(node), paths_(std::move(paths)), cause_(std::move(cause)) {}

    NodeId node() const noexcept { return node_; }
    const std::set<LabelPath>& paths() const noexcept { return paths_; }
    std::exception_ptr cause() const noexcept { return cause_; }
    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    NodeId node_;
    std::set<LabelPath> paths_;
    std::exception_ptr cause_;
};

std::string format_path(const LabelPath& path);

// Builds a handler from the static parameters of a graph file entry.
using HandlerFactory = std::function<Handler(const YAML::Node& params)>;

class OpRegistry {
public:
    static OpRegistry& instance();

    void register_op(const std::string& type, const std::string& subtype, HandlerFactory factory);
    std::optional<HandlerFactory> find(const std::string& type, const std::string& subtype) const;
    std::optional<HandlerFactory> find(const std::string& key) const;
    std::vector<std::string> get_keys() const;
    bool unregister_op(const std::string& type, const std::string& subtype);
private:
    std::map<std::string, HandlerFactory> table_;
};

inline std::string make_key(const std::string& type, const std::string& subtype) {
    return type + ":" + subtype;
}

} // namespace tg
