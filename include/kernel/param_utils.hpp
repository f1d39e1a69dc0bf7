#pragma once
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "tg_types.hpp"

namespace tg {

/**
 * @brief Reads a scalar string field of a graph file entry.
 * @return std::nullopt when the entry is not a map, the key is missing,
 *         or the value is not a scalar.
 */
inline std::optional<std::string> read_str(const YAML::Node& n, const std::string& key) {
    if (!n || !n.IsMap() || !n[key] || !n[key].IsScalar()) return std::nullopt;
    return n[key].Scalar();
}

inline std::string read_str_or(const YAML::Node& n, const std::string& key, const std::string& defv) {
    auto v = read_str(n, key);
    return v ? *v : defv;
}

// A present but non-boolean value is an InvalidYaml error, never a default.
inline bool read_flag(const YAML::Node& n, const std::string& key, bool defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<bool>();
    } catch (const YAML::Exception&) {
        throw GraphError(GraphErrc::InvalidYaml,
                         "Field '" + key + "' must be true or false.");
    }
}

// Op parameters: `op` names the operation in the error message.
inline int require_positive_int(const YAML::Node& params, const std::string& key, const std::string& op) {
    int v = 0;
    if (params && params.IsMap() && params[key]) {
        try {
            v = params[key].as<int>();
        } catch (const YAML::Exception&) {
            v = 0;
        }
    }
    if (v <= 0) {
        throw GraphError(GraphErrc::InvalidParameter,
                         op + " requires params." + key + " > 0");
    }
    return v;
}

} // namespace tg
