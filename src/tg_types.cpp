#include "tg_types.hpp"
#include <sstream>

namespace tg {

const char* to_string(GraphErrc code) {
    switch (code) {
        case GraphErrc::Unknown: return "unknown";
        case GraphErrc::NotFound: return "not_found";
        case GraphErrc::Cycle: return "cycle";
        case GraphErrc::DuplicateLabel: return "duplicate_label";
        case GraphErrc::IdentityCollision: return "identity_collision";
        case GraphErrc::EmptySources: return "empty_sources";
        case GraphErrc::WrongNodeKind: return "wrong_node_kind";
        case GraphErrc::InvalidYaml: return "invalid_yaml";
        case GraphErrc::Io: return "io";
        case GraphErrc::NoOperation: return "no_operation";
        case GraphErrc::InvalidParameter: return "invalid_parameter";
        case GraphErrc::ComputeError: return "compute_error";
    }
    return "unknown";
}

std::string format_path(const LabelPath& path) {
    std::ostringstream os;
    os << "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) os << " ";
        os << ":" << path[i];
    }
    os << "]";
    return os.str();
}

OpRegistry& OpRegistry::instance() {
    static OpRegistry inst;
    return inst;
}

void OpRegistry::register_op(const std::string& type, const std::string& subtype, HandlerFactory factory) {
    table_[make_key(type, subtype)] = std::move(factory);
}

std::optional<HandlerFactory> OpRegistry::find(const std::string& type, const std::string& subtype) const {
    return find(make_key(type, subtype));
}

std::optional<HandlerFactory> OpRegistry::find(const std::string& key) const {
    auto it = table_.find(key);
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> OpRegistry::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    return keys;
}

bool OpRegistry::unregister_op(const std::string& type, const std::string& subtype) {
    return table_.erase(make_key(type, subtype)) > 0;
}

} // namespace tg
