#include "node.hpp"

namespace tg {

IdGenerator& IdGenerator::global() {
    static IdGenerator inst;
    return inst;
}

Node::Node(NodeId id, NodeKind kind, SourceMap sources, Handler handler)
    : id_(id), kind_(kind), sources_(std::move(sources)), handler_(std::move(handler)) {}

NodePtr make_input_node(IdGenerator& ids) {
    return NodePtr(new Node(ids.next(), NodeKind::Input, {}, nullptr));
}

NodePtr make_compute_node(SourceMap sources, Handler handler, IdGenerator& ids) {
    if (sources.empty()) {
        throw ConfigurationError(GraphErrc::EmptySources,
                                 "A compute node needs at least one source.");
    }
    for (const auto& [label, source] : sources) {
        if (!source) {
            throw ConfigurationError(GraphErrc::NotFound,
                                     "Source '" + label + "' refers to a null node.");
        }
    }
    if (!handler) {
        throw ConfigurationError(GraphErrc::InvalidParameter,
                                 "A compute node needs a handler.");
    }
    return NodePtr(new Node(ids.next(), NodeKind::Compute, std::move(sources), std::move(handler)));
}

} // namespace tg
