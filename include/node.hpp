#pragma once
#include "tg_types.hpp"

#include <atomic>
#include <memory>

namespace tg {

enum class NodeKind { Input, Compute };

/**
 * @brief Hands out node identities.
 *
 * The global generator makes identities process-unique. Tests may build
 * their own generator to get a predictable sequence (and, deliberately,
 * to provoke identity collisions).
 */
class IdGenerator {
public:
    explicit IdGenerator(NodeId first = 1) : next_(first) {}

    NodeId next() { return next_.fetch_add(1, std::memory_order_relaxed); }

    static IdGenerator& global();

private:
    std::atomic<NodeId> next_;
};

class Node;
using NodePtr = std::shared_ptr<const Node>;
// local source label -> referenced node (shared, never owned exclusively)
using SourceMap = std::map<std::string, NodePtr>;

/**
 * @class Node
 * @brief An immutable vertex of the computation graph.
 *
 * Two variants share this class:
 * - Input: identity only. Its value exists only for the batch that
 *   supplies it and is never stored in a context.
 * - Compute: identity, a non-empty map of local source labels to source
 *   nodes, and a handler `(previous, {label -> source value}) -> value`.
 *
 * Nodes are created through make_input_node / make_compute_node and are
 * always held as NodePtr, so a node referenced by several dependants is
 * the same object for all of them.
 */
class TIDEGRAPH_API Node {
public:
    NodeId id() const { return id_; }
    NodeKind kind() const { return kind_; }
    bool is_input() const { return kind_ == NodeKind::Input; }

    const SourceMap& sources() const { return sources_; }
    const Handler& handler() const { return handler_; }

private:
    Node(NodeId id, NodeKind kind, SourceMap sources, Handler handler);

    friend NodePtr make_input_node(IdGenerator& ids);
    friend NodePtr make_compute_node(SourceMap sources, Handler handler, IdGenerator& ids);

    NodeId id_;
    NodeKind kind_;
    SourceMap sources_;
    Handler handler_;
};

TIDEGRAPH_API NodePtr make_input_node(IdGenerator& ids = IdGenerator::global());

// Throws ConfigurationError when `sources` is empty, holds a null node,
// or `handler` is empty.
TIDEGRAPH_API NodePtr make_compute_node(SourceMap sources, Handler handler,
                                        IdGenerator& ids = IdGenerator::global());

} // namespace tg
