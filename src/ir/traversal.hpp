#pragma once

#include "ir/ir.hpp"

#include <functional>

namespace ir {

using NodeFn = std::function<NodePtr(const NodePtr&)>;
using PatternFn = std::function<PatternPtr(const PatternPtr&)>;

/**
 * @brief Rebuilds `node` with every direct child expression replaced by `fn(child)`.
 *
 * Patterns are not visited. Null children (absent else branch, guard, ...) are
 * passed through untouched. When every child comes back pointer-identical the
 * original node is returned, so unchanged subtrees stay shared.
 */
NodePtr map_children(const NodePtr& node, const NodeFn& fn);

// Same contract as map_children, for the patterns a node holds directly
// (match pattern, clause patterns, parameters, generator patterns).
NodePtr map_patterns(const NodePtr& node, const PatternFn& fn);

// Rebuilds a pattern with its direct sub-patterns mapped. Map-pattern keys
// are expressions and go through `key_fn` when one is given.
PatternPtr map_subpatterns(const PatternPtr& pattern, const PatternFn& fn, const NodeFn& key_fn = nullptr);

void for_each_child(const Node& node, const std::function<void(const NodePtr&)>& fn);
void for_each_pattern(const Node& node, const std::function<void(const PatternPtr&)>& fn);
void for_each_subpattern(const Pattern& pattern, const std::function<void(const PatternPtr&)>& fn);

// Children first, then `fn` on the rebuilt node.
NodePtr transform_bottom_up(const NodePtr& node, const NodeFn& fn);

// `fn` first, then the children of whatever it returned.
NodePtr transform_top_down(const NodePtr& node, const NodeFn& fn);

// Applies `fn` to every statement list in the tree (block bodies and module
// bodies), bottom-up. `fn` receives the already rewritten statements.
NodePtr transform_statement_lists(const NodePtr& node,
                                  const std::function<std::vector<NodePtr>(std::vector<NodePtr>)>& fn);

} // namespace ir
