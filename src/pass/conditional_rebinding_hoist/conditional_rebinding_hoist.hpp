#pragma once

#include <vector>

#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"

namespace pass {

/**
 * @brief Makes conditionals yield the names their branches rebind.
 *
 * A non-terminal `if`/`case` whose branches rebind names that are bound
 * before it and read after it becomes `x = if ...` (or `{x, y} = case ...`).
 * Each branch ends by reading the rebound names; a missing else reads them
 * unchanged. Conditionals nested inside a branch are rewritten the same way
 * so the rebinding reaches the outer one.
 */
class ConditionalRebindingHoist : public analysis::ScopedRewriter<ConditionalRebindingHoist> {
public:
    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    std::vector<ir::NodePtr> rewrite_statements(std::vector<ir::NodePtr> stmts);
};

} // namespace pass
