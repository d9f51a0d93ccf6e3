#include "dead_sentinel_elimination.hpp"

#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

namespace {

bool is_dead(const ir::NodePtr& stmt) {
    if (stmt->meta.early_return) {
        return false;
    }
    if (ir::helper::is_pure_literal(stmt)) {
        return true;
    }
    return stmt->meta.sentinel && stmt->is<ir::Var>();
}

} // namespace

ir::NodePtr DeadSentinelElimination::run(const ir::NodePtr& root) {
    return ir::transform_statement_lists(root, &DeadSentinelElimination::eliminate);
}

std::vector<ir::NodePtr> DeadSentinelElimination::eliminate(std::vector<ir::NodePtr> stmts) {
    std::vector<ir::NodePtr> out;
    out.reserve(stmts.size());
    for (size_t i = 0; i < stmts.size(); ++i) {
        if (i + 1 < stmts.size() && is_dead(stmts[i])) {
            continue;
        }
        out.push_back(stmts[i]);
    }
    return out;
}

} // namespace pass
