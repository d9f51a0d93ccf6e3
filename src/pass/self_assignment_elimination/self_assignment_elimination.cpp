#include "self_assignment_elimination.hpp"

#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

bool is_self_assignment(const ir::NodePtr& stmt) {
    auto match = as_simple_match(stmt);
    if (!match) {
        return false;
    }
    auto source = ir::helper::var_name(match->value);
    return source && *source == match->name;
}

} // namespace

ir::NodePtr SelfAssignmentElimination::run(const ir::NodePtr& root) {
    auto result = ir::transform_statement_lists(root, &SelfAssignmentElimination::eliminate);
    // a lone `x = x` body is a terminal statement outside any list
    return ir::transform_bottom_up(result, [](const ir::NodePtr& node) -> ir::NodePtr {
        auto* def = node->as<ir::Def>();
        if (!def || !is_self_assignment(def->body)) {
            return node;
        }
        auto body = def->body->as<ir::Match>()->value;
        return ir::helper::rebuild(node, ir::Def{def->name, def->params, def->guard, body, def->is_private});
    });
}

std::vector<ir::NodePtr> SelfAssignmentElimination::eliminate(std::vector<ir::NodePtr> stmts) {
    std::vector<ir::NodePtr> out;
    out.reserve(stmts.size());
    for (size_t i = 0; i < stmts.size(); ++i) {
        if (!is_self_assignment(stmts[i])) {
            out.push_back(stmts[i]);
            continue;
        }
        if (i + 1 == stmts.size()) {
            out.push_back(stmts[i]->as<ir::Match>()->value);
        }
    }
    return out;
}

} // namespace pass
