#include "conditional_rebinding_hoist.hpp"

#include "analysis/scope_walker.hpp"
#include "analysis/usage_index.hpp"
#include "pass/common.hpp"

namespace pass {

std::vector<ir::NodePtr> ConditionalRebindingHoist::rewrite_statements(std::vector<ir::NodePtr> stmts) {
    if (stmts.size() < 2) {
        return stmts;
    }
    auto index = analysis::UsageIndex::build(stmts);
    analysis::NameSet bound_before;
    if (auto* parent = scope().get_parent()) {
        bound_before = parent->visible();
    }

    for (size_t i = 0; i + 1 < stmts.size(); ++i) {
        const auto& stmt = stmts[i];
        if (stmt->is<ir::If>() || stmt->is<ir::Case>()) {
            std::vector<std::string> names;
            for (const auto& name : branch_rebound_names({stmt})) {
                if (bound_before.count(name) && index.used_from(i + 1, name)) {
                    names.push_back(name);
                }
            }
            if (!names.empty()) {
                if (auto hoisted = yield_rebinds(stmt, names)) {
                    stmts[i] = *hoisted;
                }
            }
        }
        if (auto* match = stmts[i]->as<ir::Match>()) {
            for (const auto& name : analysis::bound_names(match->pattern)) {
                bound_before.insert(name);
            }
        }
    }
    return stmts;
}

} // namespace pass
