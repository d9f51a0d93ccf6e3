#include "early_return_reconstruction.hpp"

#include "analysis/scope_walker.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

bool branches_return(const ir::NodePtr& stmt) {
    if (auto* branch = stmt->as<ir::If>()) {
        return contains_early_return(branch->then_branch) || contains_early_return(branch->else_branch);
    }
    if (auto* select = stmt->as<ir::Case>()) {
        for (const auto& clause : select->clauses) {
            if (contains_early_return(clause.body)) {
                return true;
            }
        }
    }
    return false;
}

// A clause binder that the continuation reads would capture it.
bool clause_binders_shadow(const ir::Case& select, const std::vector<ir::NodePtr>& rest) {
    for (const auto& clause : select.clauses) {
        for (const auto& name : analysis::bound_names(clause.pattern)) {
            for (const auto& stmt : rest) {
                if (analysis::mentions(stmt, name)) {
                    return true;
                }
            }
        }
    }
    return false;
}

} // namespace

ir::NodePtr EarlyReturnReconstruction::run(const ir::NodePtr& root) {
    return ir::transform_statement_lists(root, &EarlyReturnReconstruction::reconstruct);
}

ir::NodePtr EarlyReturnReconstruction::continue_branch(const ir::NodePtr& branch,
                                                       const std::vector<ir::NodePtr>& rest,
                                                       span::Span fallback) {
    if (branch && ends_with_early_return(branch)) {
        return branch;
    }
    auto stmts = ir::helper::statements_of(branch);
    stmts.insert(stmts.end(), rest.begin(), rest.end());
    auto rebuilt = reconstruct(std::move(stmts));
    return ir::helper::from_statements(std::move(rebuilt), branch ? branch->span : fallback);
}

std::vector<ir::NodePtr> EarlyReturnReconstruction::reconstruct(std::vector<ir::NodePtr> stmts) {
    for (size_t i = 0; i + 1 < stmts.size(); ++i) {
        const auto stmt = stmts[i];
        if (stmt->meta.early_return) {
            stmts.resize(i + 1);
            return stmts;
        }
        if (!branches_return(stmt)) {
            continue;
        }

        std::vector<ir::NodePtr> rest(stmts.begin() + static_cast<std::ptrdiff_t>(i) + 1, stmts.end());
        if (auto* select = stmt->as<ir::Case>(); select && clause_binders_shadow(*select, rest)) {
            continue;
        }
        auto rest_span = rest.front()->span;
        ir::NodePtr rebuilt;
        if (auto* branch = stmt->as<ir::If>()) {
            auto then_branch = continue_branch(branch->then_branch, rest, rest_span);
            auto else_branch = continue_branch(branch->else_branch, rest, rest_span);
            rebuilt = ir::helper::rebuild(stmt, ir::If{branch->condition, then_branch, else_branch});
        } else {
            auto& select = *stmt->as<ir::Case>();
            std::vector<ir::Clause> clauses;
            for (const auto& clause : select.clauses) {
                clauses.push_back(ir::Clause{clause.pattern, clause.guard, continue_branch(clause.body, rest, rest_span)});
            }
            rebuilt = ir::helper::rebuild(stmt, ir::Case{select.subject, std::move(clauses)});
        }
        stmts.resize(i);
        stmts.push_back(std::move(rebuilt));
        return stmts;
    }
    return stmts;
}

} // namespace pass
