#include "underscore_promotion.hpp"

#include <algorithm>
#include <unordered_map>

#include "analysis/rename.hpp"
#include "analysis/scope_walker.hpp"
#include "analysis/usage_index.hpp"
#include "ir/helper.hpp"

namespace pass {

bool UnderscorePromotion::promote(Site& site, const analysis::NameSet& enclosing) {
    auto binders = analysis::bound_names(site.patterns);
    auto reads = analysis::referenced_names(site.body);
    for (const auto& name : analysis::referenced_names(site.guard)) {
        reads.insert(name);
    }
    auto declared = analysis::declared_in_subtree(site.body);

    bool changed = false;
    for (const auto& binder : binders) {
        if (!ir::helper::is_underscored(binder) || analysis::is_wildcard_name(binder)) {
            continue;
        }
        auto bare = ir::helper::strip_underscore(binder);
        bool taken = enclosing.count(bare) || declared.count(bare) ||
                     std::find(binders.begin(), binders.end(), bare) != binders.end();
        if (bare.empty() || !reads.count(bare) || taken) {
            continue;
        }
        for (auto& pattern : site.patterns) {
            pattern = analysis::rename_binder(pattern, binder, bare);
        }
        site.guard = analysis::rename_references(site.guard, binder, bare);
        site.body = analysis::rename_references(site.body, binder, bare);
        changed = true;
    }
    return changed;
}

ir::Clause UnderscorePromotion::visit_clause(const ir::Clause& clause) {
    auto enclosing = scope().visible();
    auto visited = Base::visit_clause(clause);
    Site site{{visited.pattern}, visited.guard, visited.body};
    if (!promote(site, enclosing)) {
        return visited;
    }
    return ir::Clause{site.patterns.front(), site.guard, site.body};
}

ir::FnClause UnderscorePromotion::visit_fn_clause(const ir::FnClause& clause) {
    auto enclosing = scope().visible();
    auto visited = Base::visit_fn_clause(clause);
    Site site{visited.params, visited.guard, visited.body};
    if (!promote(site, enclosing)) {
        return visited;
    }
    return ir::FnClause{site.patterns, site.guard, site.body};
}

ir::NodePtr UnderscorePromotion::rewrite(const ir::Def& def, const ir::NodePtr& self) {
    auto node = rewrite_children(def, self);
    const auto& visited = ir::helper::get_def(node);
    Site site{visited.params, visited.guard, visited.body};
    if (!promote(site, {})) {
        return node;
    }
    return ir::helper::rebuild(node, ir::Def{visited.name, site.patterns, site.guard, site.body, visited.is_private});
}

std::vector<ir::NodePtr> UnderscorePromotion::rewrite_statements(std::vector<ir::NodePtr> stmts) {
    if (stmts.size() < 2) {
        return stmts;
    }
    auto index = analysis::UsageIndex::build(stmts);
    // last statement declaring each name anywhere in its subtree
    std::unordered_map<std::string, size_t> last_declared;
    for (size_t j = 0; j < stmts.size(); ++j) {
        for (const auto& name : analysis::declared_in_subtree(stmts[j])) {
            last_declared[name] = j;
        }
    }

    for (size_t i = 0; i + 1 < stmts.size(); ++i) {
        if (!stmts[i]->is<ir::Match>()) {
            continue;
        }
        for (const auto& binder : analysis::bound_names(stmts[i]->as<ir::Match>()->pattern)) {
            if (!ir::helper::is_underscored(binder) || analysis::is_wildcard_name(binder)) {
                continue;
            }
            auto bare = ir::helper::strip_underscore(binder);
            if (bare.empty() || scope().lookup(bare) || !index.used_from(i + 1, bare)) {
                continue;
            }
            if (auto later = last_declared.find(bare); later != last_declared.end() && later->second > i) {
                continue;
            }
            auto* current = stmts[i]->as<ir::Match>();
            stmts[i] = ir::helper::rebuild(
                stmts[i], ir::Match{analysis::rename_binder(current->pattern, binder, bare), current->value});
            for (size_t j = i + 1; j < stmts.size(); ++j) {
                stmts[j] = analysis::rename_references(stmts[j], binder, bare);
            }
            scope().define(bare);
        }
    }
    return stmts;
}

} // namespace pass
