#include "payload_binder_harmonization.hpp"

#include "pass/common.hpp"

namespace pass {

analysis::HarmonizePolicy PayloadBinderHarmonization::policy(std::vector<std::string> candidates) const {
    analysis::HarmonizePolicy result;
    result.allow_tie_break = true;
    result.tie_break_names = context_.options().tie_break_names;
    result.candidates = std::move(candidates);
    return result;
}

std::optional<analysis::BindingSite> PayloadBinderHarmonization::harmonize_site(const analysis::BindingSite& site,
                                                                                 const analysis::NameSet& enclosing,
                                                                                 std::vector<std::string> candidates) {
    auto result = analysis::harmonize(site, enclosing, policy(std::move(candidates)));
    if (result.action == analysis::HarmonizeAction::Renamed) {
        return result.site;
    }
    if (result.action == analysis::HarmonizeAction::Ambiguous) {
        std::string names;
        for (const auto& name : result.undefined) {
            names += names.empty() ? name : ", " + name;
        }
        auto span = site.patterns.empty() ? span::Span::invalid() : site.patterns.front()->span;
        context_.note("ambiguous-payload", "payload binder left unchanged; unbound names: " + names, span);
    }
    return std::nullopt;
}

ir::Clause PayloadBinderHarmonization::visit_clause(const ir::Clause& clause) {
    auto enclosing = scope().visible();
    auto visited = Base::visit_clause(clause);
    auto binder = tagged_payload_binder(visited.pattern);
    if (!binder) {
        return visited;
    }
    auto site = harmonize_site(analysis::BindingSite{{visited.pattern}, visited.guard, visited.body}, enclosing, {*binder});
    if (!site) {
        return visited;
    }
    return ir::Clause{site->patterns.front(), site->guard, site->body};
}

ir::FnClause PayloadBinderHarmonization::visit_fn_clause(const ir::FnClause& clause) {
    auto enclosing = scope().visible();
    auto visited = Base::visit_fn_clause(clause);
    std::vector<std::string> candidates;
    for (const auto& param : visited.params) {
        if (auto binder = tagged_payload_binder(param)) {
            candidates.push_back(*binder);
        }
    }
    if (candidates.empty()) {
        return visited;
    }
    auto site = harmonize_site(analysis::BindingSite{visited.params, visited.guard, visited.body}, enclosing,
                               std::move(candidates));
    if (!site) {
        return visited;
    }
    return ir::FnClause{site->patterns, site->guard, site->body};
}

} // namespace pass
