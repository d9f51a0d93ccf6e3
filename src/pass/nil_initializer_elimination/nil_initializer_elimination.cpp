#include "nil_initializer_elimination.hpp"

#include <string>
#include <unordered_map>

#include "analysis/scope_walker.hpp"
#include "analysis/usage_index.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

ir::NodePtr NilInitializerElimination::run(const ir::NodePtr& root) {
    return ir::transform_statement_lists(root, &NilInitializerElimination::eliminate);
}

std::vector<ir::NodePtr> NilInitializerElimination::eliminate(std::vector<ir::NodePtr> stmts) {
    if (stmts.size() < 2) {
        return stmts;
    }
    auto index = analysis::UsageIndex::build(stmts);

    // One backward scan: a nil initializer is dead when the next statement
    // touching its name rebinds it without reading it first.
    std::vector<bool> dead(stmts.size(), false);
    std::unordered_map<std::string, size_t> next_read;
    std::unordered_map<std::string, size_t> next_rebind;
    for (size_t i = stmts.size(); i-- > 0;) {
        auto init = i + 1 < stmts.size() ? as_simple_match(stmts[i]) : std::nullopt;
        if (init && ir::helper::is_nil(init->value) && !analysis::is_wildcard_name(init->name)) {
            auto rebind = next_rebind.find(init->name);
            auto read = next_read.find(init->name);
            dead[i] = rebind != next_rebind.end() && (read == next_read.end() || rebind->second < read->second);
        }
        for (const auto& name : index.reads_of(i)) {
            next_read[name] = i;
        }
        if (auto* match = stmts[i]->as<ir::Match>()) {
            for (const auto& name : analysis::bound_names(match->pattern)) {
                next_rebind[name] = i;
            }
        }
    }

    std::vector<ir::NodePtr> out;
    out.reserve(stmts.size());
    for (size_t i = 0; i < stmts.size(); ++i) {
        if (!dead[i]) {
            out.push_back(stmts[i]);
        }
    }
    return out;
}

} // namespace pass
