#include "liveness.hpp"

#include <initializer_list>

#include "analysis/rename.hpp"
#include "analysis/scope_walker.hpp"
#include "analysis/usage_index.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

analysis::NameSet reads_of(std::initializer_list<ir::NodePtr> nodes) {
    analysis::NameSet out;
    for (const auto& node : nodes) {
        for (const auto& name : analysis::referenced_names(node)) {
            out.insert(name);
        }
    }
    return out;
}

analysis::NameSet joined(analysis::NameSet a, const analysis::NameSet& b) {
    a.insert(b.begin(), b.end());
    return a;
}

} // namespace

ir::PatternPtr BindingUnderscorer::underscore_unused(const ir::PatternPtr& pattern, const analysis::NameSet& keep) {
    auto result = pattern;
    for (const auto& name : analysis::bound_names(pattern)) {
        if (ir::helper::is_underscored(name) || keep.count(name)) {
            continue;
        }
        result = analysis::rename_binder(result, name, ir::helper::underscore(name));
    }
    return result;
}

ir::NodePtr BindingUnderscorer::process(const ir::NodePtr& node, const analysis::NameSet& live) {
    if (!node) {
        return node;
    }
    if (auto* block = node->as<ir::Block>()) {
        return process_block(node, block->stmts, live);
    }
    if (auto* module = node->as<ir::Module>()) {
        bool changed = false;
        std::vector<ir::NodePtr> body;
        for (const auto& item : module->body) {
            auto rewritten = process(item, {});
            changed = changed || rewritten != item;
            body.push_back(std::move(rewritten));
        }
        return changed ? ir::helper::rebuild(node, ir::Module{module->name, std::move(body)}) : node;
    }
    auto rewritten = ir::map_children(node, [&](const ir::NodePtr& child) {
        // function bodies do not see the liveness of their surroundings
        bool fresh = node->is<ir::Def>() || node->is<ir::Fn>();
        return process(child, fresh ? analysis::NameSet{} : live);
    });
    if (mode_ == Mode::AllBindings) {
        rewritten = process_binders(rewritten);
    }
    return rewritten;
}

ir::NodePtr BindingUnderscorer::process_block(const ir::NodePtr& node, const std::vector<ir::NodePtr>& stmts,
                                              const analysis::NameSet& live_after) {
    auto index = analysis::UsageIndex::build(stmts);
    std::vector<ir::NodePtr> out(stmts.size());
    auto live = live_after;
    bool changed = false;
    for (size_t i = stmts.size(); i-- > 0;) {
        out[i] = process_statement(stmts[i], live, i + 1 == stmts.size());
        changed = changed || out[i] != stmts[i];
        // a rebinding ends the life of the value it replaces
        if (auto* match = stmts[i]->as<ir::Match>()) {
            for (const auto& name : analysis::bound_names(match->pattern)) {
                live.erase(name);
            }
        }
        const auto& reads = index.reads_of(i);
        live.insert(reads.begin(), reads.end());
    }
    if (!changed) {
        return node;
    }
    return ir::helper::rebuild(node, ir::Block{std::move(out)});
}

ir::NodePtr BindingUnderscorer::process_statement(const ir::NodePtr& stmt, const analysis::NameSet& live,
                                                  bool terminal) {
    auto* match = stmt->as<ir::Match>();
    if (!match) {
        return process(stmt, live);
    }
    auto value = process(match->value, live);
    auto pattern = match->pattern;
    bool eligible = mode_ == Mode::AllBindings || is_aggregation(match->value, options_);
    if (!terminal && eligible) {
        pattern = underscore_unused(pattern, live);
    }
    if (value == match->value && pattern == match->pattern) {
        return stmt;
    }
    return ir::helper::rebuild(stmt, ir::Match{pattern, value});
}

ir::NodePtr BindingUnderscorer::process_binders(const ir::NodePtr& node) {
    if (auto* def = node->as<ir::Def>()) {
        auto keep = reads_of({def->guard, def->body});
        bool changed = false;
        std::vector<ir::PatternPtr> params;
        for (const auto& param : def->params) {
            params.push_back(underscore_unused(param, keep));
            changed = changed || params.back() != param;
        }
        if (!changed) {
            return node;
        }
        return ir::helper::rebuild(node, ir::Def{def->name, std::move(params), def->guard, def->body, def->is_private});
    }
    if (auto* fn = node->as<ir::Fn>()) {
        bool changed = false;
        std::vector<ir::FnClause> clauses;
        for (const auto& clause : fn->clauses) {
            auto keep = reads_of({clause.guard, clause.body});
            std::vector<ir::PatternPtr> params;
            for (const auto& param : clause.params) {
                params.push_back(underscore_unused(param, keep));
                changed = changed || params.back() != param;
            }
            clauses.push_back(ir::FnClause{std::move(params), clause.guard, clause.body});
        }
        return changed ? ir::helper::rebuild(node, ir::Fn{std::move(clauses)}) : node;
    }
    if (auto* generators = node->as<ir::For>()) {
        auto keep = reads_of({generators->body});
        for (const auto& filter : generators->filters) {
            keep = joined(std::move(keep), analysis::referenced_names(filter));
        }
        for (const auto& generator : generators->generators) {
            keep = joined(std::move(keep), analysis::referenced_names(generator.source));
        }
        bool changed = false;
        std::vector<ir::Generator> rewritten;
        for (const auto& generator : generators->generators) {
            auto pattern = underscore_unused(generator.pattern, keep);
            changed = changed || pattern != generator.pattern;
            rewritten.push_back(ir::Generator{pattern, generator.source});
        }
        if (!changed) {
            return node;
        }
        return ir::helper::rebuild(node, ir::For{std::move(rewritten), generators->filters, generators->body});
    }

    // case, receive, rescue and with-else clauses
    auto underscore_clauses = [&](const std::vector<ir::Clause>& clauses, bool& changed) {
        std::vector<ir::Clause> out;
        for (const auto& clause : clauses) {
            auto pattern = underscore_unused(clause.pattern, reads_of({clause.guard, clause.body}));
            changed = changed || pattern != clause.pattern;
            out.push_back(ir::Clause{pattern, clause.guard, clause.body});
        }
        return out;
    };
    bool changed = false;
    if (auto* select = node->as<ir::Case>()) {
        auto clauses = underscore_clauses(select->clauses, changed);
        return changed ? ir::helper::rebuild(node, ir::Case{select->subject, std::move(clauses)}) : node;
    }
    if (auto* receive = node->as<ir::Receive>()) {
        auto clauses = underscore_clauses(receive->clauses, changed);
        return changed ? ir::helper::rebuild(node, ir::Receive{std::move(clauses), receive->timeout, receive->after_body})
                       : node;
    }
    if (auto* attempt = node->as<ir::Try>()) {
        auto clauses = underscore_clauses(attempt->rescue_clauses, changed);
        return changed ? ir::helper::rebuild(node, ir::Try{attempt->body, std::move(clauses), attempt->after}) : node;
    }
    if (auto* with = node->as<ir::With>()) {
        auto clauses = underscore_clauses(with->else_clauses, changed);
        // a generator binder is live when a later generator or the body reads it
        std::vector<ir::Generator> generators = with->clauses;
        auto keep = reads_of({with->body});
        for (size_t i = generators.size(); i-- > 0;) {
            auto pattern = underscore_unused(generators[i].pattern, keep);
            changed = changed || pattern != generators[i].pattern;
            keep = joined(std::move(keep), analysis::referenced_names(generators[i].source));
            generators[i] = ir::Generator{pattern, generators[i].source};
        }
        return changed ? ir::helper::rebuild(node, ir::With{std::move(generators), with->body, std::move(clauses)})
                       : node;
    }
    return node;
}

} // namespace pass
