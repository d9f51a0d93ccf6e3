#include "return_marker_cleanup.hpp"

#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "utils/debug_context.hpp"

namespace pass {

namespace {

std::vector<ir::Clause> clear_clauses(const std::vector<ir::Clause>& clauses, bool& changed,
                                      ir::NodePtr (*clear)(const ir::NodePtr&)) {
    std::vector<ir::Clause> out;
    out.reserve(clauses.size());
    for (const auto& clause : clauses) {
        auto body = clear(clause.body);
        changed = changed || body != clause.body;
        out.push_back(ir::Clause{clause.pattern, clause.guard, body});
    }
    return out;
}

} // namespace

ir::NodePtr ReturnMarkerCleanup::run(const ir::NodePtr& root) {
    auto result = clear_terminal(ir::transform_bottom_up(root, &ReturnMarkerCleanup::clear_bodies));
    report_leftovers(result);
    return result;
}

ir::NodePtr ReturnMarkerCleanup::clear_bodies(const ir::NodePtr& node) {
    if (auto* def = node->as<ir::Def>()) {
        auto body = clear_terminal(def->body);
        if (body == def->body) {
            return node;
        }
        return ir::helper::rebuild(node, ir::Def{def->name, def->params, def->guard, body, def->is_private});
    }
    if (auto* fn = node->as<ir::Fn>()) {
        bool changed = false;
        std::vector<ir::FnClause> clauses;
        for (const auto& clause : fn->clauses) {
            auto body = clear_terminal(clause.body);
            changed = changed || body != clause.body;
            clauses.push_back(ir::FnClause{clause.params, clause.guard, body});
        }
        if (!changed) {
            return node;
        }
        return ir::helper::rebuild(node, ir::Fn{std::move(clauses)});
    }
    return node;
}

ir::NodePtr ReturnMarkerCleanup::clear_terminal(const ir::NodePtr& node) {
    if (!node) {
        return node;
    }
    auto meta = node->meta;
    meta.early_return = false;
    bool changed = meta != node->meta;
    ir::NodePtr rebuilt = node;

    if (auto* block = node->as<ir::Block>(); block && !block->stmts.empty()) {
        auto last = clear_terminal(block->stmts.back());
        if (last != block->stmts.back()) {
            auto stmts = block->stmts;
            stmts.back() = last;
            rebuilt = ir::helper::rebuild(node, ir::Block{std::move(stmts)});
        }
    } else if (auto* branch = node->as<ir::If>()) {
        auto then_branch = clear_terminal(branch->then_branch);
        auto else_branch = clear_terminal(branch->else_branch);
        if (then_branch != branch->then_branch || else_branch != branch->else_branch) {
            rebuilt = ir::helper::rebuild(node, ir::If{branch->condition, then_branch, else_branch});
        }
    } else if (auto* select = node->as<ir::Case>()) {
        bool clauses_changed = false;
        auto clauses = clear_clauses(select->clauses, clauses_changed, &ReturnMarkerCleanup::clear_terminal);
        if (clauses_changed) {
            rebuilt = ir::helper::rebuild(node, ir::Case{select->subject, std::move(clauses)});
        }
    } else if (auto* with = node->as<ir::With>()) {
        bool clauses_changed = false;
        auto body = clear_terminal(with->body);
        auto else_clauses = clear_clauses(with->else_clauses, clauses_changed, &ReturnMarkerCleanup::clear_terminal);
        if (clauses_changed || body != with->body) {
            rebuilt = ir::helper::rebuild(node, ir::With{with->clauses, body, std::move(else_clauses)});
        }
    } else if (auto* attempt = node->as<ir::Try>()) {
        bool clauses_changed = false;
        auto body = clear_terminal(attempt->body);
        auto rescue = clear_clauses(attempt->rescue_clauses, clauses_changed, &ReturnMarkerCleanup::clear_terminal);
        if (clauses_changed || body != attempt->body) {
            rebuilt = ir::helper::rebuild(node, ir::Try{body, std::move(rescue), attempt->after});
        }
    } else if (auto* receive = node->as<ir::Receive>()) {
        bool clauses_changed = false;
        auto clauses = clear_clauses(receive->clauses, clauses_changed, &ReturnMarkerCleanup::clear_terminal);
        auto after_body = clear_terminal(receive->after_body);
        if (clauses_changed || after_body != receive->after_body) {
            rebuilt = ir::helper::rebuild(node, ir::Receive{std::move(clauses), receive->timeout, after_body});
        }
    }

    if (!changed) {
        return rebuilt;
    }
    return ir::helper::with_meta(rebuilt, meta);
}

void ReturnMarkerCleanup::report_leftovers(const ir::NodePtr& node) {
    if (!node) {
        return;
    }
    if (auto* def = node->as<ir::Def>()) {
        auto context = debug::push(debug::Frame::Function, def->name);
        report_leftovers(def->guard);
        report_leftovers(def->body);
        return;
    }
    if (auto* module = node->as<ir::Module>()) {
        auto context = debug::push(debug::Frame::Module, module->name);
        for (const auto& item : module->body) {
            report_leftovers(item);
        }
        return;
    }
    if (node->meta.early_return) {
        context_.warn("early-return", "early return in non-terminal position was not restructured", node->span);
    }
    ir::for_each_child(*node, [this](const ir::NodePtr& child) { report_leftovers(child); });
}

} // namespace pass
