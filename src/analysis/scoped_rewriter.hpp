#pragma once

#include <utility>
#include <vector>

#include "analysis/scope.hpp"
#include "analysis/scope_walker.hpp"
#include "ir/helper.hpp"
#include "ir/ir.hpp"
#include "ir/traversal.hpp"
#include "utils/debug_context.hpp"

namespace analysis {

/**
 * @brief CRTP base for rewrites that need to know which names are bound.
 *
 * `rewrite_node` dispatches to `Derived::rewrite(const T&, const NodePtr& self)`
 * when the derived class declares one for the variant alternative `T`, and to
 * the default `rewrite_children` otherwise. The defaults rewrite every child
 * through `derived().rewrite_node` while maintaining the scope chain:
 *
 * - `Def` and `Module` open boundary scopes;
 * - `if` branches, clauses, function clauses, `with`, `try` and comprehension
 *   bodies open child scopes;
 * - a `Match` defines its binders in the current scope after its value, so
 *   block statements see the bindings of earlier statements.
 *
 * Overridable hooks (declare them in Derived to take over):
 * - `PatternPtr rewrite_pattern(const PatternPtr&)`, called before the
 *   pattern's binders are defined;
 * - `std::vector<NodePtr> rewrite_statements(std::vector<NodePtr>)`, called
 *   on a block's rewritten statements while the block scope is still active;
 * - `visit_clause` / `visit_fn_clause`, which may call the base versions.
 */
template <typename Derived>
class ScopedRewriter {
public:
    ScopedRewriter() = default;
    ScopedRewriter(const ScopedRewriter&) = delete;
    ScopedRewriter& operator=(const ScopedRewriter&) = delete;

    ir::NodePtr rewrite_node(const ir::NodePtr& node) {
        if (!node) {
            return node;
        }
        if (stats_) {
            ++stats_->nodes;
        }
        return std::visit([&](const auto& value) -> ir::NodePtr {
            auto& d = derived();
            if constexpr (requires { d.rewrite(value, node); }) {
                return d.rewrite(value, node);
            } else {
                return rewrite_children(value, node);
            }
        }, node->value);
    }

    void set_stats(VisitStats* stats) { stats_ = stats; }

protected:
    Derived& derived() { return *static_cast<Derived*>(this); }

    class ScopeGuard {
    public:
        ScopeGuard(ScopedRewriter& rewriter, bool boundary)
            : rewriter_(rewriter), saved_(rewriter.current_), scope_(rewriter.current_, boundary) {
            rewriter_.current_ = &scope_;
        }
        ~ScopeGuard() { rewriter_.current_ = saved_; }

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        ScopedRewriter& rewriter_;
        Scope* saved_;
        Scope scope_;
    };

    class FunctionGuard {
    public:
        FunctionGuard(ScopedRewriter& rewriter, FunctionContext function)
            : rewriter_(rewriter), saved_(std::move(rewriter.function_)) {
            rewriter_.function_ = std::move(function);
        }
        ~FunctionGuard() { rewriter_.function_ = std::move(saved_); }

    private:
        ScopedRewriter& rewriter_;
        FunctionContext saved_;
    };

    Scope& scope() { return *current_; }
    bool is_bound(std::string_view name) const { return current_->lookup(name); }
    const FunctionContext& function() const { return function_; }

    ir::PatternPtr visit_pattern(const ir::PatternPtr& pattern) {
        auto& d = derived();
        if constexpr (requires { d.rewrite_pattern(pattern); }) {
            return d.rewrite_pattern(pattern);
        } else {
            return pattern;
        }
    }

    std::vector<ir::PatternPtr> visit_patterns(const std::vector<ir::PatternPtr>& patterns, bool& changed) {
        std::vector<ir::PatternPtr> out;
        out.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            auto rewritten = visit_pattern(pattern);
            changed = changed || rewritten != pattern;
            out.push_back(std::move(rewritten));
        }
        return out;
    }

    ir::NodePtr visit_child(const ir::NodePtr& child, bool& changed) {
        auto rewritten = derived().rewrite_node(child);
        changed = changed || rewritten != child;
        return rewritten;
    }

    ir::NodePtr visit_scoped(const ir::NodePtr& child, bool& changed) {
        ScopeGuard guard(*this, false);
        return visit_child(child, changed);
    }

    ir::Clause visit_clause(const ir::Clause& clause) {
        ScopeGuard guard(*this, false);
        auto pattern = visit_pattern(clause.pattern);
        current_->define_all(bound_names(pattern));
        auto guard_expr = derived().rewrite_node(clause.guard);
        auto body = derived().rewrite_node(clause.body);
        return ir::Clause{pattern, guard_expr, body};
    }

    ir::FnClause visit_fn_clause(const ir::FnClause& clause) {
        ScopeGuard guard(*this, false);
        bool unused = false;
        auto params = visit_patterns(clause.params, unused);
        current_->define_all(bound_names(params));
        auto guard_expr = derived().rewrite_node(clause.guard);
        auto body = derived().rewrite_node(clause.body);
        return ir::FnClause{std::move(params), guard_expr, body};
    }

    std::vector<ir::Clause> visit_clauses(const std::vector<ir::Clause>& clauses, bool& changed) {
        std::vector<ir::Clause> out;
        out.reserve(clauses.size());
        for (const auto& clause : clauses) {
            auto rewritten = derived().visit_clause(clause);
            changed = changed || !same_clause(rewritten, clause);
            out.push_back(std::move(rewritten));
        }
        return out;
    }

    static bool same_clause(const ir::Clause& a, const ir::Clause& b) {
        return a.pattern == b.pattern && a.guard == b.guard && a.body == b.body;
    }

    static bool same_fn_clause(const ir::FnClause& a, const ir::FnClause& b) {
        return a.params == b.params && a.guard == b.guard && a.body == b.body;
    }

    // --- Defaults ---

    template <typename T>
    ir::NodePtr rewrite_children(const T&, const ir::NodePtr& self) {
        return ir::map_children(self, [this](const ir::NodePtr& child) { return derived().rewrite_node(child); });
    }

    ir::NodePtr rewrite_children(const ir::Var&, const ir::NodePtr& self) { return self; }
    ir::NodePtr rewrite_children(const ir::Literal&, const ir::NodePtr& self) { return self; }
    ir::NodePtr rewrite_children(const ir::Opaque&, const ir::NodePtr& self) { return self; }

    ir::NodePtr rewrite_children(const ir::Block& block, const ir::NodePtr& self) {
        ScopeGuard guard(*this, false);
        std::vector<ir::NodePtr> stmts;
        stmts.reserve(block.stmts.size());
        for (const auto& stmt : block.stmts) {
            stmts.push_back(derived().rewrite_node(stmt));
        }
        auto& d = derived();
        if constexpr (requires { d.rewrite_statements(std::move(stmts)); }) {
            stmts = d.rewrite_statements(std::move(stmts));
        }
        if (stmts == block.stmts) {
            return self;
        }
        if (stmts.size() <= 1 && self->meta == ir::Metadata{}) {
            return ir::helper::from_statements(std::move(stmts), self->span);
        }
        return ir::helper::rebuild(self, ir::Block{std::move(stmts)});
    }

    ir::NodePtr rewrite_children(const ir::Match& match, const ir::NodePtr& self) {
        bool changed = false;
        auto value = visit_child(match.value, changed);
        auto pattern = visit_pattern(match.pattern);
        current_->define_all(bound_names(pattern));
        if (!changed && pattern == match.pattern) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Match{pattern, value});
    }

    ir::NodePtr rewrite_children(const ir::If& node, const ir::NodePtr& self) {
        bool changed = false;
        auto condition = visit_child(node.condition, changed);
        auto then_branch = visit_scoped(node.then_branch, changed);
        auto else_branch = visit_scoped(node.else_branch, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::If{condition, then_branch, else_branch});
    }

    ir::NodePtr rewrite_children(const ir::Case& node, const ir::NodePtr& self) {
        bool changed = false;
        auto subject = visit_child(node.subject, changed);
        auto clauses = visit_clauses(node.clauses, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Case{subject, std::move(clauses)});
    }

    ir::NodePtr rewrite_children(const ir::Fn& node, const ir::NodePtr& self) {
        bool changed = false;
        std::vector<ir::FnClause> clauses;
        for (const auto& clause : node.clauses) {
            auto rewritten = derived().visit_fn_clause(clause);
            changed = changed || !same_fn_clause(rewritten, clause);
            clauses.push_back(std::move(rewritten));
        }
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Fn{std::move(clauses)});
    }

    ir::NodePtr rewrite_children(const ir::Def& def, const ir::NodePtr& self) {
        ScopeGuard guard(*this, true);
        FunctionGuard function(*this, FunctionContext{def.name, bound_names(def.params)});
        auto context = debug::push(debug::Frame::Function, def.name);
        bool changed = false;
        auto params = visit_patterns(def.params, changed);
        current_->define_all(bound_names(params));
        auto guard_expr = visit_child(def.guard, changed);
        auto body = visit_child(def.body, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Def{def.name, std::move(params), guard_expr, body, def.is_private});
    }

    ir::NodePtr rewrite_children(const ir::Module& module, const ir::NodePtr& self) {
        ScopeGuard guard(*this, true);
        auto context = debug::push(debug::Frame::Module, module.name);
        bool changed = false;
        std::vector<ir::NodePtr> body;
        for (const auto& item : module.body) {
            body.push_back(visit_child(item, changed));
        }
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Module{module.name, std::move(body)});
    }

    ir::NodePtr rewrite_children(const ir::With& with, const ir::NodePtr& self) {
        bool changed = false;
        std::vector<ir::Generator> clauses;
        ir::NodePtr body;
        {
            ScopeGuard guard(*this, false);
            for (const auto& clause : with.clauses) {
                auto source = visit_child(clause.source, changed);
                auto pattern = visit_pattern(clause.pattern);
                changed = changed || pattern != clause.pattern;
                current_->define_all(bound_names(pattern));
                clauses.push_back(ir::Generator{pattern, source});
            }
            body = visit_child(with.body, changed);
        }
        auto else_clauses = visit_clauses(with.else_clauses, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::With{std::move(clauses), body, std::move(else_clauses)});
    }

    ir::NodePtr rewrite_children(const ir::Try& node, const ir::NodePtr& self) {
        bool changed = false;
        auto body = visit_scoped(node.body, changed);
        auto rescue = visit_clauses(node.rescue_clauses, changed);
        auto after = visit_scoped(node.after, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Try{body, std::move(rescue), after});
    }

    ir::NodePtr rewrite_children(const ir::Receive& node, const ir::NodePtr& self) {
        bool changed = false;
        auto clauses = visit_clauses(node.clauses, changed);
        auto timeout = visit_child(node.timeout, changed);
        auto after_body = visit_scoped(node.after_body, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Receive{std::move(clauses), timeout, after_body});
    }

    ir::NodePtr rewrite_children(const ir::For& node, const ir::NodePtr& self) {
        ScopeGuard guard(*this, false);
        bool changed = false;
        std::vector<ir::Generator> generators;
        for (const auto& generator : node.generators) {
            auto source = visit_child(generator.source, changed);
            auto pattern = visit_pattern(generator.pattern);
            changed = changed || pattern != generator.pattern;
            current_->define_all(bound_names(pattern));
            generators.push_back(ir::Generator{pattern, source});
        }
        std::vector<ir::NodePtr> filters;
        for (const auto& filter : node.filters) {
            filters.push_back(visit_child(filter, changed));
        }
        auto body = visit_child(node.body, changed);
        if (!changed) {
            return self;
        }
        return ir::helper::rebuild(self, ir::For{std::move(generators), std::move(filters), body});
    }

private:
    Scope root_;
    Scope* current_ = &root_;
    FunctionContext function_;
    VisitStats* stats_ = nullptr;
};

} // namespace analysis
