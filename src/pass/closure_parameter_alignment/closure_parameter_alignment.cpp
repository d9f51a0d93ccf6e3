#include "closure_parameter_alignment.hpp"

#include "analysis/harmonizer.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

bool is_var(const ir::NodePtr& node, const std::string& name) {
    auto var = ir::helper::var_name(node);
    return var && *var == name;
}

// `name.field`, `f(name)` or `name |> f()` somewhere in the subtree.
bool used_as_receiver_or_argument(const ir::NodePtr& node, const std::string& name) {
    if (!node) {
        return false;
    }
    if (auto* field = node->as<ir::Field>(); field && is_var(field->target, name)) {
        return true;
    }
    if (auto* pipe = node->as<ir::Pipe>(); pipe && is_var(pipe->lhs, name)) {
        return true;
    }
    if (auto* args = call_args(node)) {
        for (const auto& arg : *args) {
            if (is_var(arg, name)) {
                return true;
            }
        }
    }
    bool found = false;
    ir::for_each_child(*node, [&](const ir::NodePtr& child) {
        found = found || used_as_receiver_or_argument(child, name);
    });
    return found;
}

} // namespace

ir::NodePtr ClosureParameterAlignment::align_arguments(const ir::NodePtr& self) {
    auto node = ir::map_children(self, [this](const ir::NodePtr& child) { return rewrite_node(child); });
    auto* args = call_args(node);
    if (!args) {
        return node;
    }
    bool changed = false;
    std::vector<ir::NodePtr> aligned;
    aligned.reserve(args->size());
    for (const auto& arg : *args) {
        auto rewritten = arg->is<ir::Fn>() ? align(arg) : arg;
        changed = changed || rewritten != arg;
        aligned.push_back(std::move(rewritten));
    }
    if (!changed) {
        return node;
    }
    return with_args(node, std::move(aligned));
}

ir::NodePtr ClosureParameterAlignment::align(const ir::NodePtr& fn) {
    const auto& closure = *fn->as<ir::Fn>();
    auto enclosing = scope().visible();
    bool changed = false;
    std::vector<ir::FnClause> clauses;
    for (const auto& clause : closure.clauses) {
        auto result = analysis::harmonize(analysis::BindingSite{clause.params, clause.guard, clause.body}, enclosing, {});
        bool accept = result.action == analysis::HarmonizeAction::Renamed &&
                      result.site.body == clause.body && result.site.guard == clause.guard &&
                      used_as_receiver_or_argument(clause.body, result.to);
        if (!accept) {
            clauses.push_back(clause);
            continue;
        }
        changed = true;
        clauses.push_back(ir::FnClause{result.site.patterns, clause.guard, clause.body});
    }
    if (!changed) {
        return fn;
    }
    return ir::helper::rebuild(fn, ir::Fn{std::move(clauses)});
}

} // namespace pass
