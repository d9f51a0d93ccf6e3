#include "common.hpp"

#include <algorithm>

#include "analysis/scope_walker.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

std::pair<std::string, std::string> split_qualified(std::string_view name) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return {"", std::string(name)};
    }
    return {std::string(name.substr(0, dot)), std::string(name.substr(dot + 1))};
}

std::optional<std::string> call_name(const ir::NodePtr& node) {
    if (!node) {
        return std::nullopt;
    }
    if (auto* call = node->as<ir::Call>()) {
        return call->function;
    }
    if (auto* call = node->as<ir::RemoteCall>()) {
        return call->module + "." + call->function;
    }
    return std::nullopt;
}

const std::vector<ir::NodePtr>* call_args(const ir::NodePtr& node) {
    if (!node) {
        return nullptr;
    }
    if (auto* call = node->as<ir::Call>()) {
        return &call->args;
    }
    if (auto* call = node->as<ir::RemoteCall>()) {
        return &call->args;
    }
    if (auto* call = node->as<ir::Invoke>()) {
        return &call->args;
    }
    return nullptr;
}

bool is_call(const ir::NodePtr& node) {
    return call_args(node) != nullptr;
}

ir::NodePtr with_args(const ir::NodePtr& call, std::vector<ir::NodePtr> args) {
    if (auto* local = call->as<ir::Call>()) {
        return ir::helper::rebuild(call, ir::Call{local->function, std::move(args)});
    }
    if (auto* remote = call->as<ir::RemoteCall>()) {
        return ir::helper::rebuild(call, ir::RemoteCall{remote->module, remote->function, std::move(args)});
    }
    if (auto* invoke = call->as<ir::Invoke>()) {
        return ir::helper::rebuild(call, ir::Invoke{invoke->target, std::move(args)});
    }
    throw std::logic_error("with_args on a non-call node - invariant violation");
}

bool contains_early_return(const ir::NodePtr& node) {
    if (!node) {
        return false;
    }
    if (node->meta.early_return) {
        return true;
    }
    if (node->is<ir::Fn>() || node->is<ir::Def>()) {
        return false;
    }
    bool found = false;
    ir::for_each_child(*node, [&](const ir::NodePtr& child) {
        found = found || contains_early_return(child);
    });
    return found;
}

bool ends_with_early_return(const ir::NodePtr& node) {
    return node && ir::helper::terminal_of(node)->meta.early_return;
}

namespace {

void collect_rebinds(const std::vector<ir::NodePtr>& stmts, std::vector<std::string>& names) {
    auto add = [&](const std::string& name) {
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    };
    for (const auto& stmt : stmts) {
        if (auto* match = stmt->as<ir::Match>()) {
            for (const auto& name : analysis::bound_names(match->pattern)) {
                add(name);
            }
        } else if (auto* branch = stmt->as<ir::If>()) {
            collect_rebinds(ir::helper::statements_of(branch->then_branch), names);
            collect_rebinds(ir::helper::statements_of(branch->else_branch), names);
        } else if (auto* select = stmt->as<ir::Case>()) {
            for (const auto& clause : select->clauses) {
                std::vector<std::string> inner;
                collect_rebinds(ir::helper::statements_of(clause.body), inner);
                auto local = analysis::bound_names(clause.pattern);
                for (const auto& name : inner) {
                    if (std::find(local.begin(), local.end(), name) == local.end()) {
                        add(name);
                    }
                }
            }
        }
    }
}

bool rebinds_any(const ir::NodePtr& stmt, const std::vector<std::string>& names) {
    if (!stmt->is<ir::If>() && !stmt->is<ir::Case>()) {
        return false;
    }
    for (const auto& name : branch_rebound_names({stmt})) {
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> branch_rebound_names(const std::vector<ir::NodePtr>& stmts) {
    std::vector<std::string> names;
    collect_rebinds(stmts, names);
    return names;
}

std::optional<ir::NodePtr> yield_rebinds(const ir::NodePtr& stmt, const std::vector<std::string>& names) {
    ir::NodePtr conditional;
    if (auto* branch = stmt->as<ir::If>()) {
        auto then_branch = yielding_branch(branch->then_branch, names);
        auto else_branch = branch->else_branch ? yielding_branch(branch->else_branch, names)
                                               : std::optional<ir::NodePtr>(ir::helper::read_all(names));
        if (!then_branch || !else_branch) {
            return std::nullopt;
        }
        conditional = ir::helper::rebuild(stmt, ir::If{branch->condition, *then_branch, *else_branch});
    } else if (auto* select = stmt->as<ir::Case>()) {
        std::vector<ir::Clause> clauses;
        for (const auto& clause : select->clauses) {
            for (const auto& bound : analysis::bound_names(clause.pattern)) {
                if (std::find(names.begin(), names.end(), bound) != names.end()) {
                    return std::nullopt;
                }
            }
            auto body = yielding_branch(clause.body, names);
            if (!body) {
                return std::nullopt;
            }
            clauses.push_back(ir::Clause{clause.pattern, clause.guard, *body});
        }
        conditional = ir::helper::rebuild(stmt, ir::Case{select->subject, std::move(clauses)});
    } else {
        return std::nullopt;
    }
    return ir::helper::make_node(ir::Match{ir::helper::bind_all(names), conditional}, {}, stmt->span);
}

std::optional<std::vector<ir::NodePtr>> hoist_rebinds(std::vector<ir::NodePtr> stmts,
                                                     const std::vector<std::string>& names) {
    for (auto& stmt : stmts) {
        if (!rebinds_any(stmt, names)) {
            continue;
        }
        auto hoisted = yield_rebinds(stmt, names);
        if (!hoisted) {
            return std::nullopt;
        }
        stmt = *hoisted;
    }
    return stmts;
}

std::optional<ir::NodePtr> yielding_branch(const ir::NodePtr& branch, const std::vector<std::string>& names) {
    auto stmts = hoist_rebinds(ir::helper::statements_of(branch), names);
    if (!stmts) {
        return std::nullopt;
    }
    stmts->push_back(ir::helper::read_all(names));
    return ir::helper::from_statements(std::move(*stmts), branch ? branch->span : span::Span::invalid());
}

bool is_aggregation(const ir::NodePtr& node, const pipeline::PipelineOptions& options) {
    if (!node) {
        return false;
    }
    if (node->is<ir::For>()) {
        return true;
    }
    if (auto name = call_name(node); name && options.aggregation_functions.count(*name)) {
        return true;
    }
    if (auto* pipe = node->as<ir::Pipe>()) {
        return is_aggregation(pipe->rhs, options);
    }
    if (auto* args = call_args(node)) {
        for (const auto& arg : *args) {
            if (arg->is<ir::Fn>()) {
                return true;
            }
        }
    }
    return false;
}

std::optional<std::string> tagged_payload_binder(const ir::PatternPtr& pattern) {
    auto* tuple = pattern ? pattern->as<ir::TuplePattern>() : nullptr;
    if (!tuple || tuple->elements.size() != 2) {
        return std::nullopt;
    }
    auto* tag = tuple->elements[0]->as<ir::LiteralPattern>();
    if (!tag || !std::holds_alternative<ir::Literal::Atom>(tag->value.value)) {
        return std::nullopt;
    }
    auto binder = ir::helper::binder_name(tuple->elements[1]);
    if (!binder || analysis::is_wildcard_name(*binder)) {
        return std::nullopt;
    }
    return binder;
}

std::optional<SimpleMatch> as_simple_match(const ir::NodePtr& node) {
    auto* match = node ? node->as<ir::Match>() : nullptr;
    if (!match) {
        return std::nullopt;
    }
    auto binder = ir::helper::binder_name(match->pattern);
    if (!binder) {
        return std::nullopt;
    }
    return SimpleMatch{*binder, match->value};
}

} // namespace pass
