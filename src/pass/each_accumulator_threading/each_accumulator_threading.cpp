#include "each_accumulator_threading.hpp"

#include <algorithm>

#include "analysis/scope_walker.hpp"
#include "analysis/usage_index.hpp"
#include "ir/helper.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

// The single-clause, single-parameter closure of an each call.
const ir::FnClause* iteration_clause(const ir::RemoteCall& call) {
    if (call.args.size() != 2) {
        return nullptr;
    }
    auto* fn = call.args[1]->as<ir::Fn>();
    if (!fn || fn->clauses.size() != 1 || fn->clauses.front().params.size() != 1) {
        return nullptr;
    }
    return &fn->clauses.front();
}

// The generator of a `for` with exactly one plain-binder generator.
const ir::Generator* single_generator(const ir::For& loop) {
    if (loop.generators.size() != 1 || !loop.generators.front().pattern->is<ir::BindPattern>()) {
        return nullptr;
    }
    return &loop.generators.front();
}

// Rebound outer names of `body` that are read after statement `i`.
std::vector<std::string> accumulators(const ir::NodePtr& body, const std::vector<std::string>& params,
                                      const analysis::NameSet& bound_before, const analysis::UsageIndex& index,
                                      size_t i) {
    std::vector<std::string> names;
    for (const auto& name : branch_rebound_names(ir::helper::statements_of(body))) {
        if (bound_before.count(name) && index.used_from(i + 1, name) &&
            std::find(params.begin(), params.end(), name) == params.end()) {
            names.push_back(name);
        }
    }
    return names;
}

} // namespace

std::optional<std::string> EachAccumulatorThreading::each_module(const ir::RemoteCall& call) const {
    for (const auto& qualified : context_.options().each_functions) {
        auto [module, function] = split_qualified(qualified);
        if (module == call.module && function == call.function) {
            return module;
        }
    }
    return std::nullopt;
}

std::vector<ir::NodePtr> EachAccumulatorThreading::rewrite_statements(std::vector<ir::NodePtr> stmts) {
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
        std::optional<ir::NodePtr> threaded;
        if (auto* call = stmt->as<ir::RemoteCall>()) {
            const ir::FnClause* clause = iteration_clause(*call);
            auto module = clause ? each_module(*call) : std::nullopt;
            if (module) {
                auto names = accumulators(clause->body, analysis::bound_names(clause->params), bound_before, index, i);
                if (!names.empty()) {
                    threaded = thread(stmt, *module, names);
                }
            }
        } else if (auto* loop = stmt->as<ir::For>()) {
            if (auto* generator = single_generator(*loop)) {
                auto names = accumulators(loop->body, analysis::bound_names(generator->pattern), bound_before, index, i);
                if (!names.empty()) {
                    threaded = thread_for(stmt, names);
                }
            }
        }
        if (threaded) {
            stmts[i] = *threaded;
        }
        if (auto* match = stmts[i]->as<ir::Match>()) {
            for (const auto& name : analysis::bound_names(match->pattern)) {
                bound_before.insert(name);
            }
        }
    }
    return stmts;
}

std::optional<ir::NodePtr> EachAccumulatorThreading::thread(const ir::NodePtr& stmt, const std::string& module,
                                                            const std::vector<std::string>& names) const {
    const auto& call = *stmt->as<ir::RemoteCall>();
    const auto& fn_node = call.args[1];
    const auto& clause = fn_node->as<ir::Fn>()->clauses.front();

    auto body = yielding_branch(clause.body, names);
    if (!body) {
        return std::nullopt;
    }
    std::vector<ir::PatternPtr> params{clause.params.front(), ir::helper::bind_all(names)};
    auto reducer = ir::helper::rebuild(fn_node, ir::Fn{{ir::FnClause{std::move(params), clause.guard, *body}}});

    auto reduce = ir::helper::rebuild(
        stmt, ir::RemoteCall{module, "reduce", {call.args[0], ir::helper::read_all(names), reducer}});
    return ir::helper::make_node(ir::Match{ir::helper::bind_all(names), reduce}, {}, stmt->span);
}

std::optional<ir::NodePtr> EachAccumulatorThreading::thread_for(const ir::NodePtr& stmt,
                                                                const std::vector<std::string>& names) const {
    const auto& loop = *stmt->as<ir::For>();
    const auto& generator = loop.generators.front();

    auto body = yielding_branch(loop.body, names);
    if (!body) {
        return std::nullopt;
    }
    if (!loop.filters.empty()) {
        ir::NodePtr condition = loop.filters.front();
        for (size_t i = 1; i < loop.filters.size(); ++i) {
            condition = ir::helper::make_node(ir::BinaryOp{ir::BinaryOperator::And, condition, loop.filters[i]});
        }
        body = ir::helper::make_node(ir::If{condition, *body, ir::helper::read_all(names)});
    }
    std::vector<ir::PatternPtr> params{generator.pattern, ir::helper::bind_all(names)};
    auto reducer = ir::helper::make_node(ir::Fn{{ir::FnClause{std::move(params), nullptr, *body}}});

    auto reduce = ir::helper::rebuild(
        stmt, ir::RemoteCall{"Enum", "reduce", {generator.source, ir::helper::read_all(names), reducer}});
    return ir::helper::make_node(ir::Match{ir::helper::bind_all(names), reduce}, {}, stmt->span);
}

} // namespace pass
