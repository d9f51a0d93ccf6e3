#include "discard_rebind_resolution.hpp"

#include <set>
#include <string_view>

#include "analysis/usage_index.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

// Collection functions that only inspect their argument.
bool is_query_function(std::string_view name) {
    static const std::set<std::string_view> queries{
        "get", "get_lazy", "fetch", "fetch!", "keys", "values", "size", "length", "to_list",
        "first", "last", "new", "equal?", "from_struct",
    };
    return queries.count(name) > 0 || (!name.empty() && name.back() == '?');
}

} // namespace

ir::NodePtr DiscardRebindResolution::run(const ir::NodePtr& root) {
    return ir::transform_statement_lists(root, [this](std::vector<ir::NodePtr> stmts) {
        return resolve(std::move(stmts));
    });
}

std::optional<std::string> DiscardRebindResolution::updated_argument(const ir::NodePtr& call) const {
    auto* args = call_args(call);
    if (!args || args->empty() || call->is<ir::Invoke>()) {
        return std::nullopt;
    }
    auto target = ir::helper::var_name(args->front());
    if (!target || ir::helper::is_underscored(*target)) {
        return std::nullopt;
    }
    if (call->meta.carries_mutation) {
        return target;
    }
    if (auto* remote = call->as<ir::RemoteCall>()) {
        if (context_.options().rebind_modules.count(remote->module) && !is_query_function(remote->function)) {
            return target;
        }
    }
    return std::nullopt;
}

std::vector<ir::NodePtr> DiscardRebindResolution::resolve(std::vector<ir::NodePtr> stmts) const {
    if (stmts.size() < 2) {
        return stmts;
    }
    auto index = analysis::UsageIndex::build(stmts);
    for (size_t i = 0; i + 1 < stmts.size(); ++i) {
        const auto stmt = stmts[i];
        if (is_call(stmt)) {
            auto target = updated_argument(stmt);
            if (target && index.used_from(i + 1, *target)) {
                auto meta = stmt->meta;
                meta.carries_mutation = false;
                stmts[i] = ir::helper::make_node(
                    ir::Match{ir::helper::bind(*target), ir::helper::with_meta(stmt, meta)}, {}, stmt->span);
            }
            continue;
        }
        auto bound = as_simple_match(stmt);
        if (bound && !ir::helper::is_underscored(bound->name) && is_call(bound->value) &&
            !index.used_from(i + 1, bound->name)) {
            stmts[i] = ir::helper::rebuild(stmt, ir::Match{ir::helper::bind("_"), bound->value});
        }
    }
    return stmts;
}

} // namespace pass
