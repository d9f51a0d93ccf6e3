#include "temp_return_inline.hpp"

#include "analysis/scope_walker.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

ir::NodePtr TempReturnInline::run(const ir::NodePtr& root) {
    return ir::transform_statement_lists(root, &TempReturnInline::inline_tail);
}

std::vector<ir::NodePtr> TempReturnInline::inline_tail(std::vector<ir::NodePtr> stmts) {
    while (stmts.size() >= 2) {
        const auto& last = stmts.back();
        auto returned = ir::helper::var_name(last);
        auto binding = as_simple_match(stmts[stmts.size() - 2]);
        if (!returned || !binding || binding->name != *returned || analysis::is_wildcard_name(binding->name)) {
            break;
        }
        auto value = ir::helper::with_meta(binding->value, merge_meta(binding->value->meta, last->meta));
        stmts.pop_back();
        stmts.back() = std::move(value);
    }
    return stmts;
}

} // namespace pass
