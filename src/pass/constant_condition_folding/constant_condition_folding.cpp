#include "constant_condition_folding.hpp"

#include "ir/helper.hpp"
#include "pass/common.hpp"
#include "ir/traversal.hpp"

namespace pass {

ir::NodePtr ConstantConditionFolding::run(const ir::NodePtr& root) {
    return ir::transform_bottom_up(root, &ConstantConditionFolding::fold);
}

ir::NodePtr ConstantConditionFolding::fold(const ir::NodePtr& node) {
    auto* branch = node->as<ir::If>();
    if (!branch) {
        return node;
    }
    bool taken;
    if (ir::helper::is_bool_literal(branch->condition, true)) {
        taken = true;
    } else if (ir::helper::is_bool_literal(branch->condition, false)) {
        taken = false;
    } else {
        return node;
    }
    const auto& chosen = taken ? branch->then_branch : branch->else_branch;
    auto result = chosen ? chosen : ir::helper::make_node(ir::Literal{ir::Literal::Nil{}}, {}, node->span);
    return ir::helper::with_meta(result, merge_meta(result->meta, node->meta));
}

} // namespace pass
