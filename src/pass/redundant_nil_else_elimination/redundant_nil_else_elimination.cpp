#include "redundant_nil_else_elimination.hpp"

#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

ir::NodePtr RedundantNilElseElimination::run(const ir::NodePtr& root) {
    return ir::transform_bottom_up(root, [](const ir::NodePtr& node) -> ir::NodePtr {
        auto* branch = node->as<ir::If>();
        if (!branch || !ir::helper::is_nil(branch->else_branch) || branch->else_branch->meta != ir::Metadata{}) {
            return node;
        }
        return ir::helper::rebuild(node, ir::If{branch->condition, branch->then_branch, nullptr});
    });
}

} // namespace pass
