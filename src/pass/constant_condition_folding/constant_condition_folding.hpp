#pragma once

#include "ir/ir.hpp"

namespace pass {

// `if true` / `if false` collapse to the branch that is taken; an absent
// branch yields nil.
class ConstantConditionFolding {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static ir::NodePtr fold(const ir::NodePtr& node);
};

} // namespace pass
