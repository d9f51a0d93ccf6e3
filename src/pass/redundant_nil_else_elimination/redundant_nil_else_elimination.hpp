#pragma once

#include "ir/ir.hpp"

namespace pass {

// `if c do a else nil end` drops its else branch.
class RedundantNilElseElimination {
public:
    ir::NodePtr run(const ir::NodePtr& root);
};

} // namespace pass
