#pragma once

#include <vector>

#include "ir/ir.hpp"

namespace pass {

// Removes `x = x`; in terminal position it becomes `x`.
class SelfAssignmentElimination {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static std::vector<ir::NodePtr> eliminate(std::vector<ir::NodePtr> stmts);
};

} // namespace pass
