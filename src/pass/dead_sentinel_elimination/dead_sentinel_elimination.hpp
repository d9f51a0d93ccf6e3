#pragma once

#include <vector>

#include "ir/ir.hpp"

namespace pass {

// Removes bare literals and sentinel-flagged placeholders that are not the
// value of their statement list.
class DeadSentinelElimination {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static std::vector<ir::NodePtr> eliminate(std::vector<ir::NodePtr> stmts);
};

} // namespace pass
