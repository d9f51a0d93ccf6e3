#pragma once

#include <vector>

#include "ir/ir.hpp"

namespace pass {

// Drops `x = nil` when a later statement of the same list rebinds `x` before
// anything reads it.
class NilInitializerElimination {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static std::vector<ir::NodePtr> eliminate(std::vector<ir::NodePtr> stmts);
};

} // namespace pass
