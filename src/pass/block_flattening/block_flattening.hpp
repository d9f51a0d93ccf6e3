#pragma once

#include "ir/ir.hpp"

namespace pass {

// Splices blocks nested as statements into their parent and unwraps
// single-statement blocks.
class BlockFlattening {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static ir::NodePtr flatten(const ir::NodePtr& node);
    static std::vector<ir::NodePtr> splice(const std::vector<ir::NodePtr>& stmts, bool& changed);
};

} // namespace pass
