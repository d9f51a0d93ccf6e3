#pragma once

#include <vector>

#include "ir/ir.hpp"

namespace pass {

// A list ending `tmp = expr; tmp` ends with `expr` instead.
class TempReturnInline {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static std::vector<ir::NodePtr> inline_tail(std::vector<ir::NodePtr> stmts);
};

} // namespace pass
