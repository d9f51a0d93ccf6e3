#pragma once

#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

// Clears early-return flags in terminal position of function bodies, where
// the return is just the value of the body. Flags left anywhere else are
// reported and kept.
class ReturnMarkerCleanup {
public:
    explicit ReturnMarkerCleanup(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root);

private:
    static ir::NodePtr clear_terminal(const ir::NodePtr& node);
    static ir::NodePtr clear_bodies(const ir::NodePtr& node);
    void report_leftovers(const ir::NodePtr& node);

    PassContext& context_;
};

} // namespace pass
