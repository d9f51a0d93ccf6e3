#pragma once

#include "ir/ir.hpp"
#include "pass/liveness/liveness.hpp"
#include "pass/pass.hpp"

namespace pass {

// Underscores the names an aggregation result is bound to when nothing
// after the binding reads them.
class UnusedResultUnderscoring {
public:
    explicit UnusedResultUnderscoring(PassContext& context)
        : underscorer_(BindingUnderscorer::Mode::AggregationResults, context.options()) {}

    ir::NodePtr run(const ir::NodePtr& root) { return underscorer_.run(root); }

private:
    BindingUnderscorer underscorer_;
};

} // namespace pass
