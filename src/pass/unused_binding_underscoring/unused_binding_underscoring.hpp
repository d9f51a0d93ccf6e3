#pragma once

#include "ir/ir.hpp"
#include "pass/liveness/liveness.hpp"
#include "pass/pass.hpp"

namespace pass {

// Underscores every binder nothing reads: non-terminal matches, function and
// closure parameters, clause and generator binders.
class UnusedBindingUnderscoring {
public:
    explicit UnusedBindingUnderscoring(PassContext& context)
        : underscorer_(BindingUnderscorer::Mode::AllBindings, context.options()) {}

    ir::NodePtr run(const ir::NodePtr& root) { return underscorer_.run(root); }

private:
    BindingUnderscorer underscorer_;
};

} // namespace pass
