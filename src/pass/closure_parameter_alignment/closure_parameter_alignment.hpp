#pragma once

#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"

namespace pass {

// Renames the unread parameter of a closure passed to a higher-order call
// onto the one name its body reads without a binding, when that name is used
// as a field receiver or call argument.
class ClosureParameterAlignment : public analysis::ScopedRewriter<ClosureParameterAlignment> {
public:
    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    ir::NodePtr rewrite(const ir::Call&, const ir::NodePtr& self) { return align_arguments(self); }
    ir::NodePtr rewrite(const ir::RemoteCall&, const ir::NodePtr& self) { return align_arguments(self); }
    ir::NodePtr rewrite(const ir::Invoke&, const ir::NodePtr& self) { return align_arguments(self); }

private:
    ir::NodePtr align_arguments(const ir::NodePtr& self);
    ir::NodePtr align(const ir::NodePtr& fn);
};

} // namespace pass
