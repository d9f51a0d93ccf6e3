#pragma once

#include "analysis/scoped_rewriter.hpp"
#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

// Harmonizes the parameters of named function definitions with the names
// their bodies read.
class ParameterHarmonization : public analysis::ScopedRewriter<ParameterHarmonization> {
public:
    explicit ParameterHarmonization(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root) { return rewrite_node(root); }

    ir::NodePtr rewrite(const ir::Def& def, const ir::NodePtr& self);

private:
    PassContext& context_;
};

} // namespace pass
