#pragma once

#include "ir/ir.hpp"

namespace pass {

// `c(b(a(x)))` over remote calls becomes `x |> a() |> b() |> c()` when at
// least two calls nest through their first argument.
class PipelineFormation {
public:
    ir::NodePtr run(const ir::NodePtr& root) { return form(root); }

private:
    static ir::NodePtr form(const ir::NodePtr& node);
    // Call with its first argument dropped and the rest formed.
    static ir::NodePtr stage(const ir::NodePtr& call);
    static ir::NodePtr form_arguments(const ir::NodePtr& call, size_t from);
};

} // namespace pass
