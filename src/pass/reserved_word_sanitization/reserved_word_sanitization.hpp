#pragma once

#include "analysis/rename.hpp"
#include "ir/ir.hpp"
#include "pass/pass.hpp"

namespace pass {

// Appends `_` to every binder named after a reserved word of the target and
// to the reads it scopes over, pins and interpolation segments included.
// Free reads and opaque target text are left alone.
class ReservedWordSanitization {
public:
    explicit ReservedWordSanitization(PassContext& context) : context_(context) {}

    ir::NodePtr run(const ir::NodePtr& root);

    // Replacement names for the reserved words among `names`.
    static analysis::RenameMap plan(const analysis::NameSet& names, const pipeline::NameSet& reserved);

private:
    PassContext& context_;
};

} // namespace pass
