#pragma once

#include "ir/ir.hpp"

namespace pass {

// A case over exactly `true`/`false` without guards becomes an if. The
// `true`/`_` form only converts when the subject is known to be a boolean:
// for any other truthy value the catch-all clause would run.
class BooleanCaseToIf {
public:
    ir::NodePtr run(const ir::NodePtr& root);

private:
    static ir::NodePtr convert(const ir::NodePtr& node);
};

} // namespace pass
