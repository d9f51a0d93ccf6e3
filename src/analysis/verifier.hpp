#pragma once

#include <string>
#include <vector>

#include "ir/ir.hpp"
#include "span/span.hpp"

namespace analysis {

struct VerifyIssue {
    enum class Kind {
        UnboundReference,
        UnusedLiteral,
    };

    Kind kind;
    std::string name;     // variable name, or the printed literal
    std::string function; // enclosing definition, empty at top level
    span::Span span = span::Span::invalid();
};

// Post-pipeline check: reads that no enclosing binder covers, and bare
// literals in non-terminal statement position.
std::vector<VerifyIssue> verify(const ir::NodePtr& tree);

} // namespace analysis
