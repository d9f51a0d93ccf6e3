#pragma once

#include <string_view>

#include "ir/ir.hpp"

namespace analysis {

// What the surrounding operations say a variable holds.
enum class Shape {
    Unknown,
    Scalar,     // arithmetic, comparison or concatenation operand
    Structured, // field, index or update receiver; destructured as a map or struct
};

std::string_view to_string(Shape shape);

// Shape of `name` judged from how `node` uses it. Conflicting evidence and
// no evidence both give Unknown.
Shape classify_usage(const ir::NodePtr& node, std::string_view name);

// Shape the binder `name` is known to hold from its own pattern.
Shape classify_pattern(const ir::PatternPtr& pattern, std::string_view name);

// Unknown is compatible with everything.
bool shapes_conflict(Shape a, Shape b);

} // namespace analysis
