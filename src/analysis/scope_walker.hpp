#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "analysis/scope.hpp"
#include "ir/ir.hpp"

namespace analysis {

// Counts node visits of the walkers that accept it; used to check that
// statement-list analyses stay linear.
struct VisitStats {
    size_t nodes = 0;
};

bool is_wildcard_name(std::string_view name);

/**
 * @brief Names a pattern introduces, in left-to-right order without duplicates.
 *
 * Alias names are included. Pins (`^x`) and wildcards (`_`, `__`) bind nothing.
 * Map-pattern keys are expressions and bind nothing either.
 */
std::vector<std::string> bound_names(const ir::PatternPtr& pattern);
std::vector<std::string> bound_names(const std::vector<ir::PatternPtr>& patterns);

// Names a pattern reads: pinned names and variables in map keys.
NameSet pattern_reads(const ir::PatternPtr& pattern);

// Every name bound anywhere in the subtree: match left sides, clause
// patterns, function clause parameters, generator patterns.
NameSet declared_in_subtree(const ir::NodePtr& node);

// Free variable reads of the subtree, respecting the scopes it opens.
// Reads inside interpolation segments and opaque text count.
NameSet referenced_names(const ir::NodePtr& node, VisitStats* stats = nullptr);

// Whether `name` is read anywhere in the subtree, shadowing ignored.
bool mentions(const ir::NodePtr& node, std::string_view name);

// Every name read anywhere in the subtree, shadowing ignored.
NameSet all_read_names(const ir::NodePtr& node);

} // namespace analysis
