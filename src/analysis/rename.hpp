#pragma once

#include <map>
#include <string>
#include <string_view>

#include "ir/ir.hpp"

namespace analysis {

using RenameMap = std::map<std::string, std::string, std::less<>>;

// Renames the binders (plain and alias) called `from`. Pins are reads and
// are left alone.
ir::PatternPtr rename_binder(const ir::PatternPtr& pattern, std::string_view from, std::string_view to);

// Renames the free reads of `from` in the subtree, stopping wherever a nested
// binder or a rebinding shadows it. Interpolation and opaque text included.
ir::NodePtr rename_references(const ir::NodePtr& node, std::string_view from, std::string_view to);

} // namespace analysis
