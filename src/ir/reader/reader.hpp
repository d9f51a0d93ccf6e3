#pragma once

#include <string_view>
#include <vector>

#include "ir/ir.hpp"

namespace ir::reader {

// Reads IR text (the form PrettyPrinter emits). Throws ReaderError with the
// offending span on malformed input.
std::vector<NodePtr> read_items(std::string_view text, span::DumpId dump = span::kNoDump);

// Exactly one top-level form.
NodePtr read_node(std::string_view text, span::DumpId dump = span::kNoDump);
PatternPtr read_pattern(std::string_view text, span::DumpId dump = span::kNoDump);

// A compilation unit: one form as-is, several forms wrapped in a block.
NodePtr read_unit(std::string_view text, span::DumpId dump = span::kNoDump);

} // namespace ir::reader
