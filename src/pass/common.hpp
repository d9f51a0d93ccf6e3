#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "analysis/scope.hpp"
#include "ir/ir.hpp"
#include "pipeline/options.hpp"

namespace pass {

// "Module.function" -> {"Module", "function"}; a bare name has no module.
std::pair<std::string, std::string> split_qualified(std::string_view name);

// Qualified spelling of a call target: "Mod.fun" or "fun".
std::optional<std::string> call_name(const ir::NodePtr& node);

// Arguments of a local or remote call.
const std::vector<ir::NodePtr>* call_args(const ir::NodePtr& node);

bool is_call(const ir::NodePtr& node);

// Same call with its argument list replaced.
ir::NodePtr with_args(const ir::NodePtr& call, std::vector<ir::NodePtr> args);

// Whether an early-return marker sits in the subtree. Anonymous function
// bodies are not searched: a return there leaves the closure only.
bool contains_early_return(const ir::NodePtr& node);

// Terminal statement of `node` carries the early-return marker.
bool ends_with_early_return(const ir::NodePtr& node);

// Names a statement list rebinds, looking through the branches of `if` and
// `case` statements but not into closures. Names bound by a case clause
// pattern are local to that clause and left out.
std::vector<std::string> branch_rebound_names(const std::vector<ir::NodePtr>& stmts);

// `names = if/case ...` for a statement-level conditional: every branch,
// nested conditionals handled first, ends by reading `names` and a missing
// else reads them unchanged. Empty when a case clause pattern binds one of
// the names.
std::optional<ir::NodePtr> yield_rebinds(const ir::NodePtr& stmt, const std::vector<std::string>& names);

// Applies `yield_rebinds` to every conditional of `stmts` that rebinds one
// of `names`; empty when one of them cannot be rewritten.
std::optional<std::vector<ir::NodePtr>> hoist_rebinds(std::vector<ir::NodePtr> stmts,
                                                     const std::vector<std::string>& names);

// `branch` with its conditionals hoisted, ending in a read of `names`.
std::optional<ir::NodePtr> yielding_branch(const ir::NodePtr& branch, const std::vector<std::string>& names);

// Call with an anonymous function argument, a comprehension, or a call the
// options list as an aggregation.
bool is_aggregation(const ir::NodePtr& node, const pipeline::PipelineOptions& options);

// `{:tag, binder}` clause pattern; returns the binder.
std::optional<std::string> tagged_payload_binder(const ir::PatternPtr& pattern);

// Union of the flags of both.
inline ir::Metadata merge_meta(ir::Metadata a, const ir::Metadata& b) {
    a.early_return = a.early_return || b.early_return;
    a.carries_mutation = a.carries_mutation || b.carries_mutation;
    a.sentinel = a.sentinel || b.sentinel;
    return a;
}

// `name = value` with a plain binder.
struct SimpleMatch {
    std::string name;
    ir::NodePtr value;
};
std::optional<SimpleMatch> as_simple_match(const ir::NodePtr& node);

} // namespace pass
