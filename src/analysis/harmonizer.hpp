#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "analysis/scope.hpp"
#include "ir/ir.hpp"

namespace analysis {

// A place that introduces binders: clause pattern(s), function parameters.
struct BindingSite {
    std::vector<ir::PatternPtr> patterns;
    ir::NodePtr guard; // may be null
    ir::NodePtr body;
};

struct HarmonizePolicy {
    // Consult `tie_break_names` when more than one name is undefined.
    bool allow_tie_break = false;
    std::vector<std::string> tie_break_names;
    // When set, only these binders may be renamed (e.g. the payload slot of
    // a tagged tuple).
    std::optional<std::vector<std::string>> candidates;
};

enum class HarmonizeAction {
    Unchanged,
    Renamed,
    Ambiguous,
    ShapeMismatch,
};

std::string_view to_string(HarmonizeAction action);

struct HarmonizeResult {
    HarmonizeAction action = HarmonizeAction::Unchanged;
    BindingSite site;           // rewritten when action == Renamed
    std::string from;           // renamed binder
    std::string to;             // name it now carries
    std::vector<std::string> undefined;
};

/**
 * @brief Reconciles a binding site with the names its scope reads.
 *
 * undefined = (reads of body and guard) - (binders of the site, names bound
 * inside the body, names of `enclosing`). With exactly one undefined name
 * the single unread binder, or an `_name` binder whose bare name is the
 * undefined one, is renamed onto it. A binder that is read is never renamed.
 * Several undefined names are resolved only through the tie-break list when
 * the policy allows it. A target keyword is never a rename target. Anything
 * else leaves the site untouched and says why.
 */
HarmonizeResult harmonize(const BindingSite& site, const NameSet& enclosing, const HarmonizePolicy& policy);

} // namespace analysis
