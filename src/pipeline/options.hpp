#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "analysis/identifier_scan.hpp"

namespace pipeline {

using NameSet = analysis::NameSet;

// Words of the target language that cannot name a variable.
inline NameSet default_reserved_words() {
    return analysis::target_keywords();
}

struct PipelineOptions {
    NameSet disabled_passes;

    // Priority order used when a tagged payload leaves several names
    // undefined; the first listed name that is undefined wins.
    std::vector<std::string> tie_break_names{"id", "key", "value", "reason"};

    NameSet reserved_words = default_reserved_words();

    // Modules whose functions return an updated copy of their first argument.
    NameSet rebind_modules{"Map", "MapSet", "Keyword", "List"};

    // `Module.function` spellings of each-style iteration.
    std::vector<std::string> each_functions{"Enum.each"};

    // Extra `function` or `Module.function` names treated as aggregations.
    NameSet aggregation_functions;

    bool trace = false;
    bool verify = false;
};

} // namespace pipeline
