#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "analysis/scope.hpp"

namespace analysis {

// Reserved words of the target language. They never name a variable in
// target source text.
const NameSet& target_keywords();
bool is_target_keyword(std::string_view name);

// Whether a scan reports target keywords. Interpolation segments written by
// the pipeline itself may still carry a host variable spelled like one.
enum class KeywordMode { Skip, Keep };

// A variable-like token found in source text carried by the IR (opaque
// fragments, interpolation segments). `offset` is relative to the text that
// was scanned.
struct IdentifierToken {
    size_t offset;
    std::string_view name;
};

/**
 * @brief Variable reads in a fragment of target-language source.
 *
 * A token is `[a-z_][A-Za-z0-9_]*[?!]?`. It is not a variable read when it is
 * preceded by `.`, `:` or `@` (field, atom, attribute), when it is followed by
 * `(` (call) or by a single `:` (keyword key), when it is a target keyword,
 * or when it sits inside a quoted string of the fragment. The lone `_`
 * wildcard is never reported.
 */
std::vector<IdentifierToken> scan_identifiers(std::string_view text);

// Tokens inside the `#{...}` segments of a string literal payload only.
std::vector<IdentifierToken> scan_interpolation(std::string_view literal, KeywordMode mode = KeywordMode::Skip);

bool has_interpolation(std::string_view literal);

bool contains_identifier(std::string_view text, std::string_view name);
bool interpolation_contains(std::string_view literal, std::string_view name,
                            KeywordMode mode = KeywordMode::Skip);

// Rewrites every read of `from` to `to`, leaving everything else untouched.
std::string replace_identifier(std::string_view text, std::string_view from, std::string_view to);
std::string replace_in_interpolation(std::string_view literal, std::string_view from, std::string_view to,
                                     KeywordMode mode = KeywordMode::Skip);

} // namespace analysis
