#include "identifier_scan.hpp"

#include <cctype>

namespace analysis {

const NameSet& target_keywords() {
    static const NameSet keywords{
        "after", "alias", "and", "case", "catch", "cond", "def", "defmodule", "defp",
        "do", "else", "end", "false", "fn", "for", "if", "import", "in", "nil", "not",
        "or", "quote", "receive", "require", "rescue", "true", "try", "unless",
        "unquote", "when", "with",
    };
    return keywords;
}

bool is_target_keyword(std::string_view name) {
    return target_keywords().count(name) > 0;
}

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_start(char c) {
    return std::islower(static_cast<unsigned char>(c)) || c == '_';
}

// Index one past the closing quote of the string starting at `open`.
size_t skip_quoted(std::string_view text, size_t open) {
    char quote = text[open];
    size_t i = open + 1;
    while (i < text.size()) {
        if (text[i] == '\\') {
            i += 2;
            continue;
        }
        if (text[i] == quote) {
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

void scan_range(std::string_view text, size_t base, bool keep_keywords, std::vector<IdentifierToken>& out) {
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '"' || c == '\'') {
            i = skip_quoted(text, i);
            continue;
        }
        if (!is_word_char(c)) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_word_char(text[i])) {
            ++i;
        }
        if (!is_identifier_start(c)) {
            continue; // module alias or number
        }
        if (i < text.size() && (text[i] == '?' || text[i] == '!')) {
            ++i;
        }
        std::string_view token = text.substr(start, i - start);
        if (start > 0) {
            char before = text[start - 1];
            if (before == '.' || before == ':' || before == '@') {
                continue;
            }
        }
        if (i < text.size()) {
            char after = text[i];
            if (after == '(') {
                continue;
            }
            if (after == ':' && (i + 1 >= text.size() || text[i + 1] != ':')) {
                continue;
            }
        }
        if (token == "_" || (!keep_keywords && is_target_keyword(token))) {
            continue;
        }
        out.push_back(IdentifierToken{base + start, token});
    }
}

// Calls `fn(begin, end)` for the inside of every `#{...}` segment.
template <typename Fn>
void for_each_segment(std::string_view literal, Fn&& fn) {
    size_t i = 0;
    while (i + 1 < literal.size()) {
        if (literal[i] == '\\') {
            i += 2;
            continue;
        }
        if (literal[i] != '#' || literal[i + 1] != '{') {
            ++i;
            continue;
        }
        size_t begin = i + 2;
        size_t depth = 1;
        size_t j = begin;
        while (j < literal.size() && depth > 0) {
            if (literal[j] == '{') {
                ++depth;
            } else if (literal[j] == '}') {
                --depth;
            }
            if (depth > 0) {
                ++j;
            }
        }
        fn(begin, j);
        i = j + 1;
    }
}

std::string replace_tokens(std::string_view text, const std::vector<IdentifierToken>& tokens,
                           std::string_view from, std::string_view to) {
    std::string out;
    size_t copied = 0;
    for (const auto& token : tokens) {
        if (token.name != from) {
            continue;
        }
        out.append(text.substr(copied, token.offset - copied));
        out.append(to);
        copied = token.offset + token.name.size();
    }
    out.append(text.substr(copied));
    return out;
}

} // namespace

std::vector<IdentifierToken> scan_identifiers(std::string_view text) {
    std::vector<IdentifierToken> out;
    scan_range(text, 0, false, out);
    return out;
}

std::vector<IdentifierToken> scan_interpolation(std::string_view literal, KeywordMode mode) {
    std::vector<IdentifierToken> out;
    for_each_segment(literal, [&](size_t begin, size_t end) {
        scan_range(literal.substr(begin, end - begin), begin, mode == KeywordMode::Keep, out);
    });
    return out;
}

bool has_interpolation(std::string_view literal) {
    bool found = false;
    for_each_segment(literal, [&](size_t, size_t) { found = true; });
    return found;
}

bool contains_identifier(std::string_view text, std::string_view name) {
    for (const auto& token : scan_identifiers(text)) {
        if (token.name == name) {
            return true;
        }
    }
    return false;
}

bool interpolation_contains(std::string_view literal, std::string_view name, KeywordMode mode) {
    for (const auto& token : scan_interpolation(literal, mode)) {
        if (token.name == name) {
            return true;
        }
    }
    return false;
}

std::string replace_identifier(std::string_view text, std::string_view from, std::string_view to) {
    return replace_tokens(text, scan_identifiers(text), from, to);
}

std::string replace_in_interpolation(std::string_view literal, std::string_view from, std::string_view to,
                                     KeywordMode mode) {
    return replace_tokens(literal, scan_interpolation(literal, mode), from, to);
}

} // namespace analysis
