#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "span/span.hpp"

namespace ir::reader {

enum class TokenKind {
    LParen,
    RParen,
    Symbol,  // identifiers, operators, form names
    Integer,
    Float,
    String,  // escapes already resolved
    Atom,    // `:name` or `:"quoted"`, without the colon
    End,
};

struct Token {
    TokenKind kind;
    std::string text;
    span::Span span{};
};

// Splits IR text into tokens. `;` starts a comment running to end of line.
class Lexer {
public:
    Lexer(std::string_view input, span::DumpId dump = span::kNoDump)
        : input_(input), dump_(dump) {}

    const std::vector<Token>& tokenize();

private:
    void parse_next();
    void skip_whitespace_and_comments();

    Token parse_string();
    Token parse_atom();
    Token parse_symbol_or_number();

    char parse_escape_sequence();

    bool eof() const { return pos_ >= input_.size(); }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
    }

    span::Span make_span(size_t start, size_t end) const {
        return {dump_, static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
    }

    std::string_view input_;
    span::DumpId dump_;
    size_t pos_ = 0;
    std::vector<Token> tokens_;
};

bool is_symbol_char(char c);

} // namespace ir::reader
