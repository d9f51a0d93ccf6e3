#include "lexer.hpp"

#include <cctype>

#include "utils/error.hpp"

namespace ir::reader {

bool is_symbol_char(char c) {
    return c != '\0' && !std::isspace(static_cast<unsigned char>(c)) && c != '(' && c != ')' && c != '"' &&
           c != ';';
}

namespace {

bool looks_numeric(std::string_view text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        ++i;
    }
    return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]));
}

bool is_float_text(std::string_view text) {
    return text.find_first_of(".eE") != std::string_view::npos;
}

} // namespace

const std::vector<Token>& Lexer::tokenize() {
    tokens_.clear();
    pos_ = 0;
    while (true) {
        skip_whitespace_and_comments();
        if (eof()) {
            break;
        }
        parse_next();
    }
    tokens_.push_back(Token{TokenKind::End, "EOF", make_span(pos_, pos_)});
    return tokens_;
}

void Lexer::skip_whitespace_and_comments() {
    while (!eof()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
        } else if (c == ';') {
            while (!eof() && peek() != '\n') {
                ++pos_;
            }
        } else {
            break;
        }
    }
}

void Lexer::parse_next() {
    size_t start = pos_;
    Token token;
    char c = peek();
    if (c == '(') {
        ++pos_;
        token = Token{TokenKind::LParen, "(", {}};
    } else if (c == ')') {
        ++pos_;
        token = Token{TokenKind::RParen, ")", {}};
    } else if (c == '"') {
        token = parse_string();
    } else if (c == ':' && (peek(1) == '"' || is_symbol_char(peek(1)))) {
        token = parse_atom();
    } else {
        token = parse_symbol_or_number();
    }
    token.span = make_span(start, pos_);
    tokens_.push_back(std::move(token));
}

Token Lexer::parse_string() {
    size_t start = pos_;
    ++pos_; // opening quote
    std::string value;
    while (true) {
        if (eof()) {
            throw ReaderError("Unterminated string literal", make_span(start, pos_));
        }
        char c = peek();
        if (c == '"') {
            ++pos_;
            break;
        }
        if (c == '\\') {
            value += parse_escape_sequence();
            continue;
        }
        value += c;
        ++pos_;
    }
    return Token{TokenKind::String, std::move(value), {}};
}

char Lexer::parse_escape_sequence() {
    size_t start = pos_;
    ++pos_; // backslash
    if (eof()) {
        throw ReaderError("Unterminated escape sequence", make_span(start, pos_));
    }
    char c = peek();
    ++pos_;
    switch (c) {
    case '"':
        return '"';
    case '\\':
        return '\\';
    case 'n':
        return '\n';
    case 't':
        return '\t';
    default:
        throw ReaderError(std::string("Unknown escape sequence '\\") + c + "'", make_span(start, pos_));
    }
}

Token Lexer::parse_atom() {
    ++pos_; // colon
    if (peek() == '"') {
        Token quoted = parse_string();
        return Token{TokenKind::Atom, std::move(quoted.text), {}};
    }
    size_t start = pos_;
    while (is_symbol_char(peek())) {
        ++pos_;
    }
    return Token{TokenKind::Atom, std::string(input_.substr(start, pos_ - start)), {}};
}

Token Lexer::parse_symbol_or_number() {
    size_t start = pos_;
    while (is_symbol_char(peek())) {
        ++pos_;
    }
    if (pos_ == start) {
        throw ReaderError(std::string("Unrecognized character: '") + peek() + "'", make_span(start, start + 1));
    }
    std::string text(input_.substr(start, pos_ - start));
    if (looks_numeric(text)) {
        return Token{is_float_text(text) ? TokenKind::Float : TokenKind::Integer, std::move(text), {}};
    }
    return Token{TokenKind::Symbol, std::move(text), {}};
}

} // namespace ir::reader
