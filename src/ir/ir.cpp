#include "ir.hpp"

#include <array>

namespace ir {

namespace {

struct BinarySpelling {
    BinaryOperator op;
    std::string_view text;
};

constexpr std::array<BinarySpelling, 19> kBinarySpellings{{
    {BinaryOperator::Add, "+"},
    {BinaryOperator::Subtract, "-"},
    {BinaryOperator::Multiply, "*"},
    {BinaryOperator::Divide, "/"},
    {BinaryOperator::Concat, "<>"},
    {BinaryOperator::ListConcat, "++"},
    {BinaryOperator::ListSubtract, "--"},
    {BinaryOperator::Equal, "=="},
    {BinaryOperator::NotEqual, "!="},
    {BinaryOperator::StrictEqual, "==="},
    {BinaryOperator::StrictNotEqual, "!=="},
    {BinaryOperator::Less, "<"},
    {BinaryOperator::Greater, ">"},
    {BinaryOperator::LessEqual, "<="},
    {BinaryOperator::GreaterEqual, ">="},
    {BinaryOperator::And, "and"},
    {BinaryOperator::Or, "or"},
    {BinaryOperator::In, "in"},
    // `&&`/`||` read as and/or
    {BinaryOperator::And, "&&"},
}};

} // namespace

std::string_view to_string(BinaryOperator op) {
    for (const auto& spelling : kBinarySpellings) {
        if (spelling.op == op) {
            return spelling.text;
        }
    }
    return "?";
}

std::string_view to_string(UnaryOperator op) {
    switch (op) {
    case UnaryOperator::Not:
        return "not";
    case UnaryOperator::Negate:
        return "neg";
    }
    return "?";
}

std::optional<BinaryOperator> parse_binary_operator(std::string_view text) {
    if (text == "||") {
        return BinaryOperator::Or;
    }
    for (const auto& spelling : kBinarySpellings) {
        if (spelling.text == text) {
            return spelling.op;
        }
    }
    return std::nullopt;
}

std::optional<UnaryOperator> parse_unary_operator(std::string_view text) {
    if (text == "not" || text == "!") {
        return UnaryOperator::Not;
    }
    if (text == "neg") {
        return UnaryOperator::Negate;
    }
    return std::nullopt;
}

bool is_arithmetic(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Add:
    case BinaryOperator::Subtract:
    case BinaryOperator::Multiply:
    case BinaryOperator::Divide:
        return true;
    default:
        return false;
    }
}

bool is_comparison(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Less:
    case BinaryOperator::Greater:
    case BinaryOperator::LessEqual:
    case BinaryOperator::GreaterEqual:
        return true;
    default:
        return false;
    }
}

} // namespace ir
