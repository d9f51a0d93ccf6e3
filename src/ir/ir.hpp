#pragma once

#include "span/span.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ir {

// Forward declarations
struct Node;
struct Pattern;

// Trees are immutable once built. A rewrite allocates fresh nodes along the
// spine it changes and shares every untouched subtree with its input.
using NodePtr = std::shared_ptr<const Node>;
using PatternPtr = std::shared_ptr<const Pattern>;

// Side-channel flags set by the upstream builder.
struct Metadata {
    bool early_return = false;     // lowered from a host `return`
    bool carries_mutation = false; // host call mutated its first argument
    bool sentinel = false;         // placeholder literal with no meaning

    bool operator==(const Metadata&) const = default;
};

// --- Literals ---

struct Literal {
    struct Nil {
        bool operator==(const Nil&) const = default;
    };
    struct Atom {
        std::string name;
        bool operator==(const Atom&) const = default;
    };
    // String payloads may carry `#{...}` interpolation segments.
    using Value = std::variant<Nil, bool, int64_t, double, std::string, Atom>;

    Value value;
};

// --- Patterns ---

struct BindPattern {
    std::string name; // "_" is the wildcard
};

struct LiteralPattern {
    Literal value;
};

struct TuplePattern {
    std::vector<PatternPtr> elements;
};

struct ListPattern {
    std::vector<PatternPtr> elements;
};

struct ConsPattern {
    PatternPtr head;
    PatternPtr tail;
};

struct MapPattern {
    std::vector<std::pair<NodePtr, PatternPtr>> entries;
};

struct StructPattern {
    std::string module;
    std::vector<std::pair<std::string, PatternPtr>> fields;
};

// `^name`: compares against an existing binding instead of introducing one.
struct PinPattern {
    std::string name;
};

// `pattern = name`
struct AliasPattern {
    PatternPtr pattern;
    std::string name;
};

struct BinarySegment {
    PatternPtr value;
    std::string spec; // e.g. "integer-size(8)", kept as text
};

struct BinaryPattern {
    std::vector<BinarySegment> segments;
};

using PatternVariant = std::variant<
    BindPattern, LiteralPattern, TuplePattern, ListPattern, ConsPattern,
    MapPattern, StructPattern, PinPattern, AliasPattern, BinaryPattern
>;

struct Pattern {
    PatternVariant value;
    span::Span span = span::Span::invalid();

    explicit Pattern(PatternVariant&& val, span::Span span_ = span::Span::invalid())
        : value(std::move(val)), span(span_) {}

    template <typename T>
    const T* as() const { return std::get_if<T>(&value); }
    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }
};

// --- Expression variants ---

struct Var {
    std::string name;
};

// The value of a block is its last statement.
struct Block {
    std::vector<NodePtr> stmts;
};

// `pattern = value`
struct Match {
    PatternPtr pattern;
    NodePtr value;
};

struct If {
    NodePtr condition;
    NodePtr then_branch;
    NodePtr else_branch; // null when absent
};

struct Clause {
    PatternPtr pattern;
    NodePtr guard; // null when absent
    NodePtr body;
};

struct Case {
    NodePtr subject;
    std::vector<Clause> clauses;
};

struct FnClause {
    std::vector<PatternPtr> params;
    NodePtr guard; // null when absent
    NodePtr body;
};

struct Fn {
    std::vector<FnClause> clauses;
};

struct Def {
    std::string name;
    std::vector<PatternPtr> params;
    NodePtr guard; // null when absent
    NodePtr body;
    bool is_private = false;
};

// Local call `name(args)`.
struct Call {
    std::string function;
    std::vector<NodePtr> args;
};

// Qualified call `Module.name(args)`.
struct RemoteCall {
    std::string module;
    std::string function;
    std::vector<NodePtr> args;
};

// Application of a function value `target.(args)`.
struct Invoke {
    NodePtr target;
    std::vector<NodePtr> args;
};

struct Field {
    NodePtr target;
    std::string field;
};

struct Index {
    NodePtr target;
    NodePtr key;
};

struct Tuple {
    std::vector<NodePtr> elements;
};

struct List {
    std::vector<NodePtr> elements;
};

struct Map {
    std::vector<std::pair<NodePtr, NodePtr>> entries;
};

struct Struct {
    std::string module;
    std::vector<std::pair<std::string, NodePtr>> fields;
};

// `%{base | field: value}`
struct StructUpdate {
    NodePtr base;
    std::vector<std::pair<std::string, NodePtr>> fields;
};

// `lhs |> rhs`, rhs is a call whose first argument is implied.
struct Pipe {
    NodePtr lhs;
    NodePtr rhs;
};

enum class BinaryOperator {
    Add, Subtract, Multiply, Divide,
    Concat,     // <>
    ListConcat, // ++
    ListSubtract, // --
    Equal, NotEqual, StrictEqual, StrictNotEqual,
    Less, Greater, LessEqual, GreaterEqual,
    And, Or, In,
};

struct BinaryOp {
    BinaryOperator op;
    NodePtr lhs;
    NodePtr rhs;
};

enum class UnaryOperator { Not, Negate };

struct UnaryOp {
    UnaryOperator op;
    NodePtr operand;
};

// `pattern <- value` inside `with` and comprehensions.
struct Generator {
    PatternPtr pattern;
    NodePtr source;
};

struct With {
    std::vector<Generator> clauses;
    NodePtr body;
    std::vector<Clause> else_clauses;
};

struct Try {
    NodePtr body;
    std::vector<Clause> rescue_clauses;
    NodePtr after; // null when absent
};

struct Receive {
    std::vector<Clause> clauses;
    NodePtr timeout;    // null when absent
    NodePtr after_body; // null when absent
};

struct For {
    std::vector<Generator> generators;
    std::vector<NodePtr> filters;
    NodePtr body;
};

struct Module {
    std::string name;
    std::vector<NodePtr> body;
};

// Escape hatch for constructs the structured model does not cover.
struct Opaque {
    std::string text;
};

using NodeVariant = std::variant<
    Var, Literal, Block, Match, If, Case, Fn, Def, Call, RemoteCall, Invoke,
    Field, Index, Tuple, List, Map, Struct, StructUpdate, Pipe, BinaryOp, UnaryOp,
    With, Try, Receive, For, Module, Opaque
>;

struct Node {
    NodeVariant value;
    Metadata meta;
    span::Span span = span::Span::invalid();

    explicit Node(NodeVariant&& val, Metadata meta_ = {}, span::Span span_ = span::Span::invalid())
        : value(std::move(val)), meta(meta_), span(span_) {}

    template <typename T>
    const T* as() const { return std::get_if<T>(&value); }
    template <typename T>
    bool is() const { return std::holds_alternative<T>(value); }
};

// --- Operator spelling ---

std::string_view to_string(BinaryOperator op);
std::string_view to_string(UnaryOperator op);
std::optional<BinaryOperator> parse_binary_operator(std::string_view text);
std::optional<UnaryOperator> parse_unary_operator(std::string_view text);

bool is_arithmetic(BinaryOperator op);
bool is_comparison(BinaryOperator op);

} // namespace ir
