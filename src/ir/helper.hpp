#pragma once

#include "ir/ir.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ir {

namespace helper {

// --- Construction ---

inline NodePtr make_node(NodeVariant value, Metadata meta = {}, span::Span span = span::Span::invalid()) {
    return std::make_shared<const Node>(std::move(value), meta, span);
}

inline PatternPtr make_pattern(PatternVariant value, span::Span span = span::Span::invalid()) {
    return std::make_shared<const Pattern>(std::move(value), span);
}

// New node that keeps the metadata and position of `original`.
inline NodePtr rebuild(const NodePtr& original, NodeVariant value) {
    return make_node(std::move(value), original->meta, original->span);
}

inline PatternPtr rebuild(const PatternPtr& original, PatternVariant value) {
    return make_pattern(std::move(value), original->span);
}

inline NodePtr with_meta(const NodePtr& node, Metadata meta) {
    if (node->meta == meta) {
        return node;
    }
    NodeVariant copy = node->value;
    return make_node(std::move(copy), meta, node->span);
}

inline NodePtr var(std::string name) { return make_node(Var{std::move(name)}); }
inline NodePtr nil() { return make_node(Literal{Literal::Nil{}}); }
inline NodePtr boolean(bool value) { return make_node(Literal{value}); }
inline NodePtr integer(int64_t value) { return make_node(Literal{value}); }
inline NodePtr string_lit(std::string value) { return make_node(Literal{std::move(value)}); }
inline NodePtr atom(std::string name) { return make_node(Literal{Literal::Atom{std::move(name)}}); }
inline NodePtr block(std::vector<NodePtr> stmts) { return make_node(Block{std::move(stmts)}); }
inline NodePtr tuple(std::vector<NodePtr> elements) { return make_node(Tuple{std::move(elements)}); }
inline NodePtr match(PatternPtr pattern, NodePtr value) {
    return make_node(Match{std::move(pattern), std::move(value)});
}

inline PatternPtr bind(std::string name) { return make_pattern(BindPattern{std::move(name)}); }
inline PatternPtr tuple_pattern(std::vector<PatternPtr> elements) {
    return make_pattern(TuplePattern{std::move(elements)});
}

// Binds `names` as a single binder or as a tuple of binders.
inline PatternPtr bind_all(const std::vector<std::string>& names) {
    if (names.size() == 1) {
        return bind(names.front());
    }
    std::vector<PatternPtr> elements;
    for (const auto& name : names) {
        elements.push_back(bind(name));
    }
    return tuple_pattern(std::move(elements));
}

inline NodePtr read_all(const std::vector<std::string>& names) {
    if (names.size() == 1) {
        return var(names.front());
    }
    std::vector<NodePtr> elements;
    for (const auto& name : names) {
        elements.push_back(var(name));
    }
    return tuple(std::move(elements));
}

// --- Queries ---

inline std::optional<std::string> var_name(const NodePtr& node) {
    if (!node) {
        return std::nullopt;
    }
    if (auto* v = node->as<Var>()) {
        return v->name;
    }
    return std::nullopt;
}

inline std::optional<std::string> binder_name(const PatternPtr& pattern) {
    if (!pattern) {
        return std::nullopt;
    }
    if (auto* b = pattern->as<BindPattern>()) {
        return b->name;
    }
    return std::nullopt;
}

inline bool is_nil(const NodePtr& node) {
    auto* lit = node ? node->as<Literal>() : nullptr;
    return lit && std::holds_alternative<Literal::Nil>(lit->value);
}

inline bool is_bool_literal(const NodePtr& node, bool expected) {
    auto* lit = node ? node->as<Literal>() : nullptr;
    if (!lit) {
        return false;
    }
    auto* value = std::get_if<bool>(&lit->value);
    return value && *value == expected;
}

inline bool is_string_literal(const NodePtr& node) {
    auto* lit = node ? node->as<Literal>() : nullptr;
    return lit && std::holds_alternative<std::string>(lit->value);
}

inline const std::string* string_value(const NodePtr& node) {
    auto* lit = node ? node->as<Literal>() : nullptr;
    return lit ? std::get_if<std::string>(&lit->value) : nullptr;
}

// Literals the lowering stage leaves behind as placeholders.
inline bool is_sentinel_literal(const NodePtr& node) {
    auto* lit = node ? node->as<Literal>() : nullptr;
    if (!lit) {
        return false;
    }
    return std::holds_alternative<Literal::Nil>(lit->value) ||
           std::holds_alternative<int64_t>(lit->value) ||
           std::holds_alternative<double>(lit->value);
}

// Any literal whose evaluation has no effect.
inline bool is_pure_literal(const NodePtr& node) {
    return node && node->is<Literal>();
}

inline bool is_wildcard(const std::string& name) { return name == "_"; }
inline bool is_underscored(const std::string& name) { return !name.empty() && name.front() == '_'; }

inline std::string underscore(const std::string& name) {
    return is_underscored(name) ? name : "_" + name;
}

inline std::string strip_underscore(const std::string& name) {
    size_t i = 0;
    while (i < name.size() && name[i] == '_') {
        ++i;
    }
    return name.substr(i);
}

// Statements of a node seen as a statement list; a non-block is a list of one.
inline std::vector<NodePtr> statements_of(const NodePtr& node) {
    if (!node) {
        return {};
    }
    if (auto* b = node->as<Block>()) {
        return b->stmts;
    }
    return {node};
}

// Collapses a statement list back into one node.
inline NodePtr from_statements(std::vector<NodePtr> stmts, span::Span span = span::Span::invalid()) {
    if (stmts.empty()) {
        return make_node(Literal{Literal::Nil{}}, {}, span);
    }
    if (stmts.size() == 1) {
        return stmts.front();
    }
    return make_node(Block{std::move(stmts)}, {}, span);
}

// Value-producing tail of a statement list.
inline const NodePtr& terminal_of(const NodePtr& node) {
    if (auto* b = node->as<Block>(); b && !b->stmts.empty()) {
        return terminal_of(b->stmts.back());
    }
    return node;
}

/* Below are "invariant" helpers for fields that the data model guarantees.
 * A violation indicates a malformed builder or a defective pass.
 */

inline const Def& get_def(const NodePtr& node) {
    if (auto* def = node ? node->as<Def>() : nullptr) {
        return *def;
    }
    throw std::logic_error("Node is not a function definition - invariant violation");
}

inline const NodePtr& get_body(const Def& def) {
    if (def.body) {
        return def.body;
    }
    throw std::logic_error("Function definition without body - invariant violation");
}

} // namespace helper

} // namespace ir
