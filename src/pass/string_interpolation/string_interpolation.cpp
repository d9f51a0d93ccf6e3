#include "string_interpolation.hpp"

#include <set>
#include <string_view>

#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "pass/common.hpp"

namespace pass {

namespace {

bool is_concat(const ir::NodePtr& node) {
    auto* op = node->as<ir::BinaryOp>();
    return op && op->op == ir::BinaryOperator::Concat;
}

// Conversions that interpolation performs by itself.
bool is_to_string_call(const ir::NodePtr& node) {
    static const std::set<std::string_view> converters{
        "Kernel.to_string", "Integer.to_string", "Float.to_string", "Atom.to_string", "String.Chars.to_string",
    };
    auto name = call_name(node);
    auto* args = call_args(node);
    if (!name || !args || args->size() != 1) {
        return false;
    }
    return *name == "to_string" || converters.count(*name) > 0;
}

} // namespace

ir::NodePtr StringInterpolation::run(const ir::NodePtr& root) {
    return ir::transform_top_down(root, &StringInterpolation::interpolate);
}

void StringInterpolation::flatten(const ir::NodePtr& node, std::vector<ir::NodePtr>& parts) {
    if (is_concat(node) && node->meta == ir::Metadata{}) {
        auto* op = node->as<ir::BinaryOp>();
        flatten(op->lhs, parts);
        flatten(op->rhs, parts);
        return;
    }
    parts.push_back(node);
}

std::optional<std::string> StringInterpolation::interpolated_text(const ir::NodePtr& node) {
    if (auto name = ir::helper::var_name(node)) {
        return name;
    }
    if (auto* field = node->as<ir::Field>()) {
        auto target = interpolated_text(field->target);
        if (!target) {
            return std::nullopt;
        }
        return *target + "." + field->field;
    }
    if (is_to_string_call(node)) {
        return interpolated_text(call_args(node)->front());
    }
    return std::nullopt;
}

ir::NodePtr StringInterpolation::interpolate(const ir::NodePtr& node) {
    if (!is_concat(node)) {
        return node;
    }
    std::vector<ir::NodePtr> parts;
    auto* op = node->as<ir::BinaryOp>();
    flatten(op->lhs, parts);
    flatten(op->rhs, parts);

    std::string text;
    bool has_literal = false;
    bool has_value = false;
    for (const auto& part : parts) {
        if (auto* literal = ir::helper::string_value(part)) {
            if (literal->find("#{") != std::string::npos) {
                return node;
            }
            text += *literal;
            has_literal = true;
            continue;
        }
        auto inner = interpolated_text(part);
        if (!inner) {
            return node;
        }
        text += "#{" + *inner + "}";
        has_value = true;
    }
    if (!has_literal || !has_value) {
        return node;
    }
    return ir::helper::make_node(ir::Literal{std::move(text)}, node->meta, node->span);
}

} // namespace pass
