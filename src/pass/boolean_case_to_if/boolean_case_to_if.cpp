#include "boolean_case_to_if.hpp"

#include <optional>
#include <string>

#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

namespace {

std::optional<bool> boolean_pattern(const ir::PatternPtr& pattern) {
    auto* literal = pattern->as<ir::LiteralPattern>();
    if (!literal) {
        return std::nullopt;
    }
    if (auto* value = std::get_if<bool>(&literal->value.value)) {
        return *value;
    }
    return std::nullopt;
}

bool is_catch_all(const ir::PatternPtr& pattern) {
    auto name = ir::helper::binder_name(pattern);
    return name && *name == "_";
}

// Evaluates to `true` or `false`, never to another truthy value.
bool is_boolean(const ir::NodePtr& node) {
    if (ir::helper::is_bool_literal(node, true) || ir::helper::is_bool_literal(node, false)) {
        return true;
    }
    if (auto* op = node->as<ir::BinaryOp>()) {
        switch (op->op) {
        case ir::BinaryOperator::Equal:
        case ir::BinaryOperator::NotEqual:
        case ir::BinaryOperator::StrictEqual:
        case ir::BinaryOperator::StrictNotEqual:
        case ir::BinaryOperator::Less:
        case ir::BinaryOperator::Greater:
        case ir::BinaryOperator::LessEqual:
        case ir::BinaryOperator::GreaterEqual:
        case ir::BinaryOperator::In:
            return true;
        case ir::BinaryOperator::And:
        case ir::BinaryOperator::Or:
            return is_boolean(op->lhs) && is_boolean(op->rhs);
        default:
            return false;
        }
    }
    if (auto* op = node->as<ir::UnaryOp>()) {
        return op->op == ir::UnaryOperator::Not;
    }
    const std::string* function = nullptr;
    if (auto* call = node->as<ir::Call>()) {
        function = &call->function;
    } else if (auto* call = node->as<ir::RemoteCall>()) {
        function = &call->function;
    }
    return function && !function->empty() && function->back() == '?';
}

} // namespace

ir::NodePtr BooleanCaseToIf::run(const ir::NodePtr& root) {
    return ir::transform_bottom_up(root, &BooleanCaseToIf::convert);
}

ir::NodePtr BooleanCaseToIf::convert(const ir::NodePtr& node) {
    auto* select = node->as<ir::Case>();
    if (!select || select->clauses.size() != 2) {
        return node;
    }
    const auto& first = select->clauses[0];
    const auto& second = select->clauses[1];
    if (first.guard || second.guard) {
        return node;
    }

    auto first_value = boolean_pattern(first.pattern);
    auto second_value = boolean_pattern(second.pattern);
    ir::NodePtr then_branch;
    ir::NodePtr else_branch;
    if (first_value && second_value && *first_value != *second_value) {
        then_branch = *first_value ? first.body : second.body;
        else_branch = *first_value ? second.body : first.body;
    } else if (first_value && *first_value && is_catch_all(second.pattern) && is_boolean(select->subject)) {
        then_branch = first.body;
        else_branch = second.body;
    } else {
        return node;
    }

    if (ir::helper::is_nil(else_branch) && else_branch->meta == ir::Metadata{}) {
        else_branch = nullptr;
    }
    return ir::helper::rebuild(node, ir::If{select->subject, then_branch, else_branch});
}

} // namespace pass
