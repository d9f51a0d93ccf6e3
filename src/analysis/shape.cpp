#include "shape.hpp"

#include <functional>

#include "ir/helper.hpp"
#include "ir/traversal.hpp"
#include "utils/overloaded.hpp"

namespace analysis {

namespace {

struct Evidence {
    bool scalar = false;
    bool structured = false;

    Shape result() const {
        if (scalar == structured) {
            return Shape::Unknown;
        }
        return scalar ? Shape::Scalar : Shape::Structured;
    }
};

bool is_named(const ir::NodePtr& node, std::string_view name) {
    auto var = ir::helper::var_name(node);
    return var && *var == name;
}

bool is_destructuring(const ir::PatternPtr& pattern) {
    return pattern && (pattern->is<ir::MapPattern>() || pattern->is<ir::StructPattern>());
}

bool is_container(const ir::PatternPtr& pattern) {
    return pattern && (pattern->is<ir::MapPattern>() || pattern->is<ir::StructPattern>() ||
                       pattern->is<ir::TuplePattern>() || pattern->is<ir::ListPattern>() ||
                       pattern->is<ir::ConsPattern>());
}

bool is_scalar_spec(std::string_view spec) {
    for (std::string_view kind : {"integer", "float", "binary", "bytes", "utf8", "bits"}) {
        if (spec.substr(0, kind.size()) == kind) {
            return true;
        }
    }
    return false;
}

void gather(const ir::NodePtr& node, std::string_view name, Evidence& evidence) {
    if (!node) {
        return;
    }
    std::visit(Overloaded{
        [&](const ir::Field& v) { evidence.structured = evidence.structured || is_named(v.target, name); },
        [&](const ir::Index& v) { evidence.structured = evidence.structured || is_named(v.target, name); },
        [&](const ir::StructUpdate& v) { evidence.structured = evidence.structured || is_named(v.base, name); },
        [&](const ir::Match& v) {
            evidence.structured = evidence.structured || (is_named(v.value, name) && is_destructuring(v.pattern));
        },
        [&](const ir::Case& v) {
            if (!is_named(v.subject, name)) {
                return;
            }
            for (const auto& clause : v.clauses) {
                evidence.structured = evidence.structured || is_destructuring(clause.pattern);
            }
        },
        [&](const ir::BinaryOp& v) {
            bool operand = is_named(v.lhs, name) || is_named(v.rhs, name);
            if (operand && (ir::is_arithmetic(v.op) || ir::is_comparison(v.op) ||
                            v.op == ir::BinaryOperator::Concat)) {
                evidence.scalar = true;
            }
        },
        [&](const auto&) {},
    }, node->value);
    ir::for_each_child(*node, [&](const ir::NodePtr& child) { gather(child, name, evidence); });
}

Shape binder_shape(const ir::PatternPtr& pattern, std::string_view name, Shape context) {
    if (!pattern) {
        return Shape::Unknown;
    }
    if (auto* bind = pattern->as<ir::BindPattern>()) {
        return bind->name == name ? context : Shape::Unknown;
    }
    if (auto* alias = pattern->as<ir::AliasPattern>()) {
        if (alias->name == name) {
            return is_container(alias->pattern) ? Shape::Structured : Shape::Unknown;
        }
        return binder_shape(alias->pattern, name, Shape::Unknown);
    }
    if (auto* binary = pattern->as<ir::BinaryPattern>()) {
        for (const auto& segment : binary->segments) {
            auto shape = binder_shape(segment.value, name,
                                      is_scalar_spec(segment.spec) ? Shape::Scalar : Shape::Unknown);
            if (shape != Shape::Unknown) {
                return shape;
            }
        }
        return Shape::Unknown;
    }
    Shape found = Shape::Unknown;
    ir::for_each_subpattern(*pattern, [&](const ir::PatternPtr& sub) {
        if (found == Shape::Unknown) {
            found = binder_shape(sub, name, Shape::Unknown);
        }
    });
    return found;
}

} // namespace

std::string_view to_string(Shape shape) {
    switch (shape) {
    case Shape::Unknown:
        return "unknown";
    case Shape::Scalar:
        return "scalar";
    case Shape::Structured:
        return "structured";
    }
    return "unknown";
}

Shape classify_usage(const ir::NodePtr& node, std::string_view name) {
    Evidence evidence;
    gather(node, name, evidence);
    return evidence.result();
}

Shape classify_pattern(const ir::PatternPtr& pattern, std::string_view name) {
    return binder_shape(pattern, name, Shape::Unknown);
}

bool shapes_conflict(Shape a, Shape b) {
    return a != Shape::Unknown && b != Shape::Unknown && a != b;
}

} // namespace analysis
