#include "rename.hpp"

#include "analysis/identifier_scan.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace analysis {

namespace {

class ReferenceRenamer : public ScopedRewriter<ReferenceRenamer> {
public:
    ReferenceRenamer(std::string_view from, std::string_view to) : from_(from), to_(to) {}

    ir::NodePtr rewrite(const ir::Var& var, const ir::NodePtr& self) {
        if (var.name != from_ || is_bound(from_)) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Var{to_});
    }

    ir::NodePtr rewrite(const ir::Literal& literal, const ir::NodePtr& self) {
        auto* text = std::get_if<std::string>(&literal.value);
        if (!text || is_bound(from_) || !interpolation_contains(*text, from_)) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Literal{replace_in_interpolation(*text, from_, to_)});
    }

    ir::NodePtr rewrite(const ir::Opaque& opaque, const ir::NodePtr& self) {
        if (is_bound(from_) || !contains_identifier(opaque.text, from_)) {
            return self;
        }
        return ir::helper::rebuild(self, ir::Opaque{replace_identifier(opaque.text, from_, to_)});
    }

    ir::PatternPtr rewrite_pattern(const ir::PatternPtr& pattern) {
        if (!pattern || is_bound(from_)) {
            return pattern;
        }
        return rename_pins(pattern);
    }

private:
    ir::PatternPtr rename_pins(const ir::PatternPtr& pattern) {
        if (auto* pin = pattern->as<ir::PinPattern>()) {
            if (pin->name == from_) {
                return ir::helper::rebuild(pattern, ir::PinPattern{to_});
            }
            return pattern;
        }
        return ir::map_subpatterns(pattern, [this](const ir::PatternPtr& sub) { return rename_pins(sub); });
    }

    std::string from_;
    std::string to_;
};

} // namespace

ir::PatternPtr rename_binder(const ir::PatternPtr& pattern, std::string_view from, std::string_view to) {
    if (!pattern) {
        return pattern;
    }
    if (auto* bind = pattern->as<ir::BindPattern>()) {
        if (bind->name == from) {
            return ir::helper::rebuild(pattern, ir::BindPattern{std::string(to)});
        }
        return pattern;
    }
    auto result = ir::map_subpatterns(pattern, [&](const ir::PatternPtr& sub) { return rename_binder(sub, from, to); });
    if (auto* alias = result->as<ir::AliasPattern>(); alias && alias->name == from) {
        return ir::helper::rebuild(result, ir::AliasPattern{alias->pattern, std::string(to)});
    }
    return result;
}

ir::NodePtr rename_references(const ir::NodePtr& node, std::string_view from, std::string_view to) {
    if (from == to) {
        return node;
    }
    ReferenceRenamer renamer(from, to);
    return renamer.rewrite_node(node);
}

} // namespace analysis
