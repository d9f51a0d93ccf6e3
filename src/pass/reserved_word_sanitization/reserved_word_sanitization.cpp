#include "reserved_word_sanitization.hpp"

#include "analysis/identifier_scan.hpp"
#include "analysis/scope_walker.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/helper.hpp"
#include "ir/traversal.hpp"

namespace pass {

namespace {

// Replacement names never occur in the input, so a bound replacement means
// the reserved binder it came from is the innermost one in scope.
class Sanitizer : public analysis::ScopedRewriter<Sanitizer> {
public:
    explicit Sanitizer(const analysis::RenameMap& renames) : renames_(renames) {}

    ir::NodePtr rewrite(const ir::Var& var, const ir::NodePtr& self) {
        auto replacement = bound_replacement(var.name);
        return replacement ? ir::helper::rebuild(self, ir::Var{*replacement}) : self;
    }

    ir::NodePtr rewrite(const ir::Literal& literal, const ir::NodePtr& self) {
        auto* text = std::get_if<std::string>(&literal.value);
        if (!text) {
            return self;
        }
        auto updated = *text;
        for (const auto& [from, to] : renames_) {
            if (is_bound(to) && analysis::interpolation_contains(updated, from, analysis::KeywordMode::Keep)) {
                updated = analysis::replace_in_interpolation(updated, from, to, analysis::KeywordMode::Keep);
            }
        }
        return updated == *text ? self : ir::helper::rebuild(self, ir::Literal{std::move(updated)});
    }

    ir::PatternPtr rewrite_pattern(const ir::PatternPtr& pattern) {
        if (!pattern) {
            return pattern;
        }
        auto result = rename_pins(pattern);
        for (const auto& name : analysis::bound_names(result)) {
            if (auto it = renames_.find(name); it != renames_.end()) {
                result = analysis::rename_binder(result, name, it->second);
            }
        }
        return result;
    }

private:
    const std::string* bound_replacement(const std::string& name) const {
        auto it = renames_.find(name);
        if (it == renames_.end() || !is_bound(it->second)) {
            return nullptr;
        }
        return &it->second;
    }

    ir::PatternPtr rename_pins(const ir::PatternPtr& pattern) {
        if (auto* pin = pattern->as<ir::PinPattern>()) {
            auto replacement = bound_replacement(pin->name);
            return replacement ? ir::helper::rebuild(pattern, ir::PinPattern{*replacement}) : pattern;
        }
        return ir::map_subpatterns(pattern, [this](const ir::PatternPtr& sub) { return rename_pins(sub); });
    }

    const analysis::RenameMap& renames_;
};

} // namespace

analysis::RenameMap ReservedWordSanitization::plan(const analysis::NameSet& names, const pipeline::NameSet& reserved) {
    analysis::RenameMap renames;
    for (const auto& name : names) {
        if (!reserved.count(name)) {
            continue;
        }
        auto replacement = name + "_";
        while (names.count(replacement) || reserved.count(replacement)) {
            replacement += "_";
        }
        renames.emplace(name, std::move(replacement));
    }
    return renames;
}

ir::NodePtr ReservedWordSanitization::run(const ir::NodePtr& root) {
    auto names = analysis::declared_in_subtree(root);
    for (const auto& name : analysis::all_read_names(root)) {
        names.insert(name);
    }
    auto renames = plan(names, context_.options().reserved_words);
    if (renames.empty()) {
        return root;
    }
    Sanitizer sanitizer(renames);
    return sanitizer.rewrite_node(root);
}

} // namespace pass
