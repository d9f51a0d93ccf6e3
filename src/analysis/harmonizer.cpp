#include "harmonizer.hpp"

#include <algorithm>

#include "analysis/identifier_scan.hpp"
#include "analysis/rename.hpp"
#include "analysis/scope_walker.hpp"
#include "analysis/shape.hpp"
#include "ir/helper.hpp"

namespace analysis {

namespace {

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

Shape shape_of_binder(const BindingSite& site, const std::string& binder, bool read) {
    for (const auto& pattern : site.patterns) {
        auto shape = classify_pattern(pattern, binder);
        if (shape != Shape::Unknown) {
            return shape;
        }
    }
    return read ? classify_usage(site.body, binder) : Shape::Unknown;
}

Shape shape_of_use(const BindingSite& site, const std::string& name) {
    auto body_shape = classify_usage(site.body, name);
    auto guard_shape = site.guard ? classify_usage(site.guard, name) : Shape::Unknown;
    if (body_shape == Shape::Unknown) {
        return guard_shape;
    }
    if (guard_shape != Shape::Unknown && guard_shape != body_shape) {
        return Shape::Unknown;
    }
    return body_shape;
}

} // namespace

std::string_view to_string(HarmonizeAction action) {
    switch (action) {
    case HarmonizeAction::Unchanged:
        return "unchanged";
    case HarmonizeAction::Renamed:
        return "renamed";
    case HarmonizeAction::Ambiguous:
        return "ambiguous";
    case HarmonizeAction::ShapeMismatch:
        return "shape-mismatch";
    }
    return "unknown";
}

HarmonizeResult harmonize(const BindingSite& site, const NameSet& enclosing, const HarmonizePolicy& policy) {
    HarmonizeResult result;
    result.site = site;

    auto binders = bound_names(site.patterns);

    NameSet declared = enclosing;
    declared.insert(binders.begin(), binders.end());
    for (const auto& name : declared_in_subtree(site.body)) {
        declared.insert(name);
    }
    for (const auto& name : declared_in_subtree(site.guard)) {
        declared.insert(name);
    }

    NameSet used = referenced_names(site.body);
    for (const auto& name : referenced_names(site.guard)) {
        used.insert(name);
    }

    for (const auto& name : used) {
        if (!declared.count(name)) {
            result.undefined.push_back(name);
        }
    }

    if (result.undefined.empty()) {
        return result;
    }

    std::string target;
    if (result.undefined.size() == 1) {
        target = result.undefined.front();
    } else {
        if (!policy.allow_tie_break) {
            result.action = HarmonizeAction::Ambiguous;
            return result;
        }
        for (const auto& name : policy.tie_break_names) {
            if (contains(result.undefined, name)) {
                target = name;
                break;
            }
        }
        if (target.empty()) {
            result.action = HarmonizeAction::Ambiguous;
            return result;
        }
    }
    if (is_target_keyword(target)) {
        return result;
    }

    std::vector<std::string> pool;
    for (const auto& binder : binders) {
        if (!policy.candidates || contains(*policy.candidates, binder)) {
            pool.push_back(binder);
        }
    }
    if (pool.empty()) {
        return result;
    }

    std::string chosen;
    for (const auto& binder : pool) {
        if (ir::helper::is_underscored(binder) && ir::helper::strip_underscore(binder) == target) {
            chosen = binder;
            break;
        }
    }
    if (chosen.empty()) {
        std::vector<std::string> unread;
        for (const auto& binder : pool) {
            if (!used.count(binder)) {
                unread.push_back(binder);
            }
        }
        if (unread.size() > 1) {
            result.action = HarmonizeAction::Ambiguous;
            return result;
        }
        if (unread.empty()) {
            // a read binder already names another value
            return result;
        }
        chosen = unread.front();
    }

    bool chosen_is_read = used.count(chosen) > 0;
    if (shapes_conflict(shape_of_binder(site, chosen, chosen_is_read), shape_of_use(site, target))) {
        result.action = HarmonizeAction::ShapeMismatch;
        return result;
    }

    BindingSite rewritten;
    for (const auto& pattern : site.patterns) {
        rewritten.patterns.push_back(rename_binder(pattern, chosen, target));
    }
    rewritten.guard = site.guard;
    rewritten.body = site.body;
    if (chosen_is_read) {
        rewritten.guard = rename_references(site.guard, chosen, target);
        rewritten.body = rename_references(site.body, chosen, target);
    }

    result.action = HarmonizeAction::Renamed;
    result.site = std::move(rewritten);
    result.from = chosen;
    result.to = target;
    return result;
}

} // namespace analysis
