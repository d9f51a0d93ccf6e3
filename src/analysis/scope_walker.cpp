#include "scope_walker.hpp"

#include <functional>
#include <unordered_set>

#include "analysis/identifier_scan.hpp"
#include "analysis/scoped_rewriter.hpp"
#include "ir/traversal.hpp"
#include "utils/overloaded.hpp"

namespace analysis {

namespace {

void collect_binders(const ir::PatternPtr& pattern, std::vector<std::string>& out,
                     std::unordered_set<std::string>& seen) {
    if (!pattern) {
        return;
    }
    auto add = [&](const std::string& name) {
        if (!is_wildcard_name(name) && seen.insert(name).second) {
            out.push_back(name);
        }
    };
    if (auto* bind = pattern->as<ir::BindPattern>()) {
        add(bind->name);
        return;
    }
    if (pattern->is<ir::PinPattern>()) {
        return;
    }
    ir::for_each_subpattern(*pattern, [&](const ir::PatternPtr& sub) { collect_binders(sub, out, seen); });
    if (auto* alias = pattern->as<ir::AliasPattern>()) {
        add(alias->name);
    }
}

void collect_pattern_reads(const ir::PatternPtr& pattern, NameSet& out) {
    if (!pattern) {
        return;
    }
    if (auto* pin = pattern->as<ir::PinPattern>()) {
        out.insert(pin->name);
        return;
    }
    if (auto* map = pattern->as<ir::MapPattern>()) {
        for (const auto& entry : map->entries) {
            for (const auto& name : all_read_names(entry.first)) {
                out.insert(name);
            }
        }
    }
    ir::for_each_subpattern(*pattern, [&](const ir::PatternPtr& sub) { collect_pattern_reads(sub, out); });
}

// Free reads, computed with the scope chain of ScopedRewriter. Nothing is
// rewritten; every hook returns its input.
class FreeReadCollector : public ScopedRewriter<FreeReadCollector> {
public:
    NameSet names;

    ir::NodePtr rewrite(const ir::Var& var, const ir::NodePtr& self) {
        note(var.name);
        return self;
    }

    ir::NodePtr rewrite(const ir::Literal& literal, const ir::NodePtr& self) {
        if (auto* text = std::get_if<std::string>(&literal.value)) {
            for (const auto& token : scan_interpolation(*text)) {
                note(token.name);
            }
        }
        return self;
    }

    ir::NodePtr rewrite(const ir::Opaque& opaque, const ir::NodePtr& self) {
        for (const auto& token : scan_identifiers(opaque.text)) {
            note(token.name);
        }
        return self;
    }

    ir::PatternPtr rewrite_pattern(const ir::PatternPtr& pattern) {
        for (const auto& name : pattern_reads(pattern)) {
            note(name);
        }
        return pattern;
    }

private:
    void note(std::string_view name) {
        if (is_wildcard_name(name) || is_bound(name)) {
            return;
        }
        names.emplace(name);
    }
};

template <typename Fn>
void walk_all(const ir::NodePtr& node, Fn&& fn) {
    if (!node) {
        return;
    }
    fn(node);
    ir::for_each_child(*node, [&](const ir::NodePtr& child) { walk_all(child, fn); });
}

} // namespace

bool is_wildcard_name(std::string_view name) {
    return name.empty() || name.find_first_not_of('_') == std::string_view::npos;
}

std::vector<std::string> bound_names(const ir::PatternPtr& pattern) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    collect_binders(pattern, out, seen);
    return out;
}

std::vector<std::string> bound_names(const std::vector<ir::PatternPtr>& patterns) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& pattern : patterns) {
        collect_binders(pattern, out, seen);
    }
    return out;
}

NameSet pattern_reads(const ir::PatternPtr& pattern) {
    NameSet out;
    collect_pattern_reads(pattern, out);
    return out;
}

NameSet declared_in_subtree(const ir::NodePtr& node) {
    NameSet out;
    walk_all(node, [&](const ir::NodePtr& current) {
        ir::for_each_pattern(*current, [&](const ir::PatternPtr& pattern) {
            for (auto& name : bound_names(pattern)) {
                out.insert(std::move(name));
            }
        });
    });
    return out;
}

NameSet referenced_names(const ir::NodePtr& node, VisitStats* stats) {
    FreeReadCollector collector;
    collector.set_stats(stats);
    collector.rewrite_node(node);
    return std::move(collector.names);
}

NameSet all_read_names(const ir::NodePtr& node) {
    NameSet out;
    walk_all(node, [&](const ir::NodePtr& current) {
        std::visit(Overloaded{
            [&](const ir::Var& var) {
                if (!is_wildcard_name(var.name)) {
                    out.insert(var.name);
                }
            },
            [&](const ir::Literal& literal) {
                if (auto* text = std::get_if<std::string>(&literal.value)) {
                    for (const auto& token : scan_interpolation(*text)) {
                        out.emplace(token.name);
                    }
                }
            },
            [&](const ir::Opaque& opaque) {
                for (const auto& token : scan_identifiers(opaque.text)) {
                    out.emplace(token.name);
                }
            },
            [&](const auto&) {},
        }, current->value);
        ir::for_each_pattern(*current, [&](const ir::PatternPtr& pattern) {
            for (const auto& name : pattern_reads(pattern)) {
                out.insert(name);
            }
        });
    });
    return out;
}

bool mentions(const ir::NodePtr& node, std::string_view name) {
    return all_read_names(node).count(name) > 0;
}

} // namespace analysis
