#include "traversal.hpp"

#include "ir/helper.hpp"
#include "utils/overloaded.hpp"

#include <utility>

namespace ir {

namespace {

class ChildMapper {
public:
    explicit ChildMapper(const NodeFn& fn) : fn_(fn) {}

    NodePtr operator()(const NodePtr& child) {
        if (!child) {
            return child;
        }
        auto result = fn_(child);
        if (result != child) {
            changed = true;
        }
        return result;
    }

    std::vector<NodePtr> all(const std::vector<NodePtr>& nodes) {
        std::vector<NodePtr> out;
        out.reserve(nodes.size());
        for (const auto& node : nodes) {
            out.push_back((*this)(node));
        }
        return out;
    }

    std::vector<Clause> clauses(const std::vector<Clause>& clauses) {
        std::vector<Clause> out;
        out.reserve(clauses.size());
        for (const auto& clause : clauses) {
            out.push_back(Clause{clause.pattern, (*this)(clause.guard), (*this)(clause.body)});
        }
        return out;
    }

    std::vector<Generator> generators(const std::vector<Generator>& generators) {
        std::vector<Generator> out;
        out.reserve(generators.size());
        for (const auto& generator : generators) {
            out.push_back(Generator{generator.pattern, (*this)(generator.source)});
        }
        return out;
    }

    template <typename Key>
    std::vector<std::pair<Key, NodePtr>> values(const std::vector<std::pair<Key, NodePtr>>& entries) {
        std::vector<std::pair<Key, NodePtr>> out;
        out.reserve(entries.size());
        for (const auto& [key, value] : entries) {
            out.emplace_back(key, (*this)(value));
        }
        return out;
    }

    bool changed = false;

private:
    const NodeFn& fn_;
};

class PatternMapper {
public:
    explicit PatternMapper(const PatternFn& fn) : fn_(fn) {}

    PatternPtr operator()(const PatternPtr& pattern) {
        if (!pattern) {
            return pattern;
        }
        auto result = fn_(pattern);
        if (result != pattern) {
            changed = true;
        }
        return result;
    }

    std::vector<PatternPtr> all(const std::vector<PatternPtr>& patterns) {
        std::vector<PatternPtr> out;
        out.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            out.push_back((*this)(pattern));
        }
        return out;
    }

    std::vector<Clause> clauses(const std::vector<Clause>& clauses) {
        std::vector<Clause> out;
        out.reserve(clauses.size());
        for (const auto& clause : clauses) {
            out.push_back(Clause{(*this)(clause.pattern), clause.guard, clause.body});
        }
        return out;
    }

    std::vector<Generator> generators(const std::vector<Generator>& generators) {
        std::vector<Generator> out;
        out.reserve(generators.size());
        for (const auto& generator : generators) {
            out.push_back(Generator{(*this)(generator.pattern), generator.source});
        }
        return out;
    }

    bool changed = false;

private:
    const PatternFn& fn_;
};

} // namespace

NodePtr map_children(const NodePtr& node, const NodeFn& fn) {
    if (!node) {
        return node;
    }
    ChildMapper m(fn);
    NodeVariant mapped = std::visit(Overloaded{
        [&](const Var& v) -> NodeVariant { return v; },
        [&](const Literal& v) -> NodeVariant { return v; },
        [&](const Opaque& v) -> NodeVariant { return v; },
        [&](const Block& v) -> NodeVariant { return Block{m.all(v.stmts)}; },
        [&](const Match& v) -> NodeVariant { return Match{v.pattern, m(v.value)}; },
        [&](const If& v) -> NodeVariant {
            return If{m(v.condition), m(v.then_branch), m(v.else_branch)};
        },
        [&](const Case& v) -> NodeVariant { return Case{m(v.subject), m.clauses(v.clauses)}; },
        [&](const Fn& v) -> NodeVariant {
            std::vector<FnClause> clauses;
            for (const auto& clause : v.clauses) {
                clauses.push_back(FnClause{clause.params, m(clause.guard), m(clause.body)});
            }
            return Fn{std::move(clauses)};
        },
        [&](const Def& v) -> NodeVariant {
            return Def{v.name, v.params, m(v.guard), m(v.body), v.is_private};
        },
        [&](const Call& v) -> NodeVariant { return Call{v.function, m.all(v.args)}; },
        [&](const RemoteCall& v) -> NodeVariant {
            return RemoteCall{v.module, v.function, m.all(v.args)};
        },
        [&](const Invoke& v) -> NodeVariant { return Invoke{m(v.target), m.all(v.args)}; },
        [&](const Field& v) -> NodeVariant { return Field{m(v.target), v.field}; },
        [&](const Index& v) -> NodeVariant { return Index{m(v.target), m(v.key)}; },
        [&](const Tuple& v) -> NodeVariant { return Tuple{m.all(v.elements)}; },
        [&](const List& v) -> NodeVariant { return List{m.all(v.elements)}; },
        [&](const Map& v) -> NodeVariant {
            std::vector<std::pair<NodePtr, NodePtr>> entries;
            for (const auto& [key, value] : v.entries) {
                auto new_key = m(key);
                entries.emplace_back(new_key, m(value));
            }
            return Map{std::move(entries)};
        },
        [&](const Struct& v) -> NodeVariant { return Struct{v.module, m.values(v.fields)}; },
        [&](const StructUpdate& v) -> NodeVariant {
            return StructUpdate{m(v.base), m.values(v.fields)};
        },
        [&](const Pipe& v) -> NodeVariant { return Pipe{m(v.lhs), m(v.rhs)}; },
        [&](const BinaryOp& v) -> NodeVariant { return BinaryOp{v.op, m(v.lhs), m(v.rhs)}; },
        [&](const UnaryOp& v) -> NodeVariant { return UnaryOp{v.op, m(v.operand)}; },
        [&](const With& v) -> NodeVariant {
            return With{m.generators(v.clauses), m(v.body), m.clauses(v.else_clauses)};
        },
        [&](const Try& v) -> NodeVariant {
            return Try{m(v.body), m.clauses(v.rescue_clauses), m(v.after)};
        },
        [&](const Receive& v) -> NodeVariant {
            return Receive{m.clauses(v.clauses), m(v.timeout), m(v.after_body)};
        },
        [&](const For& v) -> NodeVariant {
            return For{m.generators(v.generators), m.all(v.filters), m(v.body)};
        },
        [&](const Module& v) -> NodeVariant { return Module{v.name, m.all(v.body)}; },
    }, node->value);

    if (!m.changed) {
        return node;
    }
    return helper::rebuild(node, std::move(mapped));
}

NodePtr map_patterns(const NodePtr& node, const PatternFn& fn) {
    if (!node) {
        return node;
    }
    PatternMapper m(fn);
    std::optional<NodeVariant> mapped = std::visit(Overloaded{
        [&](const Match& v) -> std::optional<NodeVariant> { return Match{m(v.pattern), v.value}; },
        [&](const Case& v) -> std::optional<NodeVariant> { return Case{v.subject, m.clauses(v.clauses)}; },
        [&](const Fn& v) -> std::optional<NodeVariant> {
            std::vector<FnClause> clauses;
            for (const auto& clause : v.clauses) {
                clauses.push_back(FnClause{m.all(clause.params), clause.guard, clause.body});
            }
            return Fn{std::move(clauses)};
        },
        [&](const Def& v) -> std::optional<NodeVariant> {
            return Def{v.name, m.all(v.params), v.guard, v.body, v.is_private};
        },
        [&](const With& v) -> std::optional<NodeVariant> {
            return With{m.generators(v.clauses), v.body, m.clauses(v.else_clauses)};
        },
        [&](const Try& v) -> std::optional<NodeVariant> {
            return Try{v.body, m.clauses(v.rescue_clauses), v.after};
        },
        [&](const Receive& v) -> std::optional<NodeVariant> {
            return Receive{m.clauses(v.clauses), v.timeout, v.after_body};
        },
        [&](const For& v) -> std::optional<NodeVariant> {
            return For{m.generators(v.generators), v.filters, v.body};
        },
        [&](const auto&) -> std::optional<NodeVariant> { return std::nullopt; },
    }, node->value);

    if (!mapped || !m.changed) {
        return node;
    }
    return helper::rebuild(node, std::move(*mapped));
}

PatternPtr map_subpatterns(const PatternPtr& pattern, const PatternFn& fn, const NodeFn& key_fn) {
    if (!pattern) {
        return pattern;
    }
    PatternMapper m(fn);
    bool keys_changed = false;
    std::optional<PatternVariant> mapped = std::visit(Overloaded{
        [&](const TuplePattern& p) -> std::optional<PatternVariant> { return TuplePattern{m.all(p.elements)}; },
        [&](const ListPattern& p) -> std::optional<PatternVariant> { return ListPattern{m.all(p.elements)}; },
        [&](const ConsPattern& p) -> std::optional<PatternVariant> {
            auto head = m(p.head);
            return ConsPattern{head, m(p.tail)};
        },
        [&](const MapPattern& p) -> std::optional<PatternVariant> {
            std::vector<std::pair<NodePtr, PatternPtr>> entries;
            for (const auto& [key, value] : p.entries) {
                NodePtr new_key = key;
                if (key_fn && key) {
                    new_key = key_fn(key);
                    keys_changed = keys_changed || new_key != key;
                }
                entries.emplace_back(new_key, m(value));
            }
            return MapPattern{std::move(entries)};
        },
        [&](const StructPattern& p) -> std::optional<PatternVariant> {
            std::vector<std::pair<std::string, PatternPtr>> fields;
            for (const auto& [name, value] : p.fields) {
                fields.emplace_back(name, m(value));
            }
            return StructPattern{p.module, std::move(fields)};
        },
        [&](const AliasPattern& p) -> std::optional<PatternVariant> { return AliasPattern{m(p.pattern), p.name}; },
        [&](const BinaryPattern& p) -> std::optional<PatternVariant> {
            std::vector<BinarySegment> segments;
            for (const auto& segment : p.segments) {
                segments.push_back(BinarySegment{m(segment.value), segment.spec});
            }
            return BinaryPattern{std::move(segments)};
        },
        [&](const auto&) -> std::optional<PatternVariant> { return std::nullopt; },
    }, pattern->value);

    if (!mapped || (!m.changed && !keys_changed)) {
        return pattern;
    }
    return helper::rebuild(pattern, std::move(*mapped));
}

void for_each_child(const Node& node, const std::function<void(const NodePtr&)>& fn) {
    auto visit_one = [&](const NodePtr& child) {
        if (child) {
            fn(child);
        }
    };
    auto visit_all = [&](const std::vector<NodePtr>& children) {
        for (const auto& child : children) {
            visit_one(child);
        }
    };
    auto visit_clauses = [&](const std::vector<Clause>& clauses) {
        for (const auto& clause : clauses) {
            visit_one(clause.guard);
            visit_one(clause.body);
        }
    };

    std::visit(Overloaded{
        [&](const Var&) {},
        [&](const Literal&) {},
        [&](const Opaque&) {},
        [&](const Block& v) { visit_all(v.stmts); },
        [&](const Match& v) { visit_one(v.value); },
        [&](const If& v) {
            visit_one(v.condition);
            visit_one(v.then_branch);
            visit_one(v.else_branch);
        },
        [&](const Case& v) {
            visit_one(v.subject);
            visit_clauses(v.clauses);
        },
        [&](const Fn& v) {
            for (const auto& clause : v.clauses) {
                visit_one(clause.guard);
                visit_one(clause.body);
            }
        },
        [&](const Def& v) {
            visit_one(v.guard);
            visit_one(v.body);
        },
        [&](const Call& v) { visit_all(v.args); },
        [&](const RemoteCall& v) { visit_all(v.args); },
        [&](const Invoke& v) {
            visit_one(v.target);
            visit_all(v.args);
        },
        [&](const Field& v) { visit_one(v.target); },
        [&](const Index& v) {
            visit_one(v.target);
            visit_one(v.key);
        },
        [&](const Tuple& v) { visit_all(v.elements); },
        [&](const List& v) { visit_all(v.elements); },
        [&](const Map& v) {
            for (const auto& [key, value] : v.entries) {
                visit_one(key);
                visit_one(value);
            }
        },
        [&](const Struct& v) {
            for (const auto& field : v.fields) {
                visit_one(field.second);
            }
        },
        [&](const StructUpdate& v) {
            visit_one(v.base);
            for (const auto& field : v.fields) {
                visit_one(field.second);
            }
        },
        [&](const Pipe& v) {
            visit_one(v.lhs);
            visit_one(v.rhs);
        },
        [&](const BinaryOp& v) {
            visit_one(v.lhs);
            visit_one(v.rhs);
        },
        [&](const UnaryOp& v) { visit_one(v.operand); },
        [&](const With& v) {
            for (const auto& clause : v.clauses) {
                visit_one(clause.source);
            }
            visit_one(v.body);
            visit_clauses(v.else_clauses);
        },
        [&](const Try& v) {
            visit_one(v.body);
            visit_clauses(v.rescue_clauses);
            visit_one(v.after);
        },
        [&](const Receive& v) {
            visit_clauses(v.clauses);
            visit_one(v.timeout);
            visit_one(v.after_body);
        },
        [&](const For& v) {
            for (const auto& generator : v.generators) {
                visit_one(generator.source);
            }
            visit_all(v.filters);
            visit_one(v.body);
        },
        [&](const Module& v) { visit_all(v.body); },
    }, node.value);
}

void for_each_pattern(const Node& node, const std::function<void(const PatternPtr&)>& fn) {
    auto visit_one = [&](const PatternPtr& pattern) {
        if (pattern) {
            fn(pattern);
        }
    };
    auto visit_clauses = [&](const std::vector<Clause>& clauses) {
        for (const auto& clause : clauses) {
            visit_one(clause.pattern);
        }
    };

    std::visit(Overloaded{
        [&](const Match& v) { visit_one(v.pattern); },
        [&](const Case& v) { visit_clauses(v.clauses); },
        [&](const Fn& v) {
            for (const auto& clause : v.clauses) {
                for (const auto& param : clause.params) {
                    visit_one(param);
                }
            }
        },
        [&](const Def& v) {
            for (const auto& param : v.params) {
                visit_one(param);
            }
        },
        [&](const With& v) {
            for (const auto& clause : v.clauses) {
                visit_one(clause.pattern);
            }
            visit_clauses(v.else_clauses);
        },
        [&](const Try& v) { visit_clauses(v.rescue_clauses); },
        [&](const Receive& v) { visit_clauses(v.clauses); },
        [&](const For& v) {
            for (const auto& generator : v.generators) {
                visit_one(generator.pattern);
            }
        },
        [&](const auto&) {},
    }, node.value);
}

void for_each_subpattern(const Pattern& pattern, const std::function<void(const PatternPtr&)>& fn) {
    auto visit_one = [&](const PatternPtr& sub) {
        if (sub) {
            fn(sub);
        }
    };
    std::visit(Overloaded{
        [&](const TuplePattern& p) {
            for (const auto& element : p.elements) {
                visit_one(element);
            }
        },
        [&](const ListPattern& p) {
            for (const auto& element : p.elements) {
                visit_one(element);
            }
        },
        [&](const ConsPattern& p) {
            visit_one(p.head);
            visit_one(p.tail);
        },
        [&](const MapPattern& p) {
            for (const auto& entry : p.entries) {
                visit_one(entry.second);
            }
        },
        [&](const StructPattern& p) {
            for (const auto& field : p.fields) {
                visit_one(field.second);
            }
        },
        [&](const AliasPattern& p) { visit_one(p.pattern); },
        [&](const BinaryPattern& p) {
            for (const auto& segment : p.segments) {
                visit_one(segment.value);
            }
        },
        [&](const auto&) {},
    }, pattern.value);
}

NodePtr transform_bottom_up(const NodePtr& node, const NodeFn& fn) {
    if (!node) {
        return node;
    }
    NodeFn recurse = [&](const NodePtr& child) { return transform_bottom_up(child, fn); };
    return fn(map_children(node, recurse));
}

NodePtr transform_top_down(const NodePtr& node, const NodeFn& fn) {
    if (!node) {
        return node;
    }
    NodeFn recurse = [&](const NodePtr& child) { return transform_top_down(child, fn); };
    return map_children(fn(node), recurse);
}

NodePtr transform_statement_lists(const NodePtr& node,
                                  const std::function<std::vector<NodePtr>(std::vector<NodePtr>)>& fn) {
    auto same = [](const std::vector<NodePtr>& a, const std::vector<NodePtr>& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    };

    return transform_bottom_up(node, [&](const NodePtr& current) -> NodePtr {
        if (auto* block = current->as<Block>()) {
            auto stmts = fn(block->stmts);
            if (same(stmts, block->stmts)) {
                return current;
            }
            if (stmts.size() <= 1 && current->meta == Metadata{}) {
                return helper::from_statements(std::move(stmts), current->span);
            }
            return helper::rebuild(current, Block{std::move(stmts)});
        }
        if (auto* module = current->as<Module>()) {
            auto body = fn(module->body);
            if (same(body, module->body)) {
                return current;
            }
            return helper::rebuild(current, Module{module->name, std::move(body)});
        }
        return current;
    });
}

} // namespace ir
