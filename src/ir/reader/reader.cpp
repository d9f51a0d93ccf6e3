#include "reader.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "ir/helper.hpp"
#include "ir/reader/lexer.hpp"
#include "utils/error.hpp"

namespace ir::reader {

namespace {

// Generic s-expression, converted into nodes or patterns by Reader.
struct Datum {
    enum class Kind { List, Symbol, Integer, Float, String, Atom };

    Kind kind;
    std::string text;
    std::vector<Datum> items;
    span::Span span;

    bool is_list() const { return kind == Kind::List; }
    bool is_symbol(std::string_view name) const { return kind == Kind::Symbol && text == name; }
    // `(head ...)`
    bool is_form(std::string_view head) const {
        return is_list() && !items.empty() && items.front().is_symbol(head);
    }
};

class DatumParser {
public:
    explicit DatumParser(const std::vector<Token>& tokens) : tokens_(tokens) {}

    bool at_end() const { return tokens_[pos_].kind == TokenKind::End; }

    Datum parse() {
        const Token& token = tokens_[pos_];
        switch (token.kind) {
        case TokenKind::LParen:
            return parse_list();
        case TokenKind::RParen:
            throw ReaderError("Unexpected ')'", token.span);
        case TokenKind::End:
            throw ReaderError("Unexpected end of input", token.span);
        case TokenKind::Symbol:
            ++pos_;
            return Datum{Datum::Kind::Symbol, token.text, {}, token.span};
        case TokenKind::Integer:
            ++pos_;
            return Datum{Datum::Kind::Integer, token.text, {}, token.span};
        case TokenKind::Float:
            ++pos_;
            return Datum{Datum::Kind::Float, token.text, {}, token.span};
        case TokenKind::String:
            ++pos_;
            return Datum{Datum::Kind::String, token.text, {}, token.span};
        case TokenKind::Atom:
            ++pos_;
            return Datum{Datum::Kind::Atom, token.text, {}, token.span};
        }
        throw ReaderError("Unexpected token '" + token.text + "'", token.span);
    }

private:
    Datum parse_list() {
        span::Span open = tokens_[pos_].span;
        ++pos_;
        Datum list{Datum::Kind::List, "", {}, open};
        while (tokens_[pos_].kind != TokenKind::RParen) {
            if (tokens_[pos_].kind == TokenKind::End) {
                throw ReaderError("Unbalanced '(': missing ')'", open);
            }
            list.items.push_back(parse());
        }
        list.span = span::Span::cover(open, tokens_[pos_].span);
        ++pos_;
        return list;
    }

    const std::vector<Token>& tokens_;
    size_t pos_ = 0;
};

class Reader {
public:
    NodePtr node(const Datum& d) {
        switch (d.kind) {
        case Datum::Kind::Symbol:
            if (auto lit = keyword_literal(d.text)) {
                return helper::make_node(Literal{*lit}, {}, d.span);
            }
            return helper::make_node(Var{d.text}, {}, d.span);
        case Datum::Kind::Integer:
        case Datum::Kind::Float:
        case Datum::Kind::String:
        case Datum::Kind::Atom:
            return helper::make_node(literal(d), {}, d.span);
        case Datum::Kind::List:
            return form(d);
        }
        throw ReaderError("Unreadable expression", d.span);
    }

    PatternPtr pattern(const Datum& d) {
        switch (d.kind) {
        case Datum::Kind::Symbol:
            if (auto lit = keyword_literal(d.text)) {
                return helper::make_pattern(LiteralPattern{Literal{*lit}}, d.span);
            }
            return helper::make_pattern(BindPattern{d.text}, d.span);
        case Datum::Kind::Integer:
        case Datum::Kind::Float:
        case Datum::Kind::String:
        case Datum::Kind::Atom:
            return helper::make_pattern(LiteralPattern{literal(d)}, d.span);
        case Datum::Kind::List:
            return pattern_form(d);
        }
        throw ReaderError("Unreadable pattern", d.span);
    }

private:
    static std::optional<Literal::Value> keyword_literal(std::string_view text) {
        if (text == "nil") {
            return Literal::Value{Literal::Nil{}};
        }
        if (text == "true") {
            return Literal::Value{true};
        }
        if (text == "false") {
            return Literal::Value{false};
        }
        return std::nullopt;
    }

    static Literal literal(const Datum& d) {
        switch (d.kind) {
        case Datum::Kind::Integer: {
            errno = 0;
            char* end = nullptr;
            long long value = std::strtoll(d.text.c_str(), &end, 10);
            if (errno != 0 || *end != '\0') {
                throw ReaderError("Invalid integer literal '" + d.text + "'", d.span);
            }
            return Literal{static_cast<int64_t>(value)};
        }
        case Datum::Kind::Float: {
            errno = 0;
            char* end = nullptr;
            double value = std::strtod(d.text.c_str(), &end);
            if (errno != 0 || *end != '\0') {
                throw ReaderError("Invalid float literal '" + d.text + "'", d.span);
            }
            return Literal{value};
        }
        case Datum::Kind::String:
            return Literal{d.text};
        case Datum::Kind::Atom:
            return Literal{Literal::Atom{d.text}};
        default:
            throw ReaderError("Expected a literal", d.span);
        }
    }

    static const std::string& symbol(const Datum& d, std::string_view what) {
        if (d.kind != Datum::Kind::Symbol) {
            throw ReaderError("Expected " + std::string(what), d.span);
        }
        return d.text;
    }

    static void expect_size(const Datum& d, size_t min, size_t max, std::string_view form) {
        size_t args = d.items.size() - 1;
        if (args < min || args > max) {
            throw ReaderError("Malformed '" + std::string(form) + "' form", d.span);
        }
    }

    static NodePtr mark(const NodePtr& node, void (*set)(Metadata&)) {
        Metadata meta = node->meta;
        set(meta);
        return helper::with_meta(node, meta);
    }

    // Statements from `first` onward; several become a block.
    NodePtr body(const Datum& d, size_t first) {
        if (first >= d.items.size()) {
            throw ReaderError("Missing body", d.span);
        }
        if (first + 1 == d.items.size()) {
            return node(d.items[first]);
        }
        std::vector<NodePtr> stmts;
        for (size_t i = first; i < d.items.size(); ++i) {
            stmts.push_back(node(d.items[i]));
        }
        return helper::make_node(Block{std::move(stmts)}, {}, d.span);
    }

    std::vector<NodePtr> nodes(const Datum& d, size_t first) {
        std::vector<NodePtr> out;
        for (size_t i = first; i < d.items.size(); ++i) {
            out.push_back(node(d.items[i]));
        }
        return out;
    }

    std::vector<PatternPtr> params(const Datum& d) {
        if (!d.is_list()) {
            throw ReaderError("Expected a parameter list", d.span);
        }
        std::vector<PatternPtr> out;
        for (const auto& item : d.items) {
            out.push_back(pattern(item));
        }
        return out;
    }

    // Optional `(when g)` at items[index]; advances index past it.
    NodePtr guard(const Datum& d, size_t& index) {
        if (index < d.items.size() && d.items[index].is_form("when")) {
            const Datum& when = d.items[index];
            expect_size(when, 1, 1, "when");
            ++index;
            return node(when.items[1]);
        }
        return nullptr;
    }

    // `(-> pattern [(when g)] body...)`
    Clause clause(const Datum& d) {
        if (!d.is_form("->") || d.items.size() < 3) {
            throw ReaderError("Expected a clause '(-> pattern body)'", d.span);
        }
        Clause result;
        result.pattern = pattern(d.items[1]);
        size_t index = 2;
        result.guard = guard(d, index);
        result.body = body(d, index);
        return result;
    }

    // `(-> (params...) [(when g)] body...)`
    FnClause fn_clause(const Datum& d) {
        if (!d.is_form("->") || d.items.size() < 3) {
            throw ReaderError("Expected a function clause '(-> (params) body)'", d.span);
        }
        FnClause result;
        result.params = params(d.items[1]);
        size_t index = 2;
        result.guard = guard(d, index);
        result.body = body(d, index);
        return result;
    }

    // `(<- pattern source)`
    Generator generator(const Datum& d) {
        if (!d.is_form("<-")) {
            throw ReaderError("Expected a generator '(<- pattern source)'", d.span);
        }
        expect_size(d, 2, 2, "<-");
        return Generator{pattern(d.items[1]), node(d.items[2])};
    }

    std::vector<std::pair<std::string, NodePtr>> field_values(const Datum& d, size_t first) {
        std::vector<std::pair<std::string, NodePtr>> out;
        for (size_t i = first; i < d.items.size(); ++i) {
            const Datum& entry = d.items[i];
            if (!entry.is_list() || entry.items.size() != 2) {
                throw ReaderError("Expected '(field value)'", entry.span);
            }
            out.emplace_back(symbol(entry.items[0], "a field name"), node(entry.items[1]));
        }
        return out;
    }

    NodePtr form(const Datum& d) {
        if (d.items.empty()) {
            throw ReaderError("Empty form", d.span);
        }
        const std::string& head = symbol(d.items.front(), "a form name");
        auto make = [&](NodeVariant value) { return helper::make_node(std::move(value), {}, d.span); };

        if (head == "return") {
            expect_size(d, 1, 1, head);
            return mark(node(d.items[1]), [](Metadata& m) { m.early_return = true; });
        }
        if (head == "mutates") {
            expect_size(d, 1, 1, head);
            return mark(node(d.items[1]), [](Metadata& m) { m.carries_mutation = true; });
        }
        if (head == "sentinel") {
            expect_size(d, 1, 1, head);
            return mark(node(d.items[1]), [](Metadata& m) { m.sentinel = true; });
        }
        if (head == "block") {
            return make(Block{nodes(d, 1)});
        }
        if (head == "=") {
            expect_size(d, 2, 2, head);
            return make(Match{pattern(d.items[1]), node(d.items[2])});
        }
        if (head == "if") {
            expect_size(d, 2, 3, head);
            return make(If{node(d.items[1]), node(d.items[2]), d.items.size() == 4 ? node(d.items[3]) : nullptr});
        }
        if (head == "case") {
            expect_size(d, 1, SIZE_MAX, head);
            std::vector<Clause> clauses;
            for (size_t i = 2; i < d.items.size(); ++i) {
                clauses.push_back(clause(d.items[i]));
            }
            return make(Case{node(d.items[1]), std::move(clauses)});
        }
        if (head == "fn") {
            expect_size(d, 1, SIZE_MAX, head);
            std::vector<FnClause> clauses;
            for (size_t i = 1; i < d.items.size(); ++i) {
                clauses.push_back(fn_clause(d.items[i]));
            }
            return make(Fn{std::move(clauses)});
        }
        if (head == "def" || head == "defp") {
            expect_size(d, 3, SIZE_MAX, head);
            Def def;
            def.name = symbol(d.items[1], "a function name");
            def.params = params(d.items[2]);
            size_t index = 3;
            def.guard = guard(d, index);
            def.body = body(d, index);
            def.is_private = head == "defp";
            return make(std::move(def));
        }
        if (head == "call") {
            expect_size(d, 1, SIZE_MAX, head);
            return make(Call{symbol(d.items[1], "a function name"), nodes(d, 2)});
        }
        if (head == "rcall") {
            expect_size(d, 2, SIZE_MAX, head);
            return make(RemoteCall{symbol(d.items[1], "a module name"), symbol(d.items[2], "a function name"),
                                   nodes(d, 3)});
        }
        if (head == "invoke") {
            expect_size(d, 1, SIZE_MAX, head);
            return make(Invoke{node(d.items[1]), nodes(d, 2)});
        }
        if (head == "field") {
            expect_size(d, 2, 2, head);
            return make(Field{node(d.items[1]), symbol(d.items[2], "a field name")});
        }
        if (head == "index") {
            expect_size(d, 2, 2, head);
            return make(Index{node(d.items[1]), node(d.items[2])});
        }
        if (head == "tuple") {
            return make(Tuple{nodes(d, 1)});
        }
        if (head == "list") {
            return make(List{nodes(d, 1)});
        }
        if (head == "map") {
            std::vector<std::pair<NodePtr, NodePtr>> entries;
            for (size_t i = 1; i < d.items.size(); ++i) {
                const Datum& entry = d.items[i];
                if (!entry.is_list() || entry.items.size() != 2) {
                    throw ReaderError("Expected '(key value)'", entry.span);
                }
                auto key = node(entry.items[0]);
                entries.emplace_back(key, node(entry.items[1]));
            }
            return make(Map{std::move(entries)});
        }
        if (head == "struct") {
            expect_size(d, 1, SIZE_MAX, head);
            return make(Struct{symbol(d.items[1], "a module name"), field_values(d, 2)});
        }
        if (head == "update") {
            expect_size(d, 1, SIZE_MAX, head);
            return make(StructUpdate{node(d.items[1]), field_values(d, 2)});
        }
        if (head == "|>") {
            expect_size(d, 2, 2, head);
            return make(Pipe{node(d.items[1]), node(d.items[2])});
        }
        if (head == "with") {
            return with_form(d);
        }
        if (head == "try") {
            return try_form(d);
        }
        if (head == "receive") {
            return receive_form(d);
        }
        if (head == "for") {
            return for_form(d);
        }
        if (head == "module") {
            expect_size(d, 1, SIZE_MAX, head);
            return make(Module{symbol(d.items[1], "a module name"), nodes(d, 2)});
        }
        if (head == "opaque") {
            expect_size(d, 1, 1, head);
            if (d.items[1].kind != Datum::Kind::String) {
                throw ReaderError("Expected opaque text", d.items[1].span);
            }
            return make(Opaque{d.items[1].text});
        }
        if (d.items.size() == 2) {
            if (auto op = parse_unary_operator(head)) {
                return make(UnaryOp{*op, node(d.items[1])});
            }
        }
        if (auto op = parse_binary_operator(head)) {
            expect_size(d, 2, 2, head);
            return make(BinaryOp{*op, node(d.items[1]), node(d.items[2])});
        }
        throw ReaderError("Unknown form '" + head + "'", d.items.front().span);
    }

    NodePtr with_form(const Datum& d) {
        With with;
        bool has_body = false;
        for (size_t i = 1; i < d.items.size(); ++i) {
            const Datum& item = d.items[i];
            if (item.is_form("<-") && !has_body) {
                with.clauses.push_back(generator(item));
            } else if (item.is_form("do") && !has_body) {
                with.body = body(item, 1);
                has_body = true;
            } else if (item.is_form("else") && has_body) {
                for (size_t j = 1; j < item.items.size(); ++j) {
                    with.else_clauses.push_back(clause(item.items[j]));
                }
            } else {
                throw ReaderError("Unexpected item in 'with'", item.span);
            }
        }
        if (!has_body) {
            throw ReaderError("Missing '(do ...)' in 'with'", d.span);
        }
        return helper::make_node(std::move(with), {}, d.span);
    }

    NodePtr try_form(const Datum& d) {
        expect_size(d, 1, 3, "try");
        Try result;
        result.body = node(d.items[1]);
        for (size_t i = 2; i < d.items.size(); ++i) {
            const Datum& item = d.items[i];
            if (item.is_form("rescue")) {
                for (size_t j = 1; j < item.items.size(); ++j) {
                    result.rescue_clauses.push_back(clause(item.items[j]));
                }
            } else if (item.is_form("after")) {
                result.after = body(item, 1);
            } else {
                throw ReaderError("Unexpected item in 'try'", item.span);
            }
        }
        return helper::make_node(std::move(result), {}, d.span);
    }

    NodePtr receive_form(const Datum& d) {
        Receive result;
        for (size_t i = 1; i < d.items.size(); ++i) {
            const Datum& item = d.items[i];
            if (item.is_form("after") && i + 1 == d.items.size()) {
                expect_size(item, 2, SIZE_MAX, "after");
                result.timeout = node(item.items[1]);
                result.after_body = body(item, 2);
            } else {
                result.clauses.push_back(clause(item));
            }
        }
        return helper::make_node(std::move(result), {}, d.span);
    }

    NodePtr for_form(const Datum& d) {
        expect_size(d, 2, SIZE_MAX, "for");
        For result;
        size_t last = d.items.size() - 1;
        for (size_t i = 1; i < last; ++i) {
            const Datum& item = d.items[i];
            if (item.is_form("<-")) {
                result.generators.push_back(generator(item));
            } else if (item.is_form("filter")) {
                expect_size(item, 1, 1, "filter");
                result.filters.push_back(node(item.items[1]));
            } else {
                throw ReaderError("Unexpected item in 'for'", item.span);
            }
        }
        if (result.generators.empty()) {
            throw ReaderError("Comprehension without generator", d.span);
        }
        result.body = node(d.items[last]);
        return helper::make_node(std::move(result), {}, d.span);
    }

    PatternPtr pattern_form(const Datum& d) {
        if (d.items.empty()) {
            throw ReaderError("Empty pattern", d.span);
        }
        const std::string& head = symbol(d.items.front(), "a pattern form");
        auto make = [&](PatternVariant value) { return helper::make_pattern(std::move(value), d.span); };
        auto sub_patterns = [&](size_t first) {
            std::vector<PatternPtr> out;
            for (size_t i = first; i < d.items.size(); ++i) {
                out.push_back(pattern(d.items[i]));
            }
            return out;
        };

        if (head == "tuple") {
            return make(TuplePattern{sub_patterns(1)});
        }
        if (head == "list") {
            return make(ListPattern{sub_patterns(1)});
        }
        if (head == "cons") {
            expect_size(d, 2, 2, head);
            auto head_pattern = pattern(d.items[1]);
            return make(ConsPattern{head_pattern, pattern(d.items[2])});
        }
        if (head == "map") {
            std::vector<std::pair<NodePtr, PatternPtr>> entries;
            for (size_t i = 1; i < d.items.size(); ++i) {
                const Datum& entry = d.items[i];
                if (!entry.is_list() || entry.items.size() != 2) {
                    throw ReaderError("Expected '(key pattern)'", entry.span);
                }
                auto key = node(entry.items[0]);
                entries.emplace_back(key, pattern(entry.items[1]));
            }
            return make(MapPattern{std::move(entries)});
        }
        if (head == "struct") {
            expect_size(d, 1, SIZE_MAX, head);
            std::vector<std::pair<std::string, PatternPtr>> fields;
            for (size_t i = 2; i < d.items.size(); ++i) {
                const Datum& entry = d.items[i];
                if (!entry.is_list() || entry.items.size() != 2) {
                    throw ReaderError("Expected '(field pattern)'", entry.span);
                }
                fields.emplace_back(symbol(entry.items[0], "a field name"), pattern(entry.items[1]));
            }
            return make(StructPattern{symbol(d.items[1], "a module name"), std::move(fields)});
        }
        if (head == "^") {
            expect_size(d, 1, 1, head);
            return make(PinPattern{symbol(d.items[1], "a pinned name")});
        }
        if (head == "as") {
            expect_size(d, 2, 2, head);
            auto inner = pattern(d.items[1]);
            return make(AliasPattern{inner, symbol(d.items[2], "an alias name")});
        }
        if (head == "binary") {
            std::vector<BinarySegment> segments;
            for (size_t i = 1; i < d.items.size(); ++i) {
                const Datum& segment = d.items[i];
                if (!segment.is_form("seg") || segment.items.size() != 3 ||
                    segment.items[2].kind != Datum::Kind::String) {
                    throw ReaderError("Expected '(seg pattern \"spec\")'", segment.span);
                }
                segments.push_back(BinarySegment{pattern(segment.items[1]), segment.items[2].text});
            }
            return make(BinaryPattern{std::move(segments)});
        }
        throw ReaderError("Unknown pattern form '" + head + "'", d.items.front().span);
    }
};

std::vector<Datum> parse_data(std::string_view text, span::DumpId dump) {
    Lexer lexer(text, dump);
    const auto& tokens = lexer.tokenize();
    DatumParser parser(tokens);
    std::vector<Datum> data;
    while (!parser.at_end()) {
        data.push_back(parser.parse());
    }
    return data;
}

const Datum& single(const std::vector<Datum>& data, std::string_view text, span::DumpId dump) {
    if (data.size() != 1) {
        throw ReaderError("Expected exactly one form, found " + std::to_string(data.size()),
                          span::Span{dump, 0, static_cast<uint32_t>(text.size())});
    }
    return data.front();
}

} // namespace

std::vector<NodePtr> read_items(std::string_view text, span::DumpId dump) {
    Reader reader;
    std::vector<NodePtr> items;
    for (const auto& datum : parse_data(text, dump)) {
        items.push_back(reader.node(datum));
    }
    return items;
}

NodePtr read_node(std::string_view text, span::DumpId dump) {
    auto data = parse_data(text, dump);
    Reader reader;
    return reader.node(single(data, text, dump));
}

PatternPtr read_pattern(std::string_view text, span::DumpId dump) {
    auto data = parse_data(text, dump);
    Reader reader;
    return reader.pattern(single(data, text, dump));
}

NodePtr read_unit(std::string_view text, span::DumpId dump) {
    auto items = read_items(text, dump);
    if (items.empty()) {
        throw ReaderError("Empty compilation unit", span::Span{dump, 0, 0});
    }
    if (items.size() == 1) {
        return items.front();
    }
    return helper::make_node(Block{std::move(items)}, {}, span::Span{dump, 0, static_cast<uint32_t>(text.size())});
}

} // namespace ir::reader
