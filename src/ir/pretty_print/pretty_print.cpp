#include "pretty_print.hpp"

#include <charconv>
#include <optional>
#include <sstream>

#include "utils/overloaded.hpp"

namespace ir {

namespace {

// Forms whose children are laid out one per line in indented mode.
bool breaks_lines(const NodePtr& node) {
    return node && std::visit(Overloaded{
        [](const Block&) { return true; },
        [](const Def&) { return true; },
        [](const Module&) { return true; },
        [](const Case&) { return true; },
        [](const Fn&) { return true; },
        [](const If&) { return true; },
        [](const With&) { return true; },
        [](const Try&) { return true; },
        [](const Receive&) { return true; },
        [](const For&) { return true; },
        [](const auto&) { return false; },
    }, node->value);
}

bool is_plain_atom(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (c == ' ' || c == '(' || c == ')' || c == '"' || c == ';' || c == '\n' || c == '\t') {
            return false;
        }
    }
    return true;
}

} // namespace

// One parenthesised form. `item` starts a new indented line unless the
// printer is compact; `inline_item` always stays on the current line.
class PrettyPrinter::Form {
public:
    Form(PrettyPrinter& printer, std::string_view head) : printer_(printer) {
        printer_.out_ << "(" << head;
        if (!printer_.compact_) {
            indent_.emplace(printer_);
        }
    }

    ~Form() {
        indent_.reset();
        printer_.out_ << ")";
    }

    template <typename F>
    void inline_item(F&& emit) {
        printer_.out_ << ' ';
        emit();
    }

    template <typename F>
    void item(F&& emit) {
        if (printer_.compact_) {
            printer_.out_ << ' ';
        } else {
            printer_.out_ << "\n";
            printer_.prefix();
        }
        emit();
    }

    void inline_node(const NodePtr& node) {
        inline_item([&] { printer_.print(node); });
    }

    void node(const NodePtr& node) {
        item([&] { printer_.print(node); });
    }

    // Breaks the line only for nodes that themselves span several lines.
    void body(const NodePtr& node) {
        if (breaks_lines(node)) {
            this->node(node);
        } else {
            inline_node(node);
        }
    }

    void pattern(const PatternPtr& pattern) {
        inline_item([&] { printer_.print(pattern); });
    }

private:
    PrettyPrinter& printer_;
    std::optional<IndentGuard> indent_;
};

void PrettyPrinter::print(const NodePtr& node) {
    if (!node) {
        out_ << "nil";
        return;
    }
    const auto& meta = node->meta;
    if (meta.early_return) {
        out_ << "(return ";
    }
    if (meta.carries_mutation) {
        out_ << "(mutates ";
    }
    if (meta.sentinel) {
        out_ << "(sentinel ";
    }
    print_value(node);
    if (meta.sentinel) {
        out_ << ")";
    }
    if (meta.carries_mutation) {
        out_ << ")";
    }
    if (meta.early_return) {
        out_ << ")";
    }
}

void PrettyPrinter::print_items(const std::vector<NodePtr>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out_ << (compact_ ? " " : "\n");
        }
        print(items[i]);
    }
}

void PrettyPrinter::print_string(std::string_view text) {
    out_ << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out_ << "\\\"";
            break;
        case '\\':
            out_ << "\\\\";
            break;
        case '\n':
            out_ << "\\n";
            break;
        case '\t':
            out_ << "\\t";
            break;
        default:
            out_ << c;
        }
    }
    out_ << '"';
}

void PrettyPrinter::print(const Literal& literal) {
    std::visit(Overloaded{
        [&](const Literal::Nil&) { out_ << "nil"; },
        [&](bool value) { out_ << (value ? "true" : "false"); },
        [&](int64_t value) { out_ << value; },
        [&](double value) {
            char buffer[64];
            auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
            std::string text = ec == std::errc() ? std::string(buffer, end) : std::to_string(value);
            if (text.find_first_of(".eEn") == std::string::npos) {
                text += ".0";
            }
            out_ << text;
        },
        [&](const std::string& value) { print_string(value); },
        [&](const Literal::Atom& atom) {
            out_ << ':';
            if (is_plain_atom(atom.name)) {
                out_ << atom.name;
            } else {
                print_string(atom.name);
            }
        },
    }, literal.value);
}

void PrettyPrinter::print(const PatternPtr& pattern) {
    if (!pattern) {
        out_ << "_";
        return;
    }
    std::visit(Overloaded{
        [&](const BindPattern& p) { out_ << p.name; },
        [&](const LiteralPattern& p) { print(p.value); },
        [&](const TuplePattern& p) {
            out_ << "(tuple";
            for (const auto& element : p.elements) {
                out_ << ' ';
                print(element);
            }
            out_ << ')';
        },
        [&](const ListPattern& p) {
            out_ << "(list";
            for (const auto& element : p.elements) {
                out_ << ' ';
                print(element);
            }
            out_ << ')';
        },
        [&](const ConsPattern& p) {
            out_ << "(cons ";
            print(p.head);
            out_ << ' ';
            print(p.tail);
            out_ << ')';
        },
        [&](const MapPattern& p) {
            out_ << "(map";
            for (const auto& [key, value] : p.entries) {
                out_ << " (";
                print(key);
                out_ << ' ';
                print(value);
                out_ << ')';
            }
            out_ << ')';
        },
        [&](const StructPattern& p) {
            out_ << "(struct " << p.module;
            for (const auto& [field, value] : p.fields) {
                out_ << " (" << field << ' ';
                print(value);
                out_ << ')';
            }
            out_ << ')';
        },
        [&](const PinPattern& p) { out_ << "(^ " << p.name << ')'; },
        [&](const AliasPattern& p) {
            out_ << "(as ";
            print(p.pattern);
            out_ << ' ' << p.name << ')';
        },
        [&](const BinaryPattern& p) {
            out_ << "(binary";
            for (const auto& segment : p.segments) {
                out_ << " (seg ";
                print(segment.value);
                out_ << ' ';
                print_string(segment.spec);
                out_ << ')';
            }
            out_ << ')';
        },
    }, pattern->value);
}

void PrettyPrinter::print_clause(const Clause& clause) {
    Form form(*this, "->");
    form.pattern(clause.pattern);
    if (clause.guard) {
        form.inline_item([&] {
            Form guard(*this, "when");
            guard.inline_node(clause.guard);
        });
    }
    form.body(clause.body);
}

void PrettyPrinter::print_fn_clause(const FnClause& clause) {
    Form form(*this, "->");
    form.inline_item([&] {
        out_ << '(';
        for (size_t i = 0; i < clause.params.size(); ++i) {
            if (i > 0) {
                out_ << ' ';
            }
            print(clause.params[i]);
        }
        out_ << ')';
    });
    if (clause.guard) {
        form.inline_item([&] {
            Form guard(*this, "when");
            guard.inline_node(clause.guard);
        });
    }
    form.body(clause.body);
}

void PrettyPrinter::print_generator(const Generator& generator) {
    Form form(*this, "<-");
    form.pattern(generator.pattern);
    form.inline_node(generator.source);
}

void PrettyPrinter::print_value(const NodePtr& node) {
    std::visit(Overloaded{
        [&](const Var& v) { out_ << v.name; },
        [&](const Literal& v) { print(v); },
        [&](const Block& v) {
            Form form(*this, "block");
            for (const auto& stmt : v.stmts) {
                form.node(stmt);
            }
        },
        [&](const Match& v) {
            Form form(*this, "=");
            form.pattern(v.pattern);
            form.inline_node(v.value);
        },
        [&](const If& v) {
            Form form(*this, "if");
            form.inline_node(v.condition);
            form.node(v.then_branch);
            if (v.else_branch) {
                form.node(v.else_branch);
            }
        },
        [&](const Case& v) {
            Form form(*this, "case");
            form.inline_node(v.subject);
            for (const auto& clause : v.clauses) {
                form.item([&] { print_clause(clause); });
            }
        },
        [&](const Fn& v) {
            Form form(*this, "fn");
            for (const auto& clause : v.clauses) {
                form.item([&] { print_fn_clause(clause); });
            }
        },
        [&](const Def& v) {
            Form form(*this, v.is_private ? "defp" : "def");
            form.inline_item([&] { out_ << v.name; });
            form.inline_item([&] {
                out_ << '(';
                for (size_t i = 0; i < v.params.size(); ++i) {
                    if (i > 0) {
                        out_ << ' ';
                    }
                    print(v.params[i]);
                }
                out_ << ')';
            });
            if (v.guard) {
                form.inline_item([&] {
                    Form guard(*this, "when");
                    guard.inline_node(v.guard);
                });
            }
            form.node(v.body);
        },
        [&](const Call& v) {
            Form form(*this, "call");
            form.inline_item([&] { out_ << v.function; });
            for (const auto& arg : v.args) {
                form.inline_node(arg);
            }
        },
        [&](const RemoteCall& v) {
            Form form(*this, "rcall");
            form.inline_item([&] { out_ << v.module << ' ' << v.function; });
            for (const auto& arg : v.args) {
                form.inline_node(arg);
            }
        },
        [&](const Invoke& v) {
            Form form(*this, "invoke");
            form.inline_node(v.target);
            for (const auto& arg : v.args) {
                form.inline_node(arg);
            }
        },
        [&](const Field& v) {
            Form form(*this, "field");
            form.inline_node(v.target);
            form.inline_item([&] { out_ << v.field; });
        },
        [&](const Index& v) {
            Form form(*this, "index");
            form.inline_node(v.target);
            form.inline_node(v.key);
        },
        [&](const Tuple& v) {
            Form form(*this, "tuple");
            for (const auto& element : v.elements) {
                form.inline_node(element);
            }
        },
        [&](const List& v) {
            Form form(*this, "list");
            for (const auto& element : v.elements) {
                form.inline_node(element);
            }
        },
        [&](const Map& v) {
            Form form(*this, "map");
            for (const auto& [key, value] : v.entries) {
                form.inline_item([&] {
                    out_ << '(';
                    print(key);
                    out_ << ' ';
                    print(value);
                    out_ << ')';
                });
            }
        },
        [&](const Struct& v) {
            Form form(*this, "struct");
            form.inline_item([&] { out_ << v.module; });
            for (const auto& [field, value] : v.fields) {
                form.inline_item([&] {
                    out_ << '(' << field << ' ';
                    print(value);
                    out_ << ')';
                });
            }
        },
        [&](const StructUpdate& v) {
            Form form(*this, "update");
            form.inline_node(v.base);
            for (const auto& [field, value] : v.fields) {
                form.inline_item([&] {
                    out_ << '(' << field << ' ';
                    print(value);
                    out_ << ')';
                });
            }
        },
        [&](const Pipe& v) {
            Form form(*this, "|>");
            form.inline_node(v.lhs);
            form.inline_node(v.rhs);
        },
        [&](const BinaryOp& v) {
            Form form(*this, to_string(v.op));
            form.inline_node(v.lhs);
            form.inline_node(v.rhs);
        },
        [&](const UnaryOp& v) {
            Form form(*this, to_string(v.op));
            form.inline_node(v.operand);
        },
        [&](const With& v) {
            Form form(*this, "with");
            for (const auto& clause : v.clauses) {
                form.item([&] { print_generator(clause); });
            }
            form.item([&] {
                Form body(*this, "do");
                body.body(v.body);
            });
            if (!v.else_clauses.empty()) {
                form.item([&] {
                    Form otherwise(*this, "else");
                    for (const auto& clause : v.else_clauses) {
                        otherwise.item([&] { print_clause(clause); });
                    }
                });
            }
        },
        [&](const Try& v) {
            Form form(*this, "try");
            form.node(v.body);
            if (!v.rescue_clauses.empty()) {
                form.item([&] {
                    Form rescue(*this, "rescue");
                    for (const auto& clause : v.rescue_clauses) {
                        rescue.item([&] { print_clause(clause); });
                    }
                });
            }
            if (v.after) {
                form.item([&] {
                    Form after(*this, "after");
                    after.body(v.after);
                });
            }
        },
        [&](const Receive& v) {
            Form form(*this, "receive");
            for (const auto& clause : v.clauses) {
                form.item([&] { print_clause(clause); });
            }
            if (v.timeout) {
                form.item([&] {
                    Form after(*this, "after");
                    after.inline_node(v.timeout);
                    after.body(v.after_body);
                });
            }
        },
        [&](const For& v) {
            Form form(*this, "for");
            for (const auto& generator : v.generators) {
                form.inline_item([&] { print_generator(generator); });
            }
            for (const auto& filter : v.filters) {
                form.inline_item([&] {
                    Form wrapper(*this, "filter");
                    wrapper.inline_node(filter);
                });
            }
            form.body(v.body);
        },
        [&](const Module& v) {
            Form form(*this, "module");
            form.inline_item([&] { out_ << v.name; });
            for (const auto& item : v.body) {
                form.node(item);
            }
        },
        [&](const Opaque& v) {
            Form form(*this, "opaque");
            form.inline_item([&] { print_string(v.text); });
        },
    }, node->value);
}

std::string to_string(const NodePtr& node, bool compact) {
    std::ostringstream oss;
    PrettyPrinter printer(oss, compact);
    printer.print(node);
    return oss.str();
}

std::string to_string(const PatternPtr& pattern) {
    std::ostringstream oss;
    PrettyPrinter printer(oss, true);
    printer.print(pattern);
    return oss.str();
}

std::string to_string(const std::vector<NodePtr>& items, bool compact) {
    std::ostringstream oss;
    PrettyPrinter printer(oss, compact);
    printer.print_items(items);
    return oss.str();
}

} // namespace ir
