#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "ir/ir.hpp"

namespace ir {

// Prints trees in the s-expression form accepted by ir::reader. Compact mode
// keeps everything on one line; otherwise statement lists, clauses and
// branches go on their own indented lines.
class PrettyPrinter {
public:
    explicit PrettyPrinter(std::ostream& out, bool compact = false)
        : out_(out), compact_(compact) {}

    void print(const NodePtr& node);
    void print(const PatternPtr& pattern);
    void print(const Literal& literal);
    void print_items(const std::vector<NodePtr>& items);

private:
    class Form;

    // RAII helper for managing indentation
    class IndentGuard {
    public:
        explicit IndentGuard(PrettyPrinter& printer) : printer_(printer) {
            printer_.indent_level_++;
        }
        ~IndentGuard() {
            printer_.indent_level_--;
        }
    private:
        PrettyPrinter& printer_;
    };

    void prefix() {
        for (int i = 0; i < indent_level_; ++i) {
            out_ << "  ";
        }
    }

    void print_value(const NodePtr& node);
    void print_clause(const Clause& clause);
    void print_fn_clause(const FnClause& clause);
    void print_generator(const Generator& generator);
    void print_string(std::string_view text);

    std::ostream& out_;
    bool compact_;
    int indent_level_ = 0;
};

std::string to_string(const NodePtr& node, bool compact = true);
std::string to_string(const PatternPtr& pattern);
std::string to_string(const std::vector<NodePtr>& items, bool compact = true);

} // namespace ir
