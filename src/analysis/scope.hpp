#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace analysis {

using NameSet = std::set<std::string, std::less<>>;

// Lexical scope of variable bindings. A boundary scope (function or module
// definition) hides every binding of its ancestors.
class Scope {
    Scope *parent;
    bool is_boundary;

    std::unordered_set<std::string> bindings;

public:
    Scope(Scope *parent_scope = nullptr, bool is_boundary = false)
        : parent(parent_scope), is_boundary(is_boundary) {}

    void define(const std::string &name) {
        if (name.empty() || name.find_first_not_of('_') == std::string::npos) {
            return; // wildcards bind nothing
        }
        bindings.insert(name);
    }

    void define_all(const std::vector<std::string> &names) {
        for (const auto &name : names) {
            define(name);
        }
    }

    bool lookup(std::string_view name) const {
        const Scope *current = this;
        while (current) {
            if (current->bindings.count(std::string(name))) {
                return true;
            }
            if (current->is_boundary) {
                return false;
            }
            current = current->parent;
        }
        return false;
    }

    bool lookup_local(std::string_view name) const {
        return bindings.count(std::string(name)) > 0;
    }

    // Every name visible from this scope, innermost boundary included.
    NameSet visible() const {
        NameSet names;
        const Scope *current = this;
        while (current) {
            names.insert(current->bindings.begin(), current->bindings.end());
            if (current->is_boundary) {
                break;
            }
            current = current->parent;
        }
        return names;
    }

    Scope *get_parent() const { return parent; }
    bool boundary() const { return is_boundary; }
};

// Enclosing named function of the code being rewritten.
struct FunctionContext {
    std::string name;
    std::vector<std::string> params;

    bool empty() const { return name.empty(); }
};

} // namespace analysis
