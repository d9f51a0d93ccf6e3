#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "analysis/scope.hpp"
#include "analysis/scope_walker.hpp"
#include "ir/ir.hpp"

namespace analysis {

/**
 * @brief Answers "is `name` read in statements[i..n)" for one statement list.
 *
 * Built by a single backward scan that computes the free reads of each
 * statement once and records, per name, the last statement that reads it.
 * Queries are then constant time; the index is never rebuilt per query.
 */
class UsageIndex {
public:
    static UsageIndex build(const std::vector<ir::NodePtr>& statements, VisitStats* stats = nullptr);

    // True when some statement at position >= i reads `name`.
    bool used_from(size_t i, std::string_view name) const;

    // Names read in statements[i..n).
    NameSet names_from(size_t i) const;

    // Free reads of statement i alone.
    const NameSet& reads_of(size_t i) const { return reads_.at(i); }

    size_t size() const { return reads_.size(); }

private:
    std::vector<NameSet> reads_;
    std::unordered_map<std::string, size_t> last_use_;
};

// Free-function form of UsageIndex::used_from.
inline bool used_later(const UsageIndex& index, size_t i, std::string_view name) {
    return index.used_from(i, name);
}

} // namespace analysis
