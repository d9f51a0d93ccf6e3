#include "usage_index.hpp"

namespace analysis {

UsageIndex UsageIndex::build(const std::vector<ir::NodePtr>& statements, VisitStats* stats) {
    UsageIndex index;
    index.reads_.resize(statements.size());
    for (size_t i = statements.size(); i-- > 0;) {
        index.reads_[i] = referenced_names(statements[i], stats);
        for (const auto& name : index.reads_[i]) {
            index.last_use_.try_emplace(name, i);
        }
    }
    return index;
}

bool UsageIndex::used_from(size_t i, std::string_view name) const {
    auto it = last_use_.find(std::string(name));
    return it != last_use_.end() && it->second >= i;
}

NameSet UsageIndex::names_from(size_t i) const {
    NameSet names;
    for (const auto& [name, last] : last_use_) {
        if (last >= i) {
            names.insert(name);
        }
    }
    return names;
}

} // namespace analysis
