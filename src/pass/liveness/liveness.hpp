#pragma once

#include <vector>

#include "analysis/scope.hpp"
#include "ir/ir.hpp"
#include "pipeline/options.hpp"

namespace pass {

/**
 * @brief Underscores binders whose names are not live.
 *
 * Liveness is threaded outward: a statement of a nested block sees as live
 * everything read later in its own list plus everything live after the
 * enclosing statement. Function and closure bodies start from nothing.
 */
class BindingUnderscorer {
public:
    enum class Mode {
        AggregationResults, // only matches whose value is an aggregation
        AllBindings,        // every match, parameter, clause and generator binder
    };

    BindingUnderscorer(Mode mode, const pipeline::PipelineOptions& options) : mode_(mode), options_(options) {}

    ir::NodePtr run(const ir::NodePtr& root) { return process(root, {}); }

private:
    ir::NodePtr process(const ir::NodePtr& node, const analysis::NameSet& live);
    ir::NodePtr process_block(const ir::NodePtr& node, const std::vector<ir::NodePtr>& stmts,
                              const analysis::NameSet& live_after);
    ir::NodePtr process_statement(const ir::NodePtr& stmt, const analysis::NameSet& live, bool terminal);
    ir::NodePtr process_binders(const ir::NodePtr& node);

    // `pattern` with every binder outside `keep` underscored.
    static ir::PatternPtr underscore_unused(const ir::PatternPtr& pattern, const analysis::NameSet& keep);

    Mode mode_;
    const pipeline::PipelineOptions& options_;
};

} // namespace pass
