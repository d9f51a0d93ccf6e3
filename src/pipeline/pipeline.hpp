#pragma once

#include <functional>
#include <string>
#include <vector>

#include "diag/diagnostic.hpp"
#include "ir/ir.hpp"
#include "pass/pass.hpp"
#include "pipeline/options.hpp"

namespace pipeline {

struct PassInfo {
    std::string name;
    pass::Tier tier;
    std::vector<std::string> run_after; // passes that must come earlier when present
    std::function<ir::NodePtr(const ir::NodePtr&, pass::PassContext&)> run;
};

/**
 * @brief Ordered list of passes, validated once at construction.
 *
 * Rejected with PipelineConfigError: duplicate names, a tier lower than the
 * tier of an earlier pass, and a `run_after` dependency scheduled later.
 */
class Pipeline {
public:
    Pipeline(std::vector<PassInfo> passes, PipelineOptions options);

    // Runs every enabled pass in order; diagnostics go to `sink`.
    ir::NodePtr run(const ir::NodePtr& tree, diag::DiagnosticSink& sink) const;

    const std::vector<PassInfo>& passes() const { return passes_; }
    const PipelineOptions& options() const { return options_; }
    bool enabled(const std::string& name) const { return !options_.disabled_passes.count(name); }

private:
    void validate() const;

    std::vector<PassInfo> passes_;
    PipelineOptions options_;
};

// Every normalization pass in its required order.
std::vector<PassInfo> default_passes();

// The default pass list under `options`; unknown names in
// `options.disabled_passes` are a configuration error.
Pipeline default_pipeline(const PipelineOptions& options = {});

} // namespace pipeline
