#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "analysis/scope.hpp"
#include "diag/diagnostic.hpp"
#include "pipeline/options.hpp"
#include "span/span.hpp"

namespace pass {

// Scheduling tiers; a pipeline never runs a pass of a lower tier after one
// of a higher tier.
enum class Tier {
    Structural = 0,
    Semantic = 1,
    Cleanup = 2,
};

std::string_view to_string(Tier tier);

// What a pass may see besides the tree: options, the diagnostic side
// channel, and the function it is currently rewriting.
class PassContext {
public:
    PassContext(const pipeline::PipelineOptions& options, diag::DiagnosticSink& sink, std::string pass_name = {})
        : options_(&options), sink_(&sink), pass_name_(std::move(pass_name)) {}

    const pipeline::PipelineOptions& options() const { return *options_; }
    const analysis::FunctionContext& function() const { return function_; }
    const std::string& pass_name() const { return pass_name_; }

    // Copy of this context for the body of `function`.
    PassContext for_function(analysis::FunctionContext function) const {
        PassContext copy = *this;
        copy.function_ = std::move(function);
        return copy;
    }

    void report(diag::Severity severity, std::string code, const std::string& message,
                span::Span span = span::Span::invalid(), std::vector<std::string> notes = {}) const;

    void warn(std::string code, const std::string& message, span::Span span = span::Span::invalid()) const {
        report(diag::Severity::Warning, std::move(code), message, span);
    }

    void note(std::string code, const std::string& message, span::Span span = span::Span::invalid()) const {
        report(diag::Severity::Note, std::move(code), message, span);
    }

private:
    const pipeline::PipelineOptions* options_;
    diag::DiagnosticSink* sink_;
    std::string pass_name_;
    analysis::FunctionContext function_;
};

} // namespace pass
