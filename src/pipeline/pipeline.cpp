#include "pipeline.hpp"

#include <iostream>
#include <optional>
#include <unordered_map>

#include "analysis/verifier.hpp"
#include "ir/pretty_print/pretty_print.hpp"
#include "pass/block_flattening/block_flattening.hpp"
#include "pass/boolean_case_to_if/boolean_case_to_if.hpp"
#include "pass/closure_parameter_alignment/closure_parameter_alignment.hpp"
#include "pass/conditional_rebinding_hoist/conditional_rebinding_hoist.hpp"
#include "pass/constant_condition_folding/constant_condition_folding.hpp"
#include "pass/dead_sentinel_elimination/dead_sentinel_elimination.hpp"
#include "pass/discard_rebind_resolution/discard_rebind_resolution.hpp"
#include "pass/each_accumulator_threading/each_accumulator_threading.hpp"
#include "pass/early_return_reconstruction/early_return_reconstruction.hpp"
#include "pass/nil_initializer_elimination/nil_initializer_elimination.hpp"
#include "pass/parameter_harmonization/parameter_harmonization.hpp"
#include "pass/payload_binder_harmonization/payload_binder_harmonization.hpp"
#include "pass/pipeline_formation/pipeline_formation.hpp"
#include "pass/redundant_nil_else_elimination/redundant_nil_else_elimination.hpp"
#include "pass/reserved_word_sanitization/reserved_word_sanitization.hpp"
#include "pass/return_marker_cleanup/return_marker_cleanup.hpp"
#include "pass/self_assignment_elimination/self_assignment_elimination.hpp"
#include "pass/string_interpolation/string_interpolation.hpp"
#include "pass/temp_return_inline/temp_return_inline.hpp"
#include "pass/underscore_promotion/underscore_promotion.hpp"
#include "pass/unused_binding_underscoring/unused_binding_underscoring.hpp"
#include "pass/unused_result_underscoring/unused_result_underscoring.hpp"
#include "utils/debug_context.hpp"
#include "utils/error.hpp"

namespace pipeline {

namespace {

template <typename Pass>
PassInfo stateless(std::string name, pass::Tier tier, std::vector<std::string> run_after) {
    return PassInfo{std::move(name), tier, std::move(run_after),
                    [](const ir::NodePtr& tree, pass::PassContext&) { return Pass().run(tree); }};
}

template <typename Pass>
PassInfo contextual(std::string name, pass::Tier tier, std::vector<std::string> run_after) {
    return PassInfo{std::move(name), tier, std::move(run_after),
                    [](const ir::NodePtr& tree, pass::PassContext& context) { return Pass(context).run(tree); }};
}

} // namespace

std::vector<PassInfo> default_passes() {
    using pass::Tier;
    return {
        stateless<pass::ConstantConditionFolding>("constant_condition_folding", Tier::Structural, {}),
        stateless<pass::BlockFlattening>("block_flattening", Tier::Structural, {"constant_condition_folding"}),
        stateless<pass::EarlyReturnReconstruction>("early_return_reconstruction", Tier::Structural,
                                                   {"block_flattening"}),
        contextual<pass::ReturnMarkerCleanup>("return_marker_cleanup", Tier::Structural,
                                              {"early_return_reconstruction"}),
        stateless<pass::ConditionalRebindingHoist>("conditional_rebinding_hoist", Tier::Structural,
                                                   {"early_return_reconstruction"}),
        contextual<pass::EachAccumulatorThreading>("each_accumulator_threading", Tier::Structural,
                                                   {"conditional_rebinding_hoist"}),
        stateless<pass::NilInitializerElimination>("nil_initializer_elimination", Tier::Structural,
                                                   {"conditional_rebinding_hoist", "each_accumulator_threading"}),

        contextual<pass::DiscardRebindResolution>("discard_rebind_resolution", Tier::Semantic,
                                                  {"nil_initializer_elimination"}),
        stateless<pass::ClosureParameterAlignment>("closure_parameter_alignment", Tier::Semantic, {}),
        contextual<pass::PayloadBinderHarmonization>("payload_binder_harmonization", Tier::Semantic, {}),
        contextual<pass::ParameterHarmonization>("parameter_harmonization", Tier::Semantic, {}),
        stateless<pass::UnderscorePromotion>("underscore_promotion", Tier::Semantic,
                                             {"payload_binder_harmonization", "parameter_harmonization"}),
        contextual<pass::UnusedResultUnderscoring>("unused_result_underscoring", Tier::Semantic,
                                                   {"underscore_promotion"}),

        stateless<pass::SelfAssignmentElimination>("self_assignment_elimination", Tier::Cleanup, {}),
        stateless<pass::TempReturnInline>("temp_return_inline", Tier::Cleanup, {"self_assignment_elimination"}),
        stateless<pass::RedundantNilElseElimination>("redundant_nil_else_elimination", Tier::Cleanup, {}),
        stateless<pass::BooleanCaseToIf>("boolean_case_to_if", Tier::Cleanup, {}),
        stateless<pass::StringInterpolation>("string_interpolation", Tier::Cleanup, {}),
        stateless<pass::PipelineFormation>("pipeline_formation", Tier::Cleanup, {}),
        contextual<pass::UnusedBindingUnderscoring>("unused_binding_underscoring", Tier::Cleanup,
                                                    {"temp_return_inline", "underscore_promotion"}),
        stateless<pass::DeadSentinelElimination>("dead_sentinel_elimination", Tier::Cleanup,
                                                 {"temp_return_inline"}),
        contextual<pass::ReservedWordSanitization>("reserved_word_sanitization", Tier::Cleanup,
                                                   {"unused_binding_underscoring"}),
    };
}

Pipeline::Pipeline(std::vector<PassInfo> passes, PipelineOptions options)
    : passes_(std::move(passes)), options_(std::move(options)) {
    validate();
}

void Pipeline::validate() const {
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < passes_.size(); ++i) {
        const auto& info = passes_[i];
        if (!info.run) {
            error_helper::report_config_error("Pass '" + info.name + "' has no entry point");
        }
        if (!position.emplace(info.name, i).second) {
            error_helper::report_config_error("Pass '" + info.name + "' is registered twice");
        }
        if (i > 0 && info.tier < passes_[i - 1].tier) {
            error_helper::report_config_error("Pass '" + info.name + "' (" + std::string(pass::to_string(info.tier)) +
                                              ") is scheduled after " +
                                              std::string(pass::to_string(passes_[i - 1].tier)) + " pass '" +
                                              passes_[i - 1].name + "'");
        }
    }
    for (size_t i = 0; i < passes_.size(); ++i) {
        for (const auto& dependency : passes_[i].run_after) {
            auto it = position.find(dependency);
            if (it != position.end() && it->second > i) {
                error_helper::report_ordering_violation(passes_[i].name, dependency);
            }
        }
    }
    for (const auto& name : options_.disabled_passes) {
        if (!position.count(name)) {
            error_helper::report_unknown_pass(name);
        }
    }
}

ir::NodePtr Pipeline::run(const ir::NodePtr& tree, diag::DiagnosticSink& sink) const {
    auto current = tree;
    for (const auto& info : passes_) {
        if (!enabled(info.name)) {
            if (options_.trace) {
                std::cerr << "[pipeline] skip " << info.name << std::endl;
            }
            continue;
        }
        auto context = debug::push(debug::Frame::Pass, info.name);
        pass::PassContext pass_context(options_, sink, info.name);
        auto result = info.run(current, pass_context);
        if (!result) {
            throw NormalizeError(debug::format_with_context("pass produced no tree"),
                                 tree ? tree->span : span::Span::invalid());
        }
        if (options_.trace) {
            std::cerr << "[pipeline] " << info.name << " (" << pass::to_string(info.tier) << ")"
                      << (result == current ? " unchanged" : "") << std::endl;
            if (result != current) {
                std::cerr << ir::to_string(result, false) << std::endl;
            }
        }
        current = std::move(result);
    }

    if (options_.verify) {
        auto context = debug::push(debug::Frame::Pass, "verify");
        pass::PassContext verify_context(options_, sink, "verify");
        for (const auto& issue : analysis::verify(current)) {
            std::optional<debug::Context::Guard> function;
            if (!issue.function.empty()) {
                function.emplace(debug::push(debug::Frame::Function, issue.function));
            }
            if (issue.kind == analysis::VerifyIssue::Kind::UnboundReference) {
                verify_context.warn("unbound-reference", "'" + issue.name + "' is read but never bound", issue.span);
            } else {
                verify_context.warn("unused-literal", "literal " + issue.name + " in non-terminal position",
                                    issue.span);
            }
        }
    }
    return current;
}

Pipeline default_pipeline(const PipelineOptions& options) {
    return Pipeline(default_passes(), options);
}

} // namespace pipeline
