#include "test/test_helpers/common.hpp"
#include "src/pipeline/pipeline.hpp"
#include "src/utils/error.hpp"

#include <algorithm>

using namespace test::helpers;
using pass::Tier;
using pipeline::PassInfo;
using pipeline::Pipeline;
using pipeline::PipelineOptions;

namespace {

PassInfo identity(std::string name, Tier tier, std::vector<std::string> run_after = {}) {
    return PassInfo{std::move(name), tier, std::move(run_after),
                    [](const ir::NodePtr& tree, pass::PassContext&) { return tree; }};
}

PassInfo wrap_in_tuple(std::string name, Tier tier) {
    return PassInfo{std::move(name), tier, {},
                    [](const ir::NodePtr& tree, pass::PassContext&) { return ir::helper::tuple({tree}); }};
}

} // namespace

TEST(PipelineTest, DefaultPassesAreValidAndOrderedByTier) {
    auto passes = pipeline::default_passes();
    ASSERT_EQ(passes.size(), 22u);
    EXPECT_EQ(passes.front().name, "constant_condition_folding");
    EXPECT_EQ(passes.back().name, "reserved_word_sanitization");
    EXPECT_TRUE(std::is_sorted(passes.begin(), passes.end(),
                               [](const PassInfo& a, const PassInfo& b) { return a.tier < b.tier; }));
    EXPECT_NO_THROW(pipeline::default_pipeline());
}

TEST(PipelineTest, DuplicateNamesAreRejected) {
    EXPECT_THROW(Pipeline({identity("a", Tier::Structural), identity("a", Tier::Semantic)}, {}), PipelineConfigError);
}

TEST(PipelineTest, TierRegressionIsRejected) {
    try {
        Pipeline({identity("late", Tier::Cleanup), identity("early", Tier::Structural)}, {});
        FAIL() << "expected a configuration error";
    } catch (const PipelineConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("'early'"), std::string::npos);
    }
}

TEST(PipelineTest, RunAfterViolationIsRejected) {
    EXPECT_THROW(Pipeline({identity("a", Tier::Structural, {"b"}), identity("b", Tier::Structural)}, {}),
                 PipelineConfigError);
    EXPECT_NO_THROW(Pipeline({identity("b", Tier::Structural), identity("a", Tier::Structural, {"b"})}, {}));
}

TEST(PipelineTest, AbsentDependenciesAreIgnored) {
    EXPECT_NO_THROW(Pipeline({identity("a", Tier::Structural, {"not_registered"})}, {}));
}

TEST(PipelineTest, MissingEntryPointIsRejected) {
    EXPECT_THROW(Pipeline({PassInfo{"empty", Tier::Structural, {}, nullptr}}, {}), PipelineConfigError);
}

TEST(PipelineTest, UnknownDisabledPassIsRejected) {
    PipelineOptions options;
    options.disabled_passes = {"no_such_pass"};
    EXPECT_THROW(pipeline::default_pipeline(options), PipelineConfigError);
}

TEST(PipelineTest, DisabledPassesAreSkipped) {
    PipelineOptions options;
    options.disabled_passes = {"wrap"};
    Pipeline pipeline({wrap_in_tuple("wrap", Tier::Structural)}, options);
    diag::CollectingSink sink;
    auto input = parse("x");
    EXPECT_EQ(pipeline.run(input, sink), input);
    EXPECT_FALSE(pipeline.enabled("wrap"));
}

TEST(PipelineTest, PassesRunInOrder) {
    Pipeline pipeline({wrap_in_tuple("first", Tier::Structural), wrap_in_tuple("second", Tier::Cleanup)}, {});
    diag::CollectingSink sink;
    EXPECT_EQ(print(pipeline.run(parse("x"), sink)), "(tuple (tuple x))");
}

TEST(PipelineTest, NullResultIsAnError) {
    PassInfo broken{"broken", Tier::Structural, {},
                    [](const ir::NodePtr&, pass::PassContext&) { return ir::NodePtr{}; }};
    Pipeline pipeline({broken}, {});
    diag::CollectingSink sink;
    try {
        pipeline.run(parse("x"), sink);
        FAIL() << "expected a normalization error";
    } catch (const NormalizeError& e) {
        EXPECT_NE(std::string(e.what()).find("pass 'broken'"), std::string::npos);
    }
}

TEST(PipelineTest, PassesReportThroughTheirContext) {
    PassInfo noisy{"noisy", Tier::Semantic, {}, [](const ir::NodePtr& tree, pass::PassContext& context) {
                       context.note("noise", "something happened");
                       return tree;
                   }};
    Pipeline pipeline({noisy}, {});
    diag::CollectingSink sink;
    pipeline.run(parse("x"), sink);
    ASSERT_EQ(sink.diagnostics().size(), 1u);
    EXPECT_EQ(sink.diagnostics().front().code, "noise");
    EXPECT_EQ(sink.diagnostics().front().message, "In pass 'noisy': something happened");
}

TEST(PipelineTest, TraceListsEveryPass) {
    PipelineOptions options;
    options.trace = true;
    options.disabled_passes = {"skipped"};
    Pipeline pipeline({identity("kept", Tier::Structural), wrap_in_tuple("changed", Tier::Semantic),
                       identity("skipped", Tier::Cleanup)},
                      options);
    diag::CollectingSink sink;
    testing::internal::CaptureStderr();
    pipeline.run(parse("x"), sink);
    auto output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("[pipeline] kept (structural) unchanged"), std::string::npos);
    EXPECT_NE(output.find("[pipeline] changed (semantic)\n(tuple x)"), std::string::npos);
    EXPECT_NE(output.find("[pipeline] skip skipped"), std::string::npos);
}

TEST(PipelineTest, VerifyReportsUnboundReads) {
    PipelineOptions options;
    options.verify = true;
    Pipeline pipeline({identity("noop", Tier::Structural)}, options);
    diag::CollectingSink sink;
    pipeline.run(parse("(module M (def f (x) (block 1 (+ x y))))"), sink);
    EXPECT_TRUE(sink.has_code("unbound-reference"));
    EXPECT_TRUE(sink.has_code("unused-literal"));
    EXPECT_EQ(sink.count(diag::Severity::Warning), 2u);
}
