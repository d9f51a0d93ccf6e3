#include "test/test_helpers/common.hpp"
#include "src/pass/closure_parameter_alignment/closure_parameter_alignment.hpp"
#include "src/pass/parameter_harmonization/parameter_harmonization.hpp"
#include "src/pass/payload_binder_harmonization/payload_binder_harmonization.hpp"
#include "src/pass/underscore_promotion/underscore_promotion.hpp"

using namespace test::helpers;

class ClosureParameterAlignmentTest : public PassTestBase {};

TEST_F(ClosureParameterAlignmentTest, RenamesUnreadParameterOntoFieldReceiver) {
    EXPECT_EQ(apply<pass::ClosureParameterAlignment>(
                  "(def names (users) (rcall Enum map users (fn (-> (u) (field user name)))))"),
              canonical("(def names (users) (rcall Enum map users (fn (-> (user) (field user name)))))"));
}

TEST_F(ClosureParameterAlignmentTest, RenamesOntoCallArgument) {
    EXPECT_EQ(apply<pass::ClosureParameterAlignment>(
                  "(def run (jobs) (rcall Enum each jobs (fn (-> (j) (call perform job)))))"),
              canonical("(def run (jobs) (rcall Enum each jobs (fn (-> (job) (call perform job)))))"));
}

TEST_F(ClosureParameterAlignmentTest, EnclosingBindingsAreNotTargets) {
    EXPECT_TRUE(leaves_unchanged<pass::ClosureParameterAlignment>(
        "(def names (users user) (rcall Enum map users (fn (-> (u) (field user name)))))"));
}

TEST_F(ClosureParameterAlignmentTest, ReadParametersAreLeftAlone) {
    EXPECT_TRUE(leaves_unchanged<pass::ClosureParameterAlignment>(
        "(def f (xs) (rcall Enum map xs (fn (-> (x) (call combine x other)))))"));
}

TEST_F(ClosureParameterAlignmentTest, ArithmeticUseIsNotEnoughEvidence) {
    EXPECT_TRUE(leaves_unchanged<pass::ClosureParameterAlignment>(
        "(def f (xs) (rcall Enum map xs (fn (-> (x) (+ y 1)))))"));
}

TEST_F(ClosureParameterAlignmentTest, AlignsNestedClosures) {
    EXPECT_EQ(apply<pass::ClosureParameterAlignment>(
                  "(def f (groups) (rcall Enum map groups (fn (-> (g)"
                  " (rcall Enum map (field group items) (fn (-> (i) (field item id))))))))"),
              canonical("(def f (groups) (rcall Enum map groups (fn (-> (group)"
                        " (rcall Enum map (field group items) (fn (-> (item) (field item id))))))))"));
}

class PayloadBinderHarmonizationTest : public PassTestBase {};

TEST_F(PayloadBinderHarmonizationTest, RenamesPayloadOntoTheReadName) {
    EXPECT_EQ(apply<pass::PayloadBinderHarmonization>(
                  "(def f (r) (case r (-> (tuple :ok v) (call handle value)) (-> (tuple :error _) nil)))"),
              canonical("(def f (r) (case r (-> (tuple :ok value) (call handle value)) (-> (tuple :error _) nil)))"));
    EXPECT_TRUE(sink.diagnostics().empty());
}

TEST_F(PayloadBinderHarmonizationTest, TieBreakListResolvesSeveralNames) {
    EXPECT_EQ(apply<pass::PayloadBinderHarmonization>(
                  "(def f (r) (case r (-> (tuple :ok v) (call put id extra))))"),
              canonical("(def f (r) (case r (-> (tuple :ok id) (call put id extra))))"));
}

TEST_F(PayloadBinderHarmonizationTest, ConfiguredTieBreakListIsUsed) {
    options.tie_break_names = {"extra"};
    EXPECT_EQ(apply<pass::PayloadBinderHarmonization>(
                  "(def f (r) (case r (-> (tuple :ok v) (call put id extra))))"),
              canonical("(def f (r) (case r (-> (tuple :ok extra) (call put id extra))))"));
}

TEST_F(PayloadBinderHarmonizationTest, AmbiguityIsReportedAndLeftAlone) {
    std::string input = "(def f (r) (case r (-> (tuple :ok v) (call put a b))))";
    EXPECT_EQ(apply<pass::PayloadBinderHarmonization>(input), canonical(input));
    ASSERT_EQ(sink.diagnostics().size(), 1u);
    const auto& diagnostic = sink.diagnostics().front();
    EXPECT_EQ(diagnostic.code, "ambiguous-payload");
    EXPECT_EQ(diagnostic.severity, diag::Severity::Note);
    EXPECT_NE(diagnostic.message.find("unbound names: a, b"), std::string::npos);
}

TEST_F(PayloadBinderHarmonizationTest, UntaggedPatternsAreNotTouched) {
    EXPECT_TRUE(leaves_unchanged<pass::PayloadBinderHarmonization>(
        "(def f (r) (case r (-> (tuple a b) (call use c))))"));
}

TEST_F(PayloadBinderHarmonizationTest, NamesBoundEarlierAreNotTargets) {
    EXPECT_TRUE(leaves_unchanged<pass::PayloadBinderHarmonization>(
        "(def f (r) (block (= value 1) (case r (-> (tuple :ok v) (call handle value)))))"));
}

TEST_F(PayloadBinderHarmonizationTest, ClosureParametersWithTaggedPayload) {
    EXPECT_EQ(apply<pass::PayloadBinderHarmonization>(
                  "(def f (rs) (rcall Enum each rs (fn (-> ((tuple :error e)) (call log reason)))))"),
              canonical("(def f (rs) (rcall Enum each rs (fn (-> ((tuple :error reason)) (call log reason)))))"));
}

class ParameterHarmonizationTest : public PassTestBase {};

TEST_F(ParameterHarmonizationTest, RenamesUnreadParameter) {
    EXPECT_EQ(apply<pass::ParameterHarmonization>("(def f (x) (+ y 1))"), canonical("(def f (y) (+ y 1))"));
}

TEST_F(ParameterHarmonizationTest, MatchingUnderscoredParameterWins) {
    EXPECT_EQ(apply<pass::ParameterHarmonization>("(def f (a _count) (+ a count))"),
              canonical("(def f (a count) (+ a count))"));
}

TEST_F(ParameterHarmonizationTest, ConsistentDefinitionsAreUnchanged) {
    EXPECT_TRUE(leaves_unchanged<pass::ParameterHarmonization>("(module M (def f (a) a) (def g () 1))"));
}

TEST_F(ParameterHarmonizationTest, AmbiguityIsNotedWithTheFunction) {
    std::string input = "(module M (def f (a b) (+ c d)))";
    EXPECT_EQ(apply<pass::ParameterHarmonization>(input), canonical(input));
    ASSERT_EQ(sink.diagnostics().size(), 1u);
    EXPECT_EQ(sink.diagnostics().front().code, "ambiguous-parameter");
    EXPECT_NE(sink.diagnostics().front().message.find("function 'f'"), std::string::npos);
}

class UnderscorePromotionTest : public PassTestBase {};

TEST_F(UnderscorePromotionTest, PromotesReadParameter) {
    EXPECT_EQ(apply<pass::UnderscorePromotion>("(def f (_x) (+ x 1))"), canonical("(def f (x) (+ x 1))"));
}

TEST_F(UnderscorePromotionTest, PromotesClauseBinder) {
    EXPECT_EQ(apply<pass::UnderscorePromotion>("(def f (r) (case r (-> (tuple :ok _v) v) (-> _ nil)))"),
              canonical("(def f (r) (case r (-> (tuple :ok v) v) (-> _ nil)))"));
}

TEST_F(UnderscorePromotionTest, PromotesClosureParameter) {
    EXPECT_EQ(apply<pass::UnderscorePromotion>("(def f (xs) (rcall Enum map xs (fn (-> (_x) (* x 2)))))"),
              canonical("(def f (xs) (rcall Enum map xs (fn (-> (x) (* x 2)))))"));
}

TEST_F(UnderscorePromotionTest, PromotesStatementBinder) {
    EXPECT_EQ(apply<pass::UnderscorePromotion>("(def f () (block (= _total (call sum)) (call log total) total))"),
              canonical("(def f () (block (= total (call sum)) (call log total) total))"));
}

TEST_F(UnderscorePromotionTest, BoundBareNameBlocksPromotion) {
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>(
        "(def f (total) (block (= _total 1) (call log total) :ok))"));
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>("(def f (_x x) (+ x 1))"));
}

TEST_F(UnderscorePromotionTest, LaterDeclarationBlocksPromotion) {
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>(
        "(def f () (block (= _n 1) (call log n) (= n 2) n))"));
}

TEST_F(UnderscorePromotionTest, OnlyDeclarationsAfterTheBinderBlockPromotion) {
    EXPECT_EQ(apply<pass::UnderscorePromotion>(
                  "(def f (xs) (block (call each xs (fn (-> (n) n))) (= _n 1) (call log n) :ok))"),
              canonical("(def f (xs) (block (call each xs (fn (-> (n) n))) (= n 1) (call log n) :ok))"));
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>(
        "(def f (c) (block (= _n 1) (call log n) (if c (= n 2)) :ok))"));
}

TEST_F(UnderscorePromotionTest, UnreadBareNameIsLeftAlone) {
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>("(def f (_x) 1)"));
    EXPECT_TRUE(leaves_unchanged<pass::UnderscorePromotion>("(def f () (block (= _n 1) :ok))"));
}
