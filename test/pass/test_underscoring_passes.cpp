#include "test/test_helpers/common.hpp"
#include "src/pass/unused_binding_underscoring/unused_binding_underscoring.hpp"
#include "src/pass/unused_result_underscoring/unused_result_underscoring.hpp"

using namespace test::helpers;

class UnusedResultUnderscoringTest : public PassTestBase {};

TEST_F(UnusedResultUnderscoringTest, UnderscoresUnreadAggregationResult) {
    EXPECT_EQ(apply<pass::UnusedResultUnderscoring>(
                  "(def f (xs) (block (= doubled (rcall Enum map xs (fn (-> (x) (* x 2))))) :ok))"),
              canonical("(def f (xs) (block (= _doubled (rcall Enum map xs (fn (-> (x) (* x 2))))) :ok))"));
}

TEST_F(UnusedResultUnderscoringTest, ComprehensionsAndPipesAreAggregations) {
    EXPECT_EQ(apply<pass::UnusedResultUnderscoring>(
                  "(def f (xs) (block (= r (for (<- x xs) x)) (= p (|> xs (rcall Enum map (fn (-> (x) x))))) :ok))"),
              canonical("(def f (xs) (block (= _r (for (<- x xs) x)) (= _p (|> xs (rcall Enum map (fn (-> (x) x))))) :ok))"));
}

TEST_F(UnusedResultUnderscoringTest, ConfiguredFunctionsAreAggregations) {
    std::string input = "(def f (q) (block (= rows (rcall Repo all q)) :ok))";
    EXPECT_TRUE(leaves_unchanged<pass::UnusedResultUnderscoring>(input));

    options.aggregation_functions.insert("Repo.all");
    EXPECT_EQ(apply<pass::UnusedResultUnderscoring>(input),
              canonical("(def f (q) (block (= _rows (rcall Repo all q)) :ok))"));
}

TEST_F(UnusedResultUnderscoringTest, ReadResultsAndPlainBindingsStay) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedResultUnderscoring>(
        "(def f (xs) (block (= ys (rcall Enum map xs (fn (-> (x) x)))) (= unused (call g)) ys))"));
}

TEST_F(UnusedResultUnderscoringTest, LivenessFlowsOutOfNestedBlocks) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedResultUnderscoring>(
        "(def f (c xs) (block (if c (block (= ys (rcall Enum map xs (fn (-> (x) x)))) (call log ys)) nil) :ok))"));
    EXPECT_EQ(apply<pass::UnusedResultUnderscoring>(
                  "(def f (c xs) (block (if c (block (= ys (rcall Enum map xs (fn (-> (x) x)))) (call log 1))) :ok))"),
              canonical("(def f (c xs) (block (if c (block (= _ys (rcall Enum map xs (fn (-> (x) x)))) (call log 1))) :ok))"));
}

TEST_F(UnusedResultUnderscoringTest, TerminalMatchIsKept) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedResultUnderscoring>(
        "(def f (xs) (block (call log xs) (= ys (rcall Enum map xs (fn (-> (x) x))))))"));
}

class UnusedBindingUnderscoringTest : public PassTestBase {};

TEST_F(UnusedBindingUnderscoringTest, UnderscoresParametersAndStatements) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>("(def f (a b) (block (= c 1) (= d 2) (+ a d)))"),
              canonical("(def f (a _b) (block (= _c 1) (= d 2) (+ a d)))"));
}

TEST_F(UnusedBindingUnderscoringTest, UnderscoresClauseBinders) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>(
                  "(def f (r) (case r (-> (tuple :ok v) :ok) (-> (tuple :error e) e)))"),
              canonical("(def f (r) (case r (-> (tuple :ok _v) :ok) (-> (tuple :error e) e)))"));
}

TEST_F(UnusedBindingUnderscoringTest, UnderscoresClosureParameters) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>("(def f (xs) (rcall Enum map xs (fn (-> (x) 1))))"),
              canonical("(def f (xs) (rcall Enum map xs (fn (-> (_x) 1))))"));
}

TEST_F(UnusedBindingUnderscoringTest, ClosureBodiesDoNotSeeOuterLiveness) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>(
                  "(def f (xs y) (block (rcall Enum each xs (fn (-> (x) (= y x) :ok))) y))"),
              canonical("(def f (xs y) (block (rcall Enum each xs (fn (-> (x) (= _y x) :ok))) y))"));
}

TEST_F(UnusedBindingUnderscoringTest, UnderscoresGeneratorBinders) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>("(def f (xs ys) (for (<- x xs) (<- y ys) y))"),
              canonical("(def f (xs ys) (for (<- _x xs) (<- y ys) y))"));
}

TEST_F(UnusedBindingUnderscoringTest, WithBindersReadByLaterSourcesAreKept) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>(
                  "(def f () (with (<- (tuple :ok a) (call load)) (<- (tuple :ok b) (call save a)) (do :ok)"
                  " (else (-> (tuple :error reason) :error))))"),
              canonical("(def f () (with (<- (tuple :ok a) (call load)) (<- (tuple :ok _b) (call save a)) (do :ok)"
                        " (else (-> (tuple :error _reason) :error))))"));
}

TEST_F(UnusedBindingUnderscoringTest, RebindingReadsKeepEarlierBinding) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedBindingUnderscoring>("(def f () (block (= x 1) (= x (+ x 1)) x))"));
}

TEST_F(UnusedBindingUnderscoringTest, OverwrittenBindingIsUnderscored) {
    EXPECT_EQ(apply<pass::UnusedBindingUnderscoring>("(def f () (block (= x (call a)) (= x (call b)) (call g x)))"),
              canonical("(def f () (block (= _x (call a)) (= x (call b)) (call g x)))"));
}

TEST_F(UnusedBindingUnderscoringTest, RebindingInsideABranchDoesNotEndTheOuterValue) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedBindingUnderscoring>(
        "(def f (c) (block (= x (call a)) (if c (= x (call b))) (call g x)))"));
}

TEST_F(UnusedBindingUnderscoringTest, UnderscoredAndWildcardBindersAreLeftAlone) {
    EXPECT_TRUE(leaves_unchanged<pass::UnusedBindingUnderscoring>("(def f (_a _) (block (= _c 1) :ok))"));
}
