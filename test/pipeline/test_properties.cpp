#include "test/test_helpers/common.hpp"
#include "src/pipeline/pipeline.hpp"

using namespace test::helpers;

namespace {

class NormalizationTest : public ::testing::Test {
protected:
    pipeline::PipelineOptions options;
    diag::CollectingSink sink;

    ir::NodePtr normalize(const ir::NodePtr& tree) {
        return pipeline::default_pipeline(options).run(tree, sink);
    }

    std::string normalize(std::string_view text) {
        return print(normalize(parse(text)));
    }
};

const char* const kSamples[] = {
    "(def classify (x) (block (if (< x 0) (return :negative)) (= label (call describe x)) label))",
    "(def total (xs) (block (= sum 0) (rcall Enum each xs (fn (-> (x) (= sum (+ sum x))))) sum))",
    "(def f (x) (block (= y 0) (if (> x 0) (= y 1)) y))",
    "(def f (r) (case r (-> (tuple :ok v) (call handle value)) (-> (tuple :error _) nil)))",
    "(def greet (user) (<> (<> \"Hello \" (field user name)) \"!\"))",
    "(def f (m) (block (rcall Map put m :k 1) (= unused (rcall Enum map (rcall Map keys m) (fn (-> (k) k)))) m))",
    "(module Shop (def price (item) (block (= result nil) (= result (* (field item cost) 2)) result))"
    " (def check (ok) (case ok (-> true :yes) (-> false :no))))",
    "(def positive (xs) (block (= sum 0) (rcall Enum each xs (fn (-> (x) (if (> x 0) (= sum (+ sum x)))))) sum))",
    "(def total (xs) (block (= sum 0) (for (<- x xs) (= sum (+ sum x))) sum))",
    "(def f () (block (= x (call a)) (= x (call b)) (call g x)))",
};

} // namespace

TEST_F(NormalizationTest, EarlyReturnBecomesAnIfElse) {
    EXPECT_EQ(normalize(kSamples[0]), canonical("(def classify (x) (if (< x 0) :negative (call describe x)))"));
}

TEST_F(NormalizationTest, EachLoopBecomesAReduce) {
    EXPECT_EQ(normalize(kSamples[1]),
              canonical("(def total (xs) (block (= sum 0) (rcall Enum reduce xs sum (fn (-> (x sum) (+ sum x))))))"));
}

TEST_F(NormalizationTest, ConditionalRebindingIsHoisted) {
    EXPECT_EQ(normalize(kSamples[2]), canonical("(def f (x) (block (= y 0) (if (> x 0) 1 y)))"));
}

TEST_F(NormalizationTest, PayloadBinderMatchesItsUse) {
    options.verify = true;
    EXPECT_EQ(normalize(kSamples[3]),
              canonical("(def f (r) (case r (-> (tuple :ok value) (call handle value)) (-> (tuple :error _) nil)))"));
    EXPECT_FALSE(sink.has_code("unbound-reference"));
}

TEST_F(NormalizationTest, ConcatenationBecomesInterpolation) {
    EXPECT_EQ(normalize(kSamples[4]), canonical("(def greet (user) \"Hello #{user.name}!\")"));
}

TEST_F(NormalizationTest, ReservedWordsAreRenamed) {
    EXPECT_EQ(normalize("(def f (case) (+ case 1))"), canonical("(def f (case_) (+ case_ 1))"));
}

TEST_F(NormalizationTest, SamplesLeaveNothingUnbound) {
    options.verify = true;
    for (const char* sample : kSamples) {
        sink.clear();
        normalize(std::string_view(sample));
        EXPECT_FALSE(sink.has_code("unbound-reference")) << sample;
    }
}

TEST_F(NormalizationTest, NormalizationIsIdempotent) {
    for (const char* sample : kSamples) {
        auto once = normalize(parse(sample));
        auto twice = normalize(once);
        EXPECT_EQ(print(twice), print(once)) << sample;
    }
}

TEST_F(NormalizationTest, TerminalValuesArePreserved) {
    EXPECT_EQ(normalize("(def f (xs) (block (= ys (rcall Enum map xs (fn (-> (x) (* x 2))))) ys))"),
              canonical("(def f (xs) (rcall Enum map xs (fn (-> (x) (* x 2)))))"));
    EXPECT_EQ(normalize("(def f () (block (call log 1) nil))"), canonical("(def f () (block (call log 1) nil))"));
}

TEST_F(NormalizationTest, AmbiguitiesAreReportedNotGuessed) {
    auto result = normalize("(module M (def f (a b) (+ c d)))");
    EXPECT_TRUE(sink.has_code("ambiguous-parameter"));
    EXPECT_EQ(result, canonical("(module M (def f (_a _b) (+ c d)))"));
}

TEST_F(NormalizationTest, ConditionalAccumulationInAnEachBecomesAReduce) {
    EXPECT_EQ(normalize(kSamples[7]),
              canonical("(def positive (xs) (block (= sum 0)"
                        " (rcall Enum reduce xs sum (fn (-> (x sum) (if (> x 0) (+ sum x) sum))))))"));
}

TEST_F(NormalizationTest, ForAccumulationBecomesAReduce) {
    EXPECT_EQ(normalize(kSamples[8]),
              canonical("(def total (xs) (block (= sum 0) (rcall Enum reduce xs sum (fn (-> (x sum) (+ sum x))))))"));
}

TEST_F(NormalizationTest, OverwrittenValueIsUnderscored) {
    EXPECT_EQ(normalize(kSamples[9]), canonical("(def f () (block (= _x (call a)) (= x (call b)) (call g x)))"));
}

TEST_F(NormalizationTest, KeywordsInOpaqueCodeAreLeftAlone) {
    EXPECT_EQ(normalize("(def f (x) (opaque \"if x do 1 end\"))"), canonical("(def f (x) (opaque \"if x do 1 end\"))"));
    EXPECT_EQ(normalize("(def f (r) (case r (-> (tuple :ok v) (opaque \"case v do _ -> 1 end\")) (-> _ nil)))"),
              canonical("(def f (r) (case r (-> (tuple :ok v) (opaque \"case v do _ -> 1 end\")) (-> _ nil)))"));
}

TEST_F(NormalizationTest, ReadParameterKeepsItsName) {
    EXPECT_EQ(normalize("(def f (r) (case r (-> (tuple :ok x) (+ id reason))))"),
              canonical("(def f (r) (case r (-> (tuple :ok id) (+ id reason))))"));
}
