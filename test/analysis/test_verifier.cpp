#include "test/test_helpers/common.hpp"
#include "src/analysis/verifier.hpp"

using namespace test::helpers;
using Kind = analysis::VerifyIssue::Kind;

namespace {

std::vector<std::string> names_of(const std::vector<analysis::VerifyIssue>& issues, Kind kind) {
    std::vector<std::string> names;
    for (const auto& issue : issues) {
        if (issue.kind == kind) {
            names.push_back(issue.name);
        }
    }
    return names;
}

} // namespace

TEST(VerifierTest, CleanTreeHasNoIssues) {
    auto tree = parse("(module M (def f (x) (block (= y (+ x 1)) (case y (-> (tuple :ok v) v) (-> _ nil)))))");
    EXPECT_TRUE(analysis::verify(tree).empty());
}

TEST(VerifierTest, ReportsUnboundReadsWithTheirFunction) {
    auto issues = analysis::verify(parse("(module M (def f (x) (+ x y)))"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, Kind::UnboundReference);
    EXPECT_EQ(issues[0].name, "y");
    EXPECT_EQ(issues[0].function, "f");
}

TEST(VerifierTest, ClauseBindersDoNotLeak) {
    auto issues = analysis::verify(parse("(def f (r) (block (case r (-> (tuple :ok v) v)) v))"));
    EXPECT_EQ(names_of(issues, Kind::UnboundReference), (std::vector<std::string>{"v"}));
}

TEST(VerifierTest, PinsAndInterpolationAreReads) {
    auto issues = analysis::verify(parse("(def f (r) (case r (-> (^ expected) \"got #{actual}\")))"));
    EXPECT_EQ(names_of(issues, Kind::UnboundReference), (std::vector<std::string>{"expected", "actual"}));
}

TEST(VerifierTest, ReportsNonTerminalLiterals) {
    auto issues = analysis::verify(parse("(def f () (block 1 :done (call g) nil))"));
    EXPECT_EQ(names_of(issues, Kind::UnusedLiteral), (std::vector<std::string>{"1", ":done"}));
}
