#include "test/test_helpers/common.hpp"
#include "src/analysis/rename.hpp"

using namespace test::helpers;

TEST(RenameTest, BinderRenameCoversAliasesButNotPins) {
    auto pattern = parse_pattern("(tuple x (^ x) (as (list x) x))");
    auto renamed = analysis::rename_binder(pattern, "x", "y");
    EXPECT_EQ(ir::to_string(renamed), "(tuple y (^ x) (as (list y) y))");
}

TEST(RenameTest, BinderRenameKeepsIdentityWhenAbsent) {
    auto pattern = parse_pattern("(tuple a b)");
    EXPECT_EQ(analysis::rename_binder(pattern, "x", "y"), pattern);
}

TEST(RenameTest, ReferencesStopAtRebinding) {
    auto node = parse("(block (call f x) (= x (+ x 1)) x)");
    EXPECT_EQ(print(analysis::rename_references(node, "x", "y")), canonical("(block (call f y) (= x (+ y 1)) x)"));
}

TEST(RenameTest, ReferencesStopAtShadowingClauses) {
    auto node = parse("(tuple x (case r (-> x x)) (fn (-> (x) x)))");
    EXPECT_EQ(print(analysis::rename_references(node, "x", "y")),
              canonical("(tuple y (case r (-> x x)) (fn (-> (x) x)))"));
}

TEST(RenameTest, ReferencesReachInterpolationOpaqueAndPins) {
    auto node = parse("(block \"value #{x}\" (opaque \"x + 1\") (case r (-> (^ x) :same)))");
    EXPECT_EQ(print(analysis::rename_references(node, "x", "y")),
              canonical("(block \"value #{y}\" (opaque \"y + 1\") (case r (-> (^ y) :same)))"));
}

TEST(RenameTest, ReferencesUnchangedReturnsSameTree) {
    auto node = parse("(call f a b)");
    EXPECT_EQ(analysis::rename_references(node, "x", "y"), node);
    EXPECT_EQ(analysis::rename_references(node, "a", "a"), node);
}

TEST(RenameTest, KeywordsInOpaqueTextAreNeverRenamed) {
    auto node = parse("(opaque \"if x do 1 end\")");
    EXPECT_EQ(analysis::rename_references(node, "if", "if_"), node);
    EXPECT_EQ(print(analysis::rename_references(node, "x", "y")), canonical("(opaque \"if y do 1 end\")"));
}
