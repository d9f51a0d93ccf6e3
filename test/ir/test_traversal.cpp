#include "test/test_helpers/common.hpp"
#include "src/ir/traversal.hpp"

using namespace test::helpers;

TEST(TraversalTest, MapChildrenKeepsIdentityWhenNothingChanges) {
    auto node = parse("(if c (call f x) (block (= y 1) y))");
    auto same = ir::map_children(node, [](const ir::NodePtr& child) { return child; });
    EXPECT_EQ(same, node);
}

TEST(TraversalTest, MapChildrenSharesUntouchedSubtrees) {
    auto node = parse("(tuple a (call f b))");
    auto renamed = ir::map_children(node, [](const ir::NodePtr& child) -> ir::NodePtr {
        if (ir::helper::var_name(child)) {
            return ir::helper::var("z");
        }
        return child;
    });
    ASSERT_NE(renamed, node);
    EXPECT_EQ(print(renamed), "(tuple z (call f b))");
    EXPECT_EQ(renamed->as<ir::Tuple>()->elements[1], node->as<ir::Tuple>()->elements[1]);
}

TEST(TraversalTest, MapChildrenPassesAbsentChildrenThrough) {
    auto node = parse("(if c a)");
    size_t visits = 0;
    auto result = ir::map_children(node, [&](const ir::NodePtr& child) {
        ++visits;
        return child;
    });
    EXPECT_EQ(result, node);
    EXPECT_EQ(visits, 2u);
}

TEST(TraversalTest, BottomUpSeesRebuiltChildren) {
    auto node = parse("(+ (+ 1 2) 3)");
    auto folded = ir::transform_bottom_up(node, [](const ir::NodePtr& current) -> ir::NodePtr {
        auto* op = current->as<ir::BinaryOp>();
        if (!op) {
            return current;
        }
        auto* lhs = op->lhs->as<ir::Literal>();
        auto* rhs = op->rhs->as<ir::Literal>();
        if (!lhs || !rhs) {
            return current;
        }
        return ir::helper::integer(std::get<int64_t>(lhs->value) + std::get<int64_t>(rhs->value));
    });
    EXPECT_EQ(print(folded), "6");
}

TEST(TraversalTest, MapPatternsVisitsClauseAndParameterPatterns) {
    auto node = parse("(def f (a b) a)");
    size_t visits = 0;
    ir::for_each_pattern(*node, [&](const ir::PatternPtr&) { ++visits; });
    EXPECT_EQ(visits, 2u);

    auto renamed = ir::map_patterns(parse("(case x (-> a 1) (-> b 2))"), [](const ir::PatternPtr&) {
        return ir::helper::bind("_");
    });
    EXPECT_EQ(print(renamed), "(case x (-> _ 1) (-> _ 2))");
}

TEST(TraversalTest, StatementListsCollapseWhenOneStatementIsLeft) {
    auto node = parse("(def f () (block 1 x))");
    auto result = ir::transform_statement_lists(node, [](std::vector<ir::NodePtr> stmts) {
        stmts.erase(stmts.begin());
        return stmts;
    });
    EXPECT_EQ(print(result), "(def f () x)");
}

TEST(TraversalTest, StatementListsIncludeModuleBodies) {
    auto node = parse("(module M (def a () 1) (def b () 2))");
    auto result = ir::transform_statement_lists(node, [](std::vector<ir::NodePtr> stmts) {
        stmts.pop_back();
        return stmts;
    });
    EXPECT_EQ(print(result), "(module M (def a () 1))");
}
