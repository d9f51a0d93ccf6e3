#include "test/test_helpers/common.hpp"
#include "src/analysis/usage_index.hpp"

#include <string>

using namespace test::helpers;
using analysis::NameSet;
using analysis::UsageIndex;

namespace {

std::vector<ir::NodePtr> statements(std::string_view text) {
    return ir::helper::statements_of(parse(text));
}

} // namespace

TEST(UsageIndexTest, AnswersUsedFrom) {
    auto index = UsageIndex::build(statements("(block (= a 1) (= b (+ a 1)) (call f b) c)"));
    ASSERT_EQ(index.size(), 4u);
    EXPECT_TRUE(index.used_from(0, "a"));
    EXPECT_TRUE(index.used_from(1, "a"));
    EXPECT_FALSE(index.used_from(2, "a"));
    EXPECT_TRUE(index.used_from(2, "b"));
    EXPECT_TRUE(index.used_from(3, "c"));
    EXPECT_FALSE(index.used_from(0, "missing"));
    EXPECT_TRUE(analysis::used_later(index, 3, "c"));
}

TEST(UsageIndexTest, ReadsOfEachStatement) {
    auto index = UsageIndex::build(statements("(block (= x (+ x y)) (case x (-> v v)))"));
    EXPECT_EQ(index.reads_of(0), (NameSet{"x", "y"}));
    EXPECT_EQ(index.reads_of(1), (NameSet{"x"}));
}

TEST(UsageIndexTest, NamesFrom) {
    auto index = UsageIndex::build(statements("(block a b (+ a c))"));
    EXPECT_EQ(index.names_from(0), (NameSet{"a", "b", "c"}));
    EXPECT_EQ(index.names_from(2), (NameSet{"a", "c"}));
    EXPECT_TRUE(index.names_from(3).empty());
}

TEST(UsageIndexTest, BuildVisitsEachNodeOnce) {
    constexpr size_t n = 5000;
    std::vector<ir::NodePtr> stmts;
    stmts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        auto name = "v" + std::to_string(i);
        auto previous = i == 0 ? ir::helper::integer(0) : ir::helper::var("v" + std::to_string(i - 1));
        stmts.push_back(ir::helper::match(ir::helper::bind(name), previous));
    }
    analysis::VisitStats stats;
    auto index = UsageIndex::build(stmts, &stats);
    // Each statement is a match and its value.
    EXPECT_EQ(stats.nodes, 2 * n);
    EXPECT_TRUE(index.used_from(n - 1, "v" + std::to_string(n - 2)));
    EXPECT_FALSE(index.used_from(n - 1, "v" + std::to_string(n - 1)));
}
