#include "test/test_helpers/common.hpp"
#include "src/analysis/harmonizer.hpp"

using namespace test::helpers;
using analysis::HarmonizeAction;
using analysis::HarmonizePolicy;

namespace {

analysis::BindingSite site(std::initializer_list<std::string_view> patterns, std::string_view body) {
    analysis::BindingSite result;
    for (auto text : patterns) {
        result.patterns.push_back(parse_pattern(text));
    }
    result.body = parse(body);
    return result;
}

std::string pattern_text(const analysis::HarmonizeResult& result, size_t i = 0) {
    return ir::to_string(result.site.patterns.at(i));
}

} // namespace

TEST(HarmonizerTest, NothingUndefinedLeavesSiteAlone) {
    auto result = analysis::harmonize(site({"(tuple :ok v)"}, "(+ v 1)"), {}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
    EXPECT_TRUE(result.undefined.empty());
}

TEST(HarmonizerTest, UnreadBinderTakesTheUndefinedName) {
    auto input = site({"(tuple :ok v)"}, "(call handle value)");
    auto result = analysis::harmonize(input, {}, {});
    ASSERT_EQ(result.action, HarmonizeAction::Renamed);
    EXPECT_EQ(result.from, "v");
    EXPECT_EQ(result.to, "value");
    EXPECT_EQ(pattern_text(result), "(tuple :ok value)");
    EXPECT_EQ(result.site.body, input.body);
}

TEST(HarmonizerTest, EnclosingNamesAreNotUndefined) {
    auto result = analysis::harmonize(site({"v"}, "(+ total 1)"), {"total"}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
}

TEST(HarmonizerTest, UnderscoredBinderMatchingTheNameWins) {
    auto result = analysis::harmonize(site({"a", "_item"}, "(call show item)"), {}, {});
    ASSERT_EQ(result.action, HarmonizeAction::Renamed);
    EXPECT_EQ(result.from, "_item");
    EXPECT_EQ(pattern_text(result, 1), "item");
    EXPECT_EQ(pattern_text(result, 0), "a");
}

TEST(HarmonizerTest, ReadOnlyBinderIsNeverMergedWithTheUndefinedName) {
    auto input = site({"x"}, "(+ x y)");
    auto result = analysis::harmonize(input, {}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
    EXPECT_EQ(result.undefined, (std::vector<std::string>{"y"}));
    EXPECT_EQ(result.site.patterns.front(), input.patterns.front());
    EXPECT_EQ(result.site.body, input.body);
}

TEST(HarmonizerTest, TargetKeywordIsNeverARenameTarget) {
    auto result = analysis::harmonize(site({"(tuple :ok v)"}, "(call use case)"), {}, {});
    EXPECT_EQ(result.undefined, (std::vector<std::string>{"case"}));
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
}

TEST(HarmonizerTest, KeywordsInOpaqueTextAreNotReads) {
    auto result = analysis::harmonize(site({"(tuple :ok v)"}, R"((opaque "case v do _ -> 1 end"))"), {}, {});
    EXPECT_TRUE(result.undefined.empty());
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
}

TEST(HarmonizerTest, UnderscoredPayloadRenamesOnlyOnAUniqueUndefinedName) {
    struct Case {
        std::string_view body;
        HarmonizeAction action;
    };
    const Case cases[] = {
        {"(call use 1)", HarmonizeAction::Unchanged},
        {"(call use value)", HarmonizeAction::Renamed},
        {"(call use value other)", HarmonizeAction::Ambiguous},
        {"(call use value other third)", HarmonizeAction::Ambiguous},
    };
    for (const auto& c : cases) {
        SCOPED_TRACE(c.body);
        auto input = site({"(tuple :ok _value)"}, c.body);
        auto result = analysis::harmonize(input, {}, {});
        EXPECT_EQ(result.action, c.action);
        if (c.action == HarmonizeAction::Renamed) {
            EXPECT_EQ(pattern_text(result), "(tuple :ok value)");
        } else {
            EXPECT_EQ(result.site.patterns.front(), input.patterns.front());
        }
    }
}

TEST(HarmonizerTest, SeveralUndefinedWithoutTieBreakIsAmbiguous) {
    auto result = analysis::harmonize(site({"x"}, "(+ a b)"), {}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Ambiguous);
    EXPECT_EQ(result.undefined, (std::vector<std::string>{"a", "b"}));
}

TEST(HarmonizerTest, TieBreakListPicksTheTarget) {
    HarmonizePolicy policy;
    policy.allow_tie_break = true;
    policy.tie_break_names = {"acc", "state"};
    auto result = analysis::harmonize(site({"x"}, "(call put state acc)"), {}, policy);
    ASSERT_EQ(result.action, HarmonizeAction::Renamed);
    EXPECT_EQ(result.to, "acc");
}

TEST(HarmonizerTest, TieBreakWithoutListedNameIsAmbiguous) {
    HarmonizePolicy policy;
    policy.allow_tie_break = true;
    policy.tie_break_names = {"acc"};
    auto result = analysis::harmonize(site({"x"}, "(call put left right)"), {}, policy);
    EXPECT_EQ(result.action, HarmonizeAction::Ambiguous);
}

TEST(HarmonizerTest, SeveralUnreadBindersAreAmbiguous) {
    auto result = analysis::harmonize(site({"(tuple a b)"}, "(call use c)"), {}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Ambiguous);
}

TEST(HarmonizerTest, CandidatesRestrictTheRenamedBinder) {
    HarmonizePolicy policy;
    policy.candidates = std::vector<std::string>{"b"};
    auto result = analysis::harmonize(site({"(tuple a b)"}, "(call use c)"), {}, policy);
    ASSERT_EQ(result.action, HarmonizeAction::Renamed);
    EXPECT_EQ(pattern_text(result), "(tuple a c)");
}

TEST(HarmonizerTest, ReadBindersAmongSeveralAreKept) {
    auto result = analysis::harmonize(site({"(tuple a b)"}, "(+ a (+ b c))"), {}, {});
    EXPECT_EQ(result.action, HarmonizeAction::Unchanged);
}

TEST(HarmonizerTest, ShapeConflictBlocksTheRename) {
    HarmonizePolicy policy;
    policy.candidates = std::vector<std::string>{"row"};
    auto input = site({"(as (map (:id i)) row)"}, "(+ total 1)");
    auto result = analysis::harmonize(input, {}, policy);
    EXPECT_EQ(result.action, HarmonizeAction::ShapeMismatch);
    EXPECT_EQ(analysis::to_string(result.action), "shape-mismatch");
    EXPECT_EQ(result.site.patterns.front(), input.patterns.front());
}

TEST(HarmonizerTest, GuardReadsCount) {
    auto input = site({"(tuple :ok v)"}, "(call handle other)");
    input.guard = parse("(> limit 0)");
    auto result = analysis::harmonize(input, {}, {});
    EXPECT_EQ(result.undefined, (std::vector<std::string>{"limit", "other"}));
    EXPECT_EQ(result.action, HarmonizeAction::Ambiguous);
}
