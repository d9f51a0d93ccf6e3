#include "test/test_helpers/common.hpp"

#include <sstream>

using namespace test::helpers;

TEST(PrettyPrintTest, CompactFormRoundTrips) {
    const char* forms[] = {
        "(def f (x) (block (= y (+ x 1)) y))",
        "(defp g (a) (when (> a 0)) (rcall Enum map a (fn (-> (v) (* v 2)))))",
        "(case r (-> (tuple :ok v) v) (-> (tuple :error _) nil))",
        "(if (not ready) (call wait) :done)",
        "(module Shop (def total (cart) (|> cart (rcall Enum sum))))",
        "(= (as (map (:id id)) row) (index rows 0))",
        "(struct User (name \"x\") (age 3))",
        "(update user (name n))",
        "(with (<- (tuple :ok a) (call fetch)) (do a) (else (-> e e)))",
        "(for (<- x xs) (filter (> x 1)) (* x 2))",
        "(opaque \"@attr value\")",
        "(receive (-> m m) (after 10 :timeout))",
    };
    for (const char* form : forms) {
        EXPECT_EQ(print(parse(form)), form);
    }
}

TEST(PrettyPrintTest, PrintsMetadataAsWrappers) {
    auto node = parse("(return (mutates (call put m :k 1)))");
    EXPECT_EQ(print(node), "(return (mutates (call put m :k 1)))");

    auto cleared = ir::helper::with_meta(node, ir::Metadata{});
    EXPECT_EQ(print(cleared), "(call put m :k 1)");
}

TEST(PrettyPrintTest, EscapesStringsAndAtoms) {
    auto node = ir::helper::tuple({ir::helper::string_lit("say \"hi\"\n"), ir::helper::atom("two words")});
    EXPECT_EQ(print(node), R"((tuple "say \"hi\"\n" :"two words"))");
}

TEST(PrettyPrintTest, FloatsKeepADecimalPoint) {
    auto node = ir::helper::make_node(ir::Literal{2.0});
    EXPECT_EQ(print(node), "2.0");
    EXPECT_EQ(print(parse("1.25")), "1.25");
}

TEST(PrettyPrintTest, IndentedLayout) {
    std::ostringstream out;
    ir::PrettyPrinter printer(out);
    printer.print(parse("(def f (x) (block (= y 1) y))"));
    EXPECT_EQ(out.str(), "(def f (x)\n  (block\n    (= y 1)\n    y))");
}

TEST(PrettyPrintTest, IndentedOutputReadsBack) {
    auto node = parse("(module M (def f (x) (case x (-> true (block (= y 1) y)) (-> _ 0))))");
    auto indented = ir::to_string(node, false);
    EXPECT_NE(indented.find('\n'), std::string::npos);
    EXPECT_EQ(print(parse(indented)), print(node));
}

TEST(PrettyPrintTest, PrintsPatterns) {
    EXPECT_EQ(ir::to_string(parse_pattern("(tuple (^ x) (cons h t) (binary (seg b \"integer-size(8)\")))")),
              "(tuple (^ x) (cons h t) (binary (seg b \"integer-size(8)\")))");
}

TEST(PrettyPrintTest, PrintsItemLists) {
    std::vector<ir::NodePtr> items{parse("(= x 1)"), parse("x")};
    EXPECT_EQ(ir::to_string(items, true), "(= x 1) x");
    EXPECT_EQ(ir::to_string(items, false), "(= x 1)\nx");
}
