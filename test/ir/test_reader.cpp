#include "test/test_helpers/common.hpp"
#include "src/span/dump_registry.hpp"
#include "src/utils/error.hpp"

using namespace test::helpers;

TEST(ReaderTest, ReadsFunctionDefinition) {
    auto node = parse("(def add (a b) (+ a b))");
    auto* def = node->as<ir::Def>();
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->name, "add");
    EXPECT_FALSE(def->is_private);
    ASSERT_EQ(def->params.size(), 2u);
    EXPECT_EQ(ir::helper::binder_name(def->params[1]).value(), "b");
    auto* sum = def->body->as<ir::BinaryOp>();
    ASSERT_NE(sum, nullptr);
    EXPECT_EQ(sum->op, ir::BinaryOperator::Add);
}

TEST(ReaderTest, SeveralBodyFormsBecomeBlock) {
    auto node = parse("(defp f (x) (= y x) y)");
    const auto& def = ir::helper::get_def(node);
    EXPECT_TRUE(def.is_private);
    auto* block = def.body->as<ir::Block>();
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->stmts.size(), 2u);
}

TEST(ReaderTest, ReadsGuards) {
    auto node = parse("(def f (x) (when (> x 0)) x)");
    const auto& def = ir::helper::get_def(node);
    ASSERT_NE(def.guard, nullptr);
    EXPECT_TRUE(def.guard->is<ir::BinaryOp>());
    EXPECT_TRUE(def.body->is<ir::Var>());
}

TEST(ReaderTest, ReadsMetadataMarkers) {
    auto node = parse("(return (mutates (sentinel x)))");
    ASSERT_TRUE(node->is<ir::Var>());
    EXPECT_TRUE(node->meta.early_return);
    EXPECT_TRUE(node->meta.carries_mutation);
    EXPECT_TRUE(node->meta.sentinel);
}

TEST(ReaderTest, ReadsLiterals) {
    auto node = parse(R"((list 1 2.5 "a\"b\n" :ok :"two words" true false nil))");
    const auto& elements = node->as<ir::List>()->elements;
    ASSERT_EQ(elements.size(), 8u);
    EXPECT_EQ(std::get<int64_t>(elements[0]->as<ir::Literal>()->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(elements[1]->as<ir::Literal>()->value), 2.5);
    EXPECT_EQ(*ir::helper::string_value(elements[2]), "a\"b\n");
    EXPECT_EQ(std::get<ir::Literal::Atom>(elements[3]->as<ir::Literal>()->value).name, "ok");
    EXPECT_EQ(std::get<ir::Literal::Atom>(elements[4]->as<ir::Literal>()->value).name, "two words");
    EXPECT_TRUE(ir::helper::is_bool_literal(elements[5], true));
    EXPECT_TRUE(ir::helper::is_bool_literal(elements[6], false));
    EXPECT_TRUE(ir::helper::is_nil(elements[7]));
}

TEST(ReaderTest, ReadsPatterns) {
    auto pattern = parse_pattern("(tuple :ok (as (map (:id id)) m) (^ pinned) (cons h t) _)");
    auto* tuple = pattern->as<ir::TuplePattern>();
    ASSERT_NE(tuple, nullptr);
    ASSERT_EQ(tuple->elements.size(), 5u);
    EXPECT_TRUE(tuple->elements[0]->is<ir::LiteralPattern>());
    auto* alias = tuple->elements[1]->as<ir::AliasPattern>();
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(alias->name, "m");
    EXPECT_TRUE(alias->pattern->is<ir::MapPattern>());
    EXPECT_EQ(tuple->elements[2]->as<ir::PinPattern>()->name, "pinned");
    EXPECT_TRUE(tuple->elements[3]->is<ir::ConsPattern>());
    EXPECT_EQ(ir::helper::binder_name(tuple->elements[4]).value(), "_");
}

TEST(ReaderTest, ReadsControlForms) {
    auto node = parse(R"((block
        (with (<- (tuple :ok a) (call fetch)) (do a) (else (-> err err)))
        (try (call risky) (rescue (-> e (call log e))) (after (call cleanup)))
        (receive (-> (tuple :msg m) m) (after 100 :timeout))
        (for (<- x xs) (filter (> x 1)) (* x 2))))");
    const auto& stmts = node->as<ir::Block>()->stmts;
    ASSERT_EQ(stmts.size(), 4u);

    auto* with = stmts[0]->as<ir::With>();
    ASSERT_NE(with, nullptr);
    EXPECT_EQ(with->clauses.size(), 1u);
    EXPECT_EQ(with->else_clauses.size(), 1u);

    auto* attempt = stmts[1]->as<ir::Try>();
    ASSERT_NE(attempt, nullptr);
    EXPECT_EQ(attempt->rescue_clauses.size(), 1u);
    EXPECT_NE(attempt->after, nullptr);

    auto* receive = stmts[2]->as<ir::Receive>();
    ASSERT_NE(receive, nullptr);
    EXPECT_EQ(receive->clauses.size(), 1u);
    EXPECT_NE(receive->timeout, nullptr);

    auto* comprehension = stmts[3]->as<ir::For>();
    ASSERT_NE(comprehension, nullptr);
    EXPECT_EQ(comprehension->filters.size(), 1u);
}

TEST(ReaderTest, ReadUnitWrapsSeveralForms) {
    auto unit = ir::reader::read_unit("(= x 1) (call print x)");
    auto* block = unit->as<ir::Block>();
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->stmts.size(), 2u);

    auto single = ir::reader::read_unit("; comment only before\n(call print 1)");
    EXPECT_TRUE(single->is<ir::Call>());
}

TEST(ReaderTest, RejectsMalformedInput) {
    EXPECT_THROW(parse("(if)"), ReaderError);
    EXPECT_THROW(parse("(def f)"), ReaderError);
    EXPECT_THROW(parse("(block (= x 1)"), ReaderError);
    EXPECT_THROW(parse("(frobnicate 1)"), ReaderError);
    EXPECT_THROW(parse(R"("\q")"), ReaderError);
    EXPECT_THROW(parse("(for x)"), ReaderError);
    EXPECT_THROW(parse("1 2"), ReaderError);
}

TEST(ReaderTest, ErrorsPointIntoTheSource) {
    span::DumpRegistry dumps;
    auto dump = dumps.add("input.ir", "(block\n  (frobnicate 1))");
    try {
        ir::reader::read_node(dumps.text(dump), dump);
        FAIL() << "expected a ReaderError";
    } catch (const ReaderError& error) {
        ASSERT_TRUE(error.span().is_valid());
        EXPECT_EQ(error.span().dump, dump);
        auto loc = dumps.locate(dump, error.span().start);
        EXPECT_EQ(loc.line, 2u);
        EXPECT_EQ(dumps.describe(error.span()).substr(0, 11), "input.ir:2:");
        EXPECT_NE(dumps.excerpt(error.span()).find("^"), std::string::npos);
    }
}

TEST(ReaderTest, RepeatedDumpNamesAreKeptApart) {
    span::DumpRegistry dumps;
    auto first = dumps.add("unit.ir", "(call f)");
    auto second = dumps.add("unit.ir", "(call g)");
    EXPECT_NE(dumps.name(first), dumps.name(second));
    EXPECT_EQ(dumps.text(second), "(call g)");
    EXPECT_FALSE(dumps.contains(span::Span::invalid()));
}
