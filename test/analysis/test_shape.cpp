#include "test/test_helpers/common.hpp"
#include "src/analysis/shape.hpp"

using namespace test::helpers;
using analysis::Shape;

TEST(ShapeTest, FieldIndexAndUpdateReceiversAreStructured) {
    EXPECT_EQ(analysis::classify_usage(parse("(field user name)"), "user"), Shape::Structured);
    EXPECT_EQ(analysis::classify_usage(parse("(index rows 0)"), "rows"), Shape::Structured);
    EXPECT_EQ(analysis::classify_usage(parse("(update state (count 1))"), "state"), Shape::Structured);
    EXPECT_EQ(analysis::classify_usage(parse("(= (map (:id id)) row)"), "row"), Shape::Structured);
}

TEST(ShapeTest, OperatorOperandsAreScalar) {
    EXPECT_EQ(analysis::classify_usage(parse("(+ n 1)"), "n"), Shape::Scalar);
    EXPECT_EQ(analysis::classify_usage(parse("(< 0 n)"), "n"), Shape::Scalar);
    EXPECT_EQ(analysis::classify_usage(parse("(<> prefix \"!\")"), "prefix"), Shape::Scalar);
}

TEST(ShapeTest, ConflictingOrMissingEvidenceIsUnknown) {
    EXPECT_EQ(analysis::classify_usage(parse("(tuple (+ x 1) (field x y))"), "x"), Shape::Unknown);
    EXPECT_EQ(analysis::classify_usage(parse("(call f x)"), "x"), Shape::Unknown);
    EXPECT_EQ(analysis::classify_usage(parse("(+ y 1)"), "x"), Shape::Unknown);
}

TEST(ShapeTest, EvidenceIsGatheredFromNestedNodes) {
    EXPECT_EQ(analysis::classify_usage(parse("(block (call log 1) (if c (field cfg port)))"), "cfg"),
              Shape::Structured);
}

TEST(ShapeTest, PatternShapes) {
    EXPECT_EQ(analysis::classify_pattern(parse_pattern("(as (map (:id id)) row)"), "row"), Shape::Structured);
    EXPECT_EQ(analysis::classify_pattern(parse_pattern("(binary (seg n \"integer-size(8)\"))"), "n"),
              Shape::Scalar);
    EXPECT_EQ(analysis::classify_pattern(parse_pattern("(tuple :ok v)"), "v"), Shape::Unknown);
    EXPECT_EQ(analysis::classify_pattern(parse_pattern("(as v alias)"), "alias"), Shape::Unknown);
}

TEST(ShapeTest, OnlyKnownShapesConflict) {
    EXPECT_TRUE(analysis::shapes_conflict(Shape::Scalar, Shape::Structured));
    EXPECT_FALSE(analysis::shapes_conflict(Shape::Unknown, Shape::Structured));
    EXPECT_FALSE(analysis::shapes_conflict(Shape::Scalar, Shape::Scalar));
    EXPECT_EQ(analysis::to_string(Shape::Structured), "structured");
}
