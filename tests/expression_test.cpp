#include <gtest/gtest.h>

#include "../include/ExprSimp/AST/Expression.h"
#include "test_helpers.h"

using namespace ExprSimp::AST;
using namespace ExprSimp::Testing;

TEST(StructuralEqualTest, EqualShapesCompareEqual) {
    auto lhs = Add().with("x").with(Mul().with(2).with("y").build()).build();
    auto rhs = Add().with("x").with(Mul().with(2).with("y").build()).build();
    EXPECT_TRUE(structural_equal(lhs, rhs));
    EXPECT_TRUE(structural_equal(Fac(Num(3)), Fac(Num(3))));
}

TEST(StructuralEqualTest, OperandOrderMatters) {
    auto ab = Mul().with("a").with("b").build();
    auto ba = Mul().with("b").with("a").build();
    EXPECT_FALSE(structural_equal(ab, ba));
}

TEST(StructuralEqualTest, DistinguishesKindsAndTags) {
    EXPECT_FALSE(structural_equal(Num(1), Var("1")));
    EXPECT_FALSE(structural_equal(Var("x"), Var("xx")));
    EXPECT_FALSE(structural_equal(Num(2), Num(3)));
    EXPECT_FALSE(structural_equal(Add().with("a").with("b").build(), Mul().with("a").with("b").build()));
    EXPECT_FALSE(structural_equal(Add().with("a").with("b").build(), Add().with("a").with("b").with("c").build()));
    EXPECT_FALSE(structural_equal(Fac(Var("x")), Var("x")));
}

TEST(StructuralEqualTest, NullOnlyEqualsNull) {
    EXPECT_TRUE(structural_equal(nullptr, nullptr));
    EXPECT_FALSE(structural_equal(Var("x"), nullptr));
    EXPECT_FALSE(structural_equal(nullptr, Num(0)));
}

TEST(NaryBuilderTest, EmptyBuildsIdentity) {
    EXPECT_TRUE(AstEq(Add().build(), Num(0)));
    EXPECT_TRUE(AstEq(Mul().build(), Num(1)));
    EXPECT_TRUE(AstEq(Pow().build(), Num(1)));
}

TEST(NaryBuilderTest, SingleOperandIsReturnedAsIs) {
    auto x = Var("x");
    EXPECT_EQ(Mul().with(x).build(), x);
}

TEST(NaryBuilderTest, TwoOrMoreOperandsBuildNode) {
    auto node = std::dynamic_pointer_cast<NaryOp>(Mul().with("x").with(4).build());
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->op, NaryOperator::Multiply);
    ASSERT_EQ(node->operands.size(), 2u);
    EXPECT_TRUE(AstEq(node->operands[0], Var("x")));
    EXPECT_TRUE(AstEq(node->operands[1], Num(4)));
}

TEST(NaryBuilderTest, MakeNaryKeepsDegenerateShapes) {
    auto empty = std::dynamic_pointer_cast<NaryOp>(make_nary(NaryOperator::Add, {}));
    ASSERT_NE(empty, nullptr);
    EXPECT_TRUE(empty->operands.empty());
}

TEST(PrinterTest, RendersInfixWithMinimalParentheses) {
    EXPECT_EQ(to_string(Add().with("x").with(Mul().with(2).with("y").build()).build()), "x + 2 * y");
    EXPECT_EQ(to_string(Mul().with(Add().with("x").with(1).build()).with("y").build()), "(x + 1) * y");
    EXPECT_EQ(to_string(Pow().with("x").with(Pow().with("y").with(2).build()).build()), "x ^ (y ^ 2)");
    EXPECT_EQ(to_string(Pow().with(Fac(Var("x"))).with(2).build()), "x! ^ 2");
}

TEST(PrinterTest, RendersFactorial) {
    EXPECT_EQ(to_string(Fac(Num(5))), "5!");
    EXPECT_EQ(to_string(Fac(Add().with("x").with(1).build())), "(x + 1)!");
    EXPECT_EQ(to_string(Fac(Num(-3))), "(-3)!");
}

TEST(PrinterTest, RendersNegativeNumbers) {
    EXPECT_EQ(to_string(Num(-3)), "-3");
    EXPECT_EQ(to_string(Add().with("x").with(-3).build()), "x + (-3)");
}

TEST(PrinterTest, RendersEmptyNodeAsIdentity) {
    EXPECT_EQ(to_string(make_nary(NaryOperator::Multiply, {})), "1");
    EXPECT_EQ(to_string(make_nary(NaryOperator::Add, {})), "0");
}

TEST(PrinterTest, StreamOperatorMatchesToString) {
    auto ast = Add().with("a").with(Fac(Var("b"))).build();
    std::ostringstream ss;
    ss << ast;
    EXPECT_EQ(ss.str(), to_string(ast));
}
