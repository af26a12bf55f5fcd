/**
 * @file test_expression.cpp
 * @brief Tests for the constant expression evaluator
 */

#include <gtest/gtest.h>
#include "autodeploy/Expression.hpp"

using namespace autodeploy;

// ============================================================================
// Literals
// ============================================================================

TEST(IntLiteralTest, Bases) {
    EXPECT_EQ(parse_int_literal("42"), 42);
    EXPECT_EQ(parse_int_literal("0x1F"), 31);
    EXPECT_EQ(parse_int_literal("0b101"), 5);
    EXPECT_EQ(parse_int_literal("017"), 15);
    EXPECT_EQ(parse_int_literal("0"), 0);
    EXPECT_EQ(parse_int_literal("1'000"), 1000);
}

TEST(IntLiteralTest, RejectsSuffixesFractionsAndOverflow) {
    EXPECT_FALSE(parse_int_literal("10u"));
    EXPECT_FALSE(parse_int_literal("1.5"));
    EXPECT_FALSE(parse_int_literal("1e3"));
    EXPECT_FALSE(parse_int_literal("09"));
    EXPECT_FALSE(parse_int_literal("2147483648"));
    EXPECT_EQ(parse_int_literal("2147483647"), 2147483647);
}

// ============================================================================
// Evaluation
// ============================================================================

TEST(EvaluateTest, FollowsCPrecedence) {
    EXPECT_EQ(evaluate("2 + 3 * 4"), 14);
    EXPECT_EQ(evaluate("(2 + 3) * 4"), 20);
    EXPECT_EQ(evaluate("10 - 4 - 3"), 3);
    EXPECT_EQ(evaluate("1 << 2 + 1"), 8);
    EXPECT_EQ(evaluate("6 & 3 | 8"), 10);
    EXPECT_EQ(evaluate("5 ^ 1 & 3"), 4);
    EXPECT_EQ(evaluate("1 + 2 == 3"), 1);
    EXPECT_EQ(evaluate("1 < 2 && 3 > 4"), 0);
    EXPECT_EQ(evaluate("0 || 7 != 7 || 2 >= 2"), 1);
}

TEST(EvaluateTest, UnaryOperators) {
    EXPECT_EQ(evaluate("-5 + 2"), -3);
    EXPECT_EQ(evaluate("- -5"), 5);
    EXPECT_EQ(evaluate("~0"), -1);
    EXPECT_EQ(evaluate("!3"), 0);
    EXPECT_EQ(evaluate("+4"), 4);
}

TEST(EvaluateTest, DivisionTruncatesTowardZero) {
    EXPECT_EQ(evaluate("7 / 2"), 3);
    EXPECT_EQ(evaluate("-7 / 2"), -3);
    EXPECT_EQ(evaluate("-7 % 3"), -1);
}

TEST(EvaluateTest, UndefinedOperationsYieldNothing) {
    EXPECT_FALSE(evaluate("1 / 0"));
    EXPECT_FALSE(evaluate("5 % (2 - 2)"));
    EXPECT_FALSE(evaluate("2147483647 + 1"));
    EXPECT_FALSE(evaluate("65536 * 65536"));
    EXPECT_FALSE(evaluate("1 << 31"));
    EXPECT_FALSE(evaluate("1 << 32"));
    EXPECT_FALSE(evaluate("-1 << 2"));
    EXPECT_FALSE(evaluate("8 >> -1"));
}

TEST(EvaluateTest, MalformedInputYieldsNothing) {
    EXPECT_FALSE(evaluate(""));
    EXPECT_FALSE(evaluate("1 +"));
    EXPECT_FALSE(evaluate("(1 + 2"));
    EXPECT_FALSE(evaluate("1 2"));
    EXPECT_FALSE(evaluate("f(1)"));
    EXPECT_FALSE(evaluate("\"unterminated"));
}

TEST(EvaluateTest, IgnoresComments) {
    EXPECT_EQ(evaluate("1 /* one */ + 2 // two"), 3);
}

TEST(EvaluateTest, Bindings) {
    Bindings b{{"x", 6}, {"y", -2}};
    EXPECT_EQ(evaluate("x * y + 1", b), -11);
    EXPECT_FALSE(evaluate("x + z", b));
}

TEST(EvaluateTest, TokenRange) {
    const auto tokens = tokenize("int k = 3 * 7;");
    // tokens: int k = 3 * 7 ;
    EXPECT_EQ(evaluate_tokens(tokens, 3, 6), 21);
    EXPECT_FALSE(evaluate_tokens(tokens, 2, 6));
    EXPECT_FALSE(evaluate_tokens(tokens, 3, 3));
}
