#ifndef EXPRSIMP_TESTS_TEST_HELPERS_H
#define EXPRSIMP_TESTS_TEST_HELPERS_H

#include <gtest/gtest.h>
#include "../include/ExprSimp/AST/Expression.h"
#include "../include/ExprSimp/AST/JsonAdapter.h"

namespace ExprSimp::Testing {

    using AST::ExprPtr;
    using AST::NaryBuilder;
    using AST::NaryOperator;

    inline NaryBuilder Add() { return NaryBuilder(NaryOperator::Add); }
    inline NaryBuilder Mul() { return NaryBuilder(NaryOperator::Multiply); }
    inline NaryBuilder Pow() { return NaryBuilder(NaryOperator::Power); }

    inline ExprPtr Num(int64_t v) { return AST::make_number(v); }
    inline ExprPtr Var(const char* name) { return AST::make_symbol(name); }
    inline ExprPtr Fac(ExprPtr operand) { return AST::make_unary(AST::UnaryOperator::Factorial, std::move(operand)); }

    // 失败时用 JSON 打印两棵树, 能看出 Add(x) 与 x 这类差别
    inline ::testing::AssertionResult AstEq(const ExprPtr& lhs, const ExprPtr& rhs) {
        if (AST::structural_equal(lhs, rhs)) return ::testing::AssertionSuccess();
        return ::testing::AssertionFailure()
               << "\nleft:  " << JsonAdapter::ast_to_json_string(lhs)
               << "\nright: " << JsonAdapter::ast_to_json_string(rhs);
    }

}

#endif
