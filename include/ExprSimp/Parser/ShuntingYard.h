#ifndef EXPRSIMP_PARSER_SHUNTING_YARD_H
#define EXPRSIMP_PARSER_SHUNTING_YARD_H

#include <string_view>
#include "../AST/Expression.h"

namespace ExprSimp::Parser {

    /**
     * @brief 把中缀表达式解析为表达式树
     *
     * 支持: 整数、标识符、+、*、^ (右结合)、后缀 !、括号。
     * 每个二元运算产生一个两子节点的 NaryOp, 链式的 a+b+c 交给化简器去展平。
     * 减号和除号不是一等运算符, 遇到即报错。
     *
     * @throws std::runtime_error 语法错误, 消息中带有出错位置
     */
    AST::ExprPtr parse_infix(std::string_view expression);

}

#endif
