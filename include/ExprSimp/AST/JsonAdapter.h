// --- 文件路径: include/ExprSimp/AST/JsonAdapter.h ---

#ifndef EXPRSIMP_JSON_ADAPTER_H
#define EXPRSIMP_JSON_ADAPTER_H

#include <string>
#include <memory>

namespace ExprSimp::AST {
    struct Expression;
}

namespace ExprSimp::JsonAdapter {

    // 格式: 整数 -> Number, 字符串 -> Symbol, {"num": "..."} -> Number,
    //       ["Add"|"Multiply"|"Power", ...] -> NaryOp, ["Factorial", x] -> UnaryOp
    std::shared_ptr<ExprSimp::AST::Expression> parse_json_to_ast(const std::string& json_string);

    // indent < 0 时输出紧凑的单行 JSON
    std::string ast_to_json_string(const std::shared_ptr<ExprSimp::AST::Expression>& ast, int indent = -1);

} // namespace ExprSimp::JsonAdapter

#endif // EXPRSIMP_JSON_ADAPTER_H
