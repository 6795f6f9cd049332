// --- 文件路径: include/ExprSimp/symbolic/Simplifier.h ---

#ifndef EXPRSIMP_SIMPLIFIER_H
#define EXPRSIMP_SIMPLIFIER_H

#include "../../../pch.h"
#include "../AST/Expression.h"


namespace ExprSimp::Simplifier {

    using AST::ExprPtr;

    // 递归深度上限, 达到即中止整个化简
    constexpr size_t kMaxRecursionDepth = 32;

    // 深度超限。属于内部错误, 调用方不应在化简中途恢复
    struct RecursionLimitError : std::runtime_error {
        explicit RecursionLimitError(size_t depth)
            : std::runtime_error("recursion depth exceeded (depth " + std::to_string(depth) + ")"), depth(depth) {}
        size_t depth;
    };

    // ====================================================================
    //  公共入口: 自底向上扫一遍, 深度从 0 开始
    //  输入树不会被修改, 返回新树
    // ====================================================================
    ExprPtr simplify(const ExprPtr& ast);

    // 单个节点上的完整流程:
    // recurse -> de_paren -> combine_terms -> fold_unary_constants -> fold_nary_constants
    ExprPtr run_once(ExprPtr ast, size_t depth);

    // ====================================================================
    //  各个改写步骤 (只作用于传入的节点本身)
    // ====================================================================

    // 对 NaryOp 的每个子节点执行 run_once(depth + 1)。不进入 UnaryOp
    ExprPtr recurse(ExprPtr ast, size_t depth);

    // 去掉多余括号: (a+b)+c -> a+b+c, 只展开一层
    ExprPtr de_paren(ExprPtr ast, size_t depth);

    /**
     * @brief 合并同类项: x + x*2 -> 3*x
     *
     * 只处理 Add 节点。注意: 一个 Multiply 项如果找不到能与之合并的其他项,
     * 会从结果中消失。Power/Add 这类运算符项连自己都匹配不上, 同样消失;
     * 只有叶子和 UnaryOp 项总会保留。这是现有行为, 有测试锁定。
     */
    ExprPtr combine_terms(ExprPtr ast, size_t depth);

    /**
     * @brief 从一项中提取给定因子的系数
     * @return 系数; 该项中不含这个因子时返回 nullptr
     *
     * NaryOp (任意运算符) -> 去掉第一个相等的子节点, 剩余子节点仍用原运算符组合;
     *                        没有相等的子节点 -> nullptr (即使整个节点与因子相等)
     * 其他节点与因子相等 -> 1;
     * 其他情况 -> nullptr
     */
    ExprPtr term_factor_coeff(const ExprPtr& term, const ExprPtr& looking_for);

    // 4! -> 24, 只处理 0..10 的整数常量
    ExprPtr fold_unary_constants(ExprPtr ast, size_t depth);

    // 1+a+2+3 -> a+6。Power 的折叠顺序为 acc = v ^ acc
    ExprPtr fold_nary_constants(ExprPtr ast, size_t depth);

    // 跟踪日志开关 (默认关闭)
    void set_trace_enabled(bool enabled);
    bool trace_enabled();

} // namespace ExprSimp::Simplifier

#endif // EXPRSIMP_SIMPLIFIER_H
