#ifndef EXPRSIMP_BATCH_SIMPLIFY_H
#define EXPRSIMP_BATCH_SIMPLIFY_H

#include "../../../pch.h"
#include "Simplifier.h"

namespace ExprSimp::Simplifier {

    /**
     * @brief 并行化简一组互相独立的表达式树
     * @param inputs 输入树, 不会被修改
     * @return 与输入一一对应的结果, 顺序相同
     * @throws RecursionLimitError 任意一棵树超出深度上限时向上传播, 其余任务被取消
     */
    std::vector<ExprPtr> simplify_batch(const std::vector<ExprPtr>& inputs);

}

#endif
