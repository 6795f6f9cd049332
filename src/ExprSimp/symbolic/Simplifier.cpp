// --- 文件路径: src/ExprSimp/symbolic/Simplifier.cpp ---

#include "../../../include/ExprSimp/symbolic/Simplifier.h"
#include "../../../pch.h"
#include <atomic>
#include <limits>
#include <optional>
#include <vector>


namespace ExprSimp::Simplifier {
    namespace { // 匿名命名空间开始

        using namespace ExprSimp::AST;

        std::atomic<bool> g_trace_enabled{false};

        void trace(const std::string& message) {
            std::cout << "[Simplifier] " << message << std::endl;
        }

        // ====================================================================
        //  带溢出检查的整数运算 (溢出时返回 nullopt, 调用方放弃折叠)
        // ====================================================================
        constexpr int64_t I64_MAX = std::numeric_limits<int64_t>::max();
        constexpr int64_t I64_MIN = std::numeric_limits<int64_t>::min();

        std::optional<int64_t> checked_add(int64_t a, int64_t b) {
            if ((b > 0 && a > I64_MAX - b) || (b < 0 && a < I64_MIN - b)) return std::nullopt;
            return a + b;
        }

        std::optional<int64_t> checked_mul(int64_t a, int64_t b) {
            if (a == 0 || b == 0) return 0;
            if (a > 0) {
                if (b > 0) { if (a > I64_MAX / b) return std::nullopt; }
                else       { if (b < I64_MIN / a) return std::nullopt; }
            } else {
                if (b > 0) { if (a < I64_MIN / b) return std::nullopt; }
                else       { if (b < I64_MAX / a) return std::nullopt; }
            }
            return a * b;
        }

        // 快速幂。负指数的结果不是整数, 不折叠
        std::optional<int64_t> checked_pow(int64_t base, int64_t exponent) {
            if (exponent < 0) return std::nullopt;
            int64_t result = 1;
            while (exponent > 0) {
                if (exponent & 1) {
                    auto r = checked_mul(result, base);
                    if (!r) return std::nullopt;
                    result = *r;
                }
                exponent >>= 1;
                if (exponent > 0) {
                    auto b = checked_mul(base, base);
                    if (!b) return std::nullopt;
                    base = *b;
                }
            }
            return result;
        }

        bool is_literal_one(const ExprPtr& expr) {
            auto num = std::dynamic_pointer_cast<Number>(expr);
            return num && num->value == 1;
        }

    } // 匿名命名空间结束

    void set_trace_enabled(bool enabled) { g_trace_enabled.store(enabled, std::memory_order_relaxed); }
    bool trace_enabled() { return g_trace_enabled.load(std::memory_order_relaxed); }

    // ====================================================================
    //  递归驱动
    // ====================================================================
    ExprPtr recurse(ExprPtr ast, size_t depth) {
        if (auto nary = std::dynamic_pointer_cast<NaryOp>(ast)) {
            std::vector<ExprPtr> operands;
            operands.reserve(nary->operands.size());
            for (const auto& operand : nary->operands) {
                operands.push_back(run_once(operand, depth + 1));
            }
            return make_nary(nary->op, std::move(operands));
        }
        return ast;
    }

    ExprPtr de_paren(ExprPtr ast, size_t) {
        auto nary = std::dynamic_pointer_cast<NaryOp>(ast);
        if (!nary) return ast;

        std::vector<ExprPtr> operands;
        operands.reserve(nary->operands.size());
        for (const auto& operand : nary->operands) {
            if (auto sub = std::dynamic_pointer_cast<NaryOp>(operand); sub && sub->op == nary->op) {
                operands.insert(operands.end(), sub->operands.begin(), sub->operands.end());
            } else {
                operands.push_back(operand);
            }
        }
        return make_nary(nary->op, std::move(operands));
    }

    // ====================================================================
    //  合并同类项
    // ====================================================================
    ExprPtr term_factor_coeff(const ExprPtr& term, const ExprPtr& looking_for) {
        if (auto nary = std::dynamic_pointer_cast<NaryOp>(term)) {
            // 只拿走第一个匹配的子节点, 其余的组成系数。
            // 运算符节点只看子节点, 与因子整体相等也不算
            NaryBuilder coeff(nary->op);
            bool found = false;
            for (const auto& operand : nary->operands) {
                if (!found && structural_equal(operand, looking_for)) {
                    found = true;
                    continue;
                }
                coeff.with(operand);
            }
            if (!found) return nullptr;
            return coeff.build();
        }
        if (structural_equal(term, looking_for)) return make_number(1);
        return nullptr;
    }

    ExprPtr combine_terms(ExprPtr ast, size_t depth) {
        auto sum = std::dynamic_pointer_cast<NaryOp>(ast);
        if (!sum || sum->op != NaryOperator::Add) return ast;

        if (trace_enabled()) trace("combine_terms: " + to_string(ast));

        const auto& terms = sum->operands;
        std::vector<ExprPtr> new_terms;
        std::vector<bool> skipped(terms.size(), false);

        for (size_t i = 0; i < terms.size(); ++i) {
            if (skipped[i]) continue;

            NaryBuilder coeff(NaryOperator::Add);
            ExprPtr factor;

            // 从第 i 项开始向后扫描, 收集 looking_for 在每一项中的系数
            auto collect = [&](const ExprPtr& looking_for) {
                for (size_t j = i; j < terms.size(); ++j) {
                    if (auto c = term_factor_coeff(terms[j], looking_for)) {
                        skipped[j] = true;
                        coeff.with(std::move(c));
                    }
                }
            };

            auto product = std::dynamic_pointer_cast<NaryOp>(terms[i]);
            if (product && product->op == NaryOperator::Multiply) {
                for (const auto& looking_for : product->operands) {
                    collect(looking_for);

                    // 只和自己匹配的因子不算数, 换下一个
                    if (coeff.size() == 1) {
                        coeff.clear();
                        skipped[i] = false;
                        continue;
                    }
                    if (!coeff.empty()) {
                        factor = looking_for;
                        break;
                    }
                }
            } else {
                collect(terms[i]);
                if (!coeff.empty()) factor = terms[i];
            }

            // 找不到搭档的乘积项在这里被丢掉
            if (!factor) continue;

            auto folded = fold_nary_constants(coeff.build(), depth);
            if (trace_enabled()) trace("coeff " + to_string(folded) + " factor " + to_string(factor));

            if (is_literal_one(folded)) {
                new_terms.push_back(factor);
            } else {
                new_terms.push_back(NaryBuilder(NaryOperator::Multiply).with(folded).with(factor).build());
            }
        }

        return make_nary(NaryOperator::Add, std::move(new_terms));
    }

    // ====================================================================
    //  常量折叠
    // ====================================================================
    ExprPtr fold_unary_constants(ExprPtr ast, size_t) {
        auto un = std::dynamic_pointer_cast<UnaryOp>(ast);
        if (!un || un->op != UnaryOperator::Factorial) return ast;

        auto num = std::dynamic_pointer_cast<Number>(un->operand);
        if (!num || num->value < 0 || num->value > 10) return ast;

        int64_t result = 1;
        for (int64_t k = 2; k <= num->value; ++k) result *= k;
        return make_number(result);
    }

    ExprPtr fold_nary_constants(ExprPtr ast, size_t) {
        auto nary = std::dynamic_pointer_cast<NaryOp>(ast);
        if (!nary) return ast;

        const int64_t init = identity_of(nary->op);
        int64_t result = init;
        std::vector<ExprPtr> operands;
        operands.reserve(nary->operands.size());

        for (const auto& operand : nary->operands) {
            auto num = std::dynamic_pointer_cast<Number>(operand);
            if (!num) {
                operands.push_back(operand);
                continue;
            }

            std::optional<int64_t> next;
            switch (nary->op) {
                case NaryOperator::Add:      next = checked_add(result, num->value); break;
                case NaryOperator::Multiply: next = checked_mul(result, num->value); break;
                // 后出现的常量做底数, 之前的结果做指数
                case NaryOperator::Power:    next = checked_pow(num->value, result); break;
            }
            if (!next) return ast;
            result = *next;
        }

        if (result != init) operands.push_back(make_number(result));
        return NaryBuilder(nary->op, std::move(operands)).build();
    }

    // ====================================================================
    //  公共入口
    // ====================================================================
    ExprPtr run_once(ExprPtr ast, size_t depth) {
        if (depth >= kMaxRecursionDepth) {
            throw RecursionLimitError(depth);
        }

        ast = recurse(std::move(ast), depth);
        ast = de_paren(std::move(ast), depth);
        ast = combine_terms(std::move(ast), depth);
        ast = fold_unary_constants(std::move(ast), depth);
        ast = fold_nary_constants(std::move(ast), depth);
        return ast;
    }

    ExprPtr simplify(const ExprPtr& ast) {
        auto result = run_once(ast, 0);
        if (trace_enabled()) trace("simplify: " + to_string(ast) + " => " + to_string(result));
        return result;
    }

} // namespace ExprSimp::Simplifier
