// --- 文件路径: include/ExprSimp/AST/Expression.h ---

#ifndef EXPRSIMP_AST_EXPRESSION_H
#define EXPRSIMP_AST_EXPRESSION_H

#include "../../../pch.h"


namespace ExprSimp::AST {

    // 一元运算符 (目前只有阶乘)
    enum class UnaryOperator : uint8_t { Factorial };

    // n 元运算符。操作数顺序有意义, 不做交换律归一化
    enum class NaryOperator : uint8_t { Add, Multiply, Power };

    struct Expression { virtual ~Expression() = default; };
    using ExprPtr = std::shared_ptr<Expression>;

    struct Number : Expression { int64_t value; explicit Number(int64_t v) : value(v) {} };
    struct Symbol : Expression { std::string name; explicit Symbol(std::string n) : name(std::move(n)) {} };

    struct UnaryOp : Expression {
        UnaryOperator op;
        ExprPtr operand;
        UnaryOp(UnaryOperator o, ExprPtr a) : op(o), operand(std::move(a)) {}
    };

    struct NaryOp : Expression {
        NaryOperator op;
        std::vector<ExprPtr> operands;
        NaryOp(NaryOperator o, std::vector<ExprPtr> a) : op(o), operands(std::move(a)) {}
    };

    // ====================================================================
    //  节点构造
    // ====================================================================
    ExprPtr make_number(int64_t value);
    ExprPtr make_symbol(std::string name);
    ExprPtr make_unary(UnaryOperator op, ExprPtr operand);
    // 原样构造 NaryOp, 不折叠 0/1 个操作数的情况
    ExprPtr make_nary(NaryOperator op, std::vector<ExprPtr> operands);

    // 运算符的单位元: Add -> 0, Multiply/Power -> 1
    int64_t identity_of(NaryOperator op);

    const char* operator_name(NaryOperator op);
    const char* operator_name(UnaryOperator op);

    /**
     * @brief 逐个追加操作数来构造 n 元节点
     *
     * build() 的约定:
     *   - 两个及以上操作数 -> NaryOp
     *   - 恰好一个操作数   -> 该操作数本身
     *   - 没有操作数       -> 运算符的单位元常量
     */
    class NaryBuilder {
    public:
        explicit NaryBuilder(NaryOperator op) : op_(op) {}
        NaryBuilder(NaryOperator op, std::vector<ExprPtr> operands) : op_(op), operands_(std::move(operands)) {}

        NaryBuilder& with(ExprPtr operand);
        NaryBuilder& with(int64_t value);
        NaryBuilder& with(int value) { return with(static_cast<int64_t>(value)); }
        NaryBuilder& with(const char* name);

        size_t size() const { return operands_.size(); }
        bool empty() const { return operands_.empty(); }
        void clear() { operands_.clear(); }

        ExprPtr build() const;

    private:
        NaryOperator op_;
        std::vector<ExprPtr> operands_;
    };

    // 结构相等: 同类节点、同运算符、同值/同名, 子节点按顺序逐一相等。
    // a*b 与 b*a 不相等。
    bool structural_equal(const ExprPtr& lhs, const ExprPtr& rhs);

    // 中缀文本, 用于日志与命令行输出
    std::string to_string(const ExprPtr& expr);
    std::ostream& operator<<(std::ostream& os, const ExprPtr& expr);

} // namespace ExprSimp::AST

#endif // EXPRSIMP_AST_EXPRESSION_H
