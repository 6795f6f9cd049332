// --- 文件路径: src/ExprSimp/AST/Expression.cpp ---

#include "../../../include/ExprSimp/AST/Expression.h"
#include "../../../pch.h"
#include <sstream>
#include <string>
#include <vector>


namespace ExprSimp::AST {

    ExprPtr make_number(int64_t value) { return std::make_shared<Number>(value); }
    ExprPtr make_symbol(std::string name) { return std::make_shared<Symbol>(std::move(name)); }
    ExprPtr make_unary(UnaryOperator op, ExprPtr operand) { return std::make_shared<UnaryOp>(op, std::move(operand)); }
    ExprPtr make_nary(NaryOperator op, std::vector<ExprPtr> operands) { return std::make_shared<NaryOp>(op, std::move(operands)); }

    int64_t identity_of(NaryOperator op) {
        switch (op) {
            case NaryOperator::Add:      return 0;
            case NaryOperator::Multiply: return 1;
            case NaryOperator::Power:    return 1;
        }
        return 0;
    }

    const char* operator_name(NaryOperator op) {
        switch (op) {
            case NaryOperator::Add:      return "Add";
            case NaryOperator::Multiply: return "Multiply";
            case NaryOperator::Power:    return "Power";
        }
        return "Unknown";
    }

    const char* operator_name(UnaryOperator op) {
        switch (op) {
            case UnaryOperator::Factorial: return "Factorial";
        }
        return "Unknown";
    }

    // ====================================================================
    //  NaryBuilder
    // ====================================================================
    NaryBuilder& NaryBuilder::with(ExprPtr operand) {
        operands_.push_back(std::move(operand));
        return *this;
    }

    NaryBuilder& NaryBuilder::with(int64_t value) { return with(make_number(value)); }
    NaryBuilder& NaryBuilder::with(const char* name) { return with(make_symbol(name)); }

    ExprPtr NaryBuilder::build() const {
        if (operands_.empty()) return make_number(identity_of(op_));
        if (operands_.size() == 1) return operands_.front();
        return make_nary(op_, operands_);
    }

    // ====================================================================
    //  结构相等
    // ====================================================================
    bool structural_equal(const ExprPtr& lhs, const ExprPtr& rhs) {
        if (!lhs || !rhs) return !lhs && !rhs;
        if (lhs == rhs) return true;

        if (auto a = std::dynamic_pointer_cast<Number>(lhs)) {
            auto b = std::dynamic_pointer_cast<Number>(rhs);
            return b && a->value == b->value;
        }
        if (auto a = std::dynamic_pointer_cast<Symbol>(lhs)) {
            auto b = std::dynamic_pointer_cast<Symbol>(rhs);
            return b && a->name == b->name;
        }
        if (auto a = std::dynamic_pointer_cast<UnaryOp>(lhs)) {
            auto b = std::dynamic_pointer_cast<UnaryOp>(rhs);
            return b && a->op == b->op && structural_equal(a->operand, b->operand);
        }
        if (auto a = std::dynamic_pointer_cast<NaryOp>(lhs)) {
            auto b = std::dynamic_pointer_cast<NaryOp>(rhs);
            if (!b || a->op != b->op || a->operands.size() != b->operands.size()) return false;
            for (size_t i = 0; i < a->operands.size(); ++i) {
                if (!structural_equal(a->operands[i], b->operands[i])) return false;
            }
            return true;
        }
        return false;
    }

    // ====================================================================
    //  中缀打印
    // ====================================================================
    namespace {

        // 结合强度: 数值越大越紧
        enum Precedence { PREC_ADD = 1, PREC_MUL = 2, PREC_POW = 3, PREC_POSTFIX = 4, PREC_ATOM = 5 };

        int precedence_of(const ExprPtr& expr) {
            if (auto n = std::dynamic_pointer_cast<Number>(expr)) return n->value < 0 ? PREC_ADD : PREC_ATOM;
            if (std::dynamic_pointer_cast<UnaryOp>(expr)) return PREC_POSTFIX;
            if (auto nary = std::dynamic_pointer_cast<NaryOp>(expr)) {
                if (nary->operands.empty()) return PREC_ATOM;
                switch (nary->op) {
                    case NaryOperator::Add:      return PREC_ADD;
                    case NaryOperator::Multiply: return PREC_MUL;
                    case NaryOperator::Power:    return PREC_POW;
                }
            }
            return PREC_ATOM;
        }

        const char* separator_of(NaryOperator op) {
            switch (op) {
                case NaryOperator::Add:      return " + ";
                case NaryOperator::Multiply: return " * ";
                case NaryOperator::Power:    return " ^ ";
            }
            return " ? ";
        }

        void print_operand(std::ostream& os, const ExprPtr& child, int parent_prec);

        void print_expression(std::ostream& os, const ExprPtr& expr) {
            if (!expr) return;
            if (auto n = std::dynamic_pointer_cast<Number>(expr)) {
                os << n->value;
                return;
            }
            if (auto sym = std::dynamic_pointer_cast<Symbol>(expr)) {
                os << sym->name;
                return;
            }
            if (auto un = std::dynamic_pointer_cast<UnaryOp>(expr)) {
                // 后缀阶乘: 非原子操作数加括号
                print_operand(os, un->operand, PREC_POSTFIX);
                os << "!";
                return;
            }
            if (auto nary = std::dynamic_pointer_cast<NaryOp>(expr)) {
                if (nary->operands.empty()) {
                    os << identity_of(nary->op);
                    return;
                }
                int prec = precedence_of(expr);
                for (size_t i = 0; i < nary->operands.size(); ++i) {
                    if (i > 0) os << separator_of(nary->op);
                    print_operand(os, nary->operands[i], prec);
                }
                return;
            }
            os << "<unknown>";
        }

        void print_operand(std::ostream& os, const ExprPtr& child, int parent_prec) {
            if (precedence_of(child) <= parent_prec) {
                os << "(";
                print_expression(os, child);
                os << ")";
            } else {
                print_expression(os, child);
            }
        }
    }

    std::string to_string(const ExprPtr& expr) {
        std::ostringstream ss;
        print_expression(ss, expr);
        return ss.str();
    }

    std::ostream& operator<<(std::ostream& os, const ExprPtr& expr) {
        print_expression(os, expr);
        return os;
    }

} // namespace ExprSimp::AST
