// --- 文件路径: src/ExprSimp/Parser/ShuntingYard.cpp ---
#include "../../../include/ExprSimp/Parser/ShuntingYard.h"
#include <cctype>
#include <stack>
#include <stdexcept>
#include <string>
#include <vector>

namespace ExprSimp::Parser {

namespace {
    using namespace ExprSimp::AST;

    // 优先级定义
    enum Precedence { LOWEST = 0, ADD = 2, MUL = 3, POW = 4 };

    struct Op { char symbol; Precedence prec; bool right_assoc; };

    bool is_identifier_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) > 127 || c == '_';
    }

    bool is_identifier_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) > 127 || c == '_';
    }

    std::string at_position(size_t pos) {
        return " at position " + std::to_string(pos);
    }

    // 从操作数栈弹出两个操作数, 组合成二元节点后压回
    void apply_operator(std::stack<ExprPtr>& operands, const Op& op) {
        if (operands.size() < 2) throw std::runtime_error(std::string("Missing operand for '") + op.symbol + "'");
        ExprPtr rhs = operands.top(); operands.pop();
        ExprPtr lhs = operands.top(); operands.pop();

        NaryOperator type = NaryOperator::Add;
        if (op.symbol == '*') type = NaryOperator::Multiply;
        else if (op.symbol == '^') type = NaryOperator::Power;

        operands.push(make_nary(type, {lhs, rhs}));
    }
}

ExprPtr parse_infix(std::string_view expression) {
    std::stack<ExprPtr> operands;
    std::stack<Op> op_stack;

    // 状态机：是否期待一个操作数。
    // 在表达式开头、左括号后、运算符后，我们都期待一个操作数。
    bool expect_operand = true;

    size_t i = 0;
    const size_t n = expression.length();

    while (i < n) {
        char c = expression[i];
        if (std::isspace(static_cast<unsigned char>(c))) { i++; continue; }

        // 1. 处理整数 (期待操作数时, 紧跟数字的负号属于该数字)
        bool is_negative_num = (c == '-' && expect_operand && i + 1 < n && std::isdigit(static_cast<unsigned char>(expression[i + 1])));

        if (std::isdigit(static_cast<unsigned char>(c)) || is_negative_num) {
            if (!expect_operand) throw std::runtime_error("Unexpected number" + at_position(i));
            size_t start = i;
            i++;
            while (i < n && std::isdigit(static_cast<unsigned char>(expression[i]))) i++;

            std::string digits(expression.substr(start, i - start));
            try {
                operands.push(make_number(std::stoll(digits)));
            } catch (const std::out_of_range&) {
                throw std::runtime_error("Integer literal out of range: " + digits + at_position(start));
            }
            expect_operand = false; // 拿到数字了，下一个应该是运算符
        }
        // 2. 处理标识符
        else if (is_identifier_start(c)) {
            if (!expect_operand) throw std::runtime_error("Unexpected symbol" + at_position(i));
            size_t start = i;
            while (i < n && is_identifier_char(expression[i])) i++;
            operands.push(make_symbol(std::string(expression.substr(start, i - start))));
            expect_operand = false;
        }
        // 3. 处理二元运算符
        else if (c == '+' || c == '*' || c == '^') {
            if (expect_operand) throw std::runtime_error(std::string("Unexpected operator '") + c + "'" + at_position(i));

            Op op{c, c == '+' ? ADD : (c == '*' ? MUL : POW), c == '^'};
            while (!op_stack.empty() && op_stack.top().symbol != '(' &&
                   (op_stack.top().prec > op.prec || (op_stack.top().prec == op.prec && !op.right_assoc))) {
                apply_operator(operands, op_stack.top());
                op_stack.pop();
            }
            op_stack.push(op);
            i++;
            expect_operand = true; // 运算符后期待操作数
        }
        // 4. 后缀阶乘, 直接作用于栈顶操作数
        else if (c == '!') {
            if (expect_operand) throw std::runtime_error("Unexpected '!'" + at_position(i));
            ExprPtr operand = operands.top(); operands.pop();
            operands.push(make_unary(UnaryOperator::Factorial, operand));
            i++;
        }
        else if (c == '(') {
            if (!expect_operand) throw std::runtime_error("Unexpected '('" + at_position(i));
            op_stack.push({'(', LOWEST, false});
            i++;
            expect_operand = true;
        }
        else if (c == ')') {
            if (expect_operand) throw std::runtime_error("Missing operand before ')'" + at_position(i));
            while (!op_stack.empty() && op_stack.top().symbol != '(') {
                apply_operator(operands, op_stack.top());
                op_stack.pop();
            }
            if (op_stack.empty()) throw std::runtime_error("Mismatched parentheses" + at_position(i));
            op_stack.pop(); // pop "("
            i++;
            expect_operand = false;
        }
        else if (c == '-' || c == '/') {
            throw std::runtime_error(std::string("Unsupported operator '") + c + "'" + at_position(i));
        }
        else {
            throw std::runtime_error(std::string("Unknown token '") + c + "'" + at_position(i));
        }
    }

    if (operands.empty() && op_stack.empty()) throw std::runtime_error("Empty expression");
    if (expect_operand) throw std::runtime_error("Missing operand at end of expression");

    while (!op_stack.empty()) {
        if (op_stack.top().symbol == '(') throw std::runtime_error("Mismatched parentheses");
        apply_operator(operands, op_stack.top());
        op_stack.pop();
    }

    if (operands.size() != 1) throw std::runtime_error("Malformed expression");
    return operands.top();
}

} // namespace ExprSimp::Parser
