// --- 文件路径: src/ExprSimp/AST/JsonAdapter.cpp ---

#include "../../../include/ExprSimp/AST/JsonAdapter.h"
#include "../../../include/ExprSimp/AST/Expression.h"

#include "../../../pch.h"
namespace ExprSimp::JsonAdapter {
namespace {
    using namespace ExprSimp::AST;

    std::optional<NaryOperator> nary_from_name(std::string_view name) {
        if (name == "Add") return NaryOperator::Add;
        if (name == "Multiply") return NaryOperator::Multiply;
        if (name == "Power") return NaryOperator::Power;
        return std::nullopt;
    }

    std::shared_ptr<Expression> build_ast_from_element(simdjson::dom::element node) {
        switch (node.type()) {
            case simdjson::dom::element_type::INT64:
                return make_number(node.get_int64().value());

            case simdjson::dom::element_type::UINT64:
                // 能放进 int64 的整数都被解析为 INT64, 到这里的一定越界
                throw std::runtime_error("整数超出 int64 范围: " + std::to_string(node.get_uint64().value()));

            case simdjson::dom::element_type::DOUBLE:
                throw std::runtime_error("只支持整数常量, 发现浮点数: " + std::to_string(node.get_double().value()));

            case simdjson::dom::element_type::STRING: {
                std::string_view sv = node.get_string().value();
                if (sv.empty()) throw std::runtime_error("符号名不能为空");
                return make_symbol(std::string(sv));
            }

            // {"num": "..."} 格式
            case simdjson::dom::element_type::OBJECT: {
                simdjson::dom::object obj = node.get_object();
                auto num_field_result = obj["num"];
                // 检查对象是否包含 "num" 键
                if (!num_field_result.error()) {
                    simdjson::dom::element num_value = num_field_result.value();
                    if (num_value.is_string()) {
                        std::string num_str(num_value.get_string().value());
                        try {
                            size_t consumed = 0;
                            int64_t value = std::stoll(num_str, &consumed);
                            if (consumed != num_str.size()) throw std::invalid_argument(num_str);
                            return make_number(value);
                        } catch (const std::logic_error&) {
                            throw std::runtime_error("在 'num' 对象中发现无效的整数字符串: " + num_str);
                        }
                    }
                }

                throw std::runtime_error("在AST中发现不支持的JSON对象。");
            }

            case simdjson::dom::element_type::ARRAY: {
                simdjson::dom::array arr = node.get_array();
                if (arr.size() == 0) throw std::runtime_error("AST 数组节点不能为空");
                simdjson::dom::element head = arr.at(0).value();
                if (!head.is_string()) throw std::runtime_error("AST 数组节点的第一个元素必须是运算符名");
                std::string op(head.get_string().value());

                std::vector<std::shared_ptr<Expression>> args;
                args.reserve(arr.size() - 1);
                for (size_t i = 1; i < arr.size(); ++i) {
                    args.push_back(build_ast_from_element(arr.at(i).value()));
                }

                if (op == "Factorial") {
                    if (args.size() != 1) throw std::runtime_error("Factorial 需要恰好 1 个参数, 实际为 " + std::to_string(args.size()));
                    return make_unary(UnaryOperator::Factorial, args[0]);
                }
                if (auto nary = nary_from_name(op)) {
                    return make_nary(*nary, std::move(args));
                }
                throw std::runtime_error("不支持的运算符: " + op);
            }
            default:
                throw std::runtime_error("无效的AST JSON节点类型");
        }
    }

    nlohmann::json ast_to_json_node(const std::shared_ptr<Expression>& node) {
        if (auto num = std::dynamic_pointer_cast<Number>(node)) return num->value;
        if (auto sym = std::dynamic_pointer_cast<Symbol>(node)) return sym->name;
        if (auto un = std::dynamic_pointer_cast<UnaryOp>(node)) {
            return nlohmann::json::array({operator_name(un->op), ast_to_json_node(un->operand)});
        }
        if (auto nary = std::dynamic_pointer_cast<NaryOp>(node)) {
            nlohmann::json j = nlohmann::json::array();
            j.push_back(operator_name(nary->op));
            for (const auto& arg : nary->operands) j.push_back(ast_to_json_node(arg));
            return j;
        }
        return nullptr;
    }
}

std::shared_ptr<Expression> parse_json_to_ast(const std::string& json_string) {
    thread_local simdjson::dom::parser parser;
    try {
        simdjson::dom::element root = parser.parse(json_string);
        return build_ast_from_element(root);
    } catch (const simdjson::simdjson_error& e) {
        throw std::runtime_error("simdjson 解析失败: " + std::string(e.what()));
    }
}

std::string ast_to_json_string(const std::shared_ptr<Expression>& ast, int indent) {
    return ast_to_json_node(ast).dump(indent);
}
} // namespace ExprSimp::JsonAdapter
