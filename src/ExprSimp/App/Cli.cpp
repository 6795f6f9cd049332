// --- 文件路径: src/ExprSimp/App/Cli.cpp ---
#include "../../../include/ExprSimp/App/Cli.h"
#include "../../../include/ExprSimp/AST/Expression.h"
#include "../../../include/ExprSimp/AST/JsonAdapter.h"
#include "../../../include/ExprSimp/Parser/ShuntingYard.h"
#include "../../../include/ExprSimp/symbolic/BatchSimplify.h"
#include <iostream>
#include <string>
#include <vector>

namespace ExprSimp::App {

    void print_usage(std::ostream& os) {
        os << "Usage: exprsimp [options] [expression...]\n"
           << "Simplifies each expression (or each non-empty stdin line) and prints the result,\n"
           << "one line per input. An input that fails to parse prints <error> (null with --json).\n\n"
           << "Options:\n"
           << "  --json         read and write expressions as JSON arrays, e.g. [\"Add\",\"x\",\"x\"]\n"
           << "  --threads N    limit the number of worker threads\n"
           << "  --trace        log every rewrite step\n"
           << "  -h, --help     show this message\n";
    }

    CliOptions parse_arguments(const std::vector<std::string>& args) {
        CliOptions options;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--json") options.json = true;
            else if (arg == "--trace") options.trace = true;
            else if (arg == "-h" || arg == "--help") options.help = true;
            else if (arg == "--threads") {
                if (i + 1 >= args.size()) throw std::invalid_argument("--threads requires a value");
                const std::string& value = args[++i];
                try {
                    options.threads = std::stoi(value);
                } catch (const std::logic_error&) {
                    throw std::invalid_argument("invalid thread count: " + value);
                }
                if (options.threads <= 0) throw std::invalid_argument("thread count must be positive: " + value);
            }
            else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
                throw std::invalid_argument("unknown option: " + arg);
            }
            else options.expressions.push_back(arg);
        }
        return options;
    }

    int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
        CliOptions options;
        try {
            options = parse_arguments(args);
        } catch (const std::invalid_argument& e) {
            err << "[exprsimp] " << e.what() << std::endl;
            print_usage(err);
            return EXIT_USAGE;
        }

        if (options.help) {
            print_usage(out);
            return EXIT_OK;
        }

        Simplifier::set_trace_enabled(options.trace);

        if (options.expressions.empty()) {
            std::string line;
            while (std::getline(in, line)) {
                if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
                options.expressions.push_back(line);
            }
        }

        // =========================================================
        // 1. 解析: 单个表达式出错只记录, 不影响其他表达式
        // =========================================================
        std::vector<AST::ExprPtr> parsed;
        std::vector<size_t> parsed_index;   // parsed[k] 对应的输入下标
        parsed.reserve(options.expressions.size());
        bool had_parse_error = false;

        for (size_t i = 0; i < options.expressions.size(); ++i) {
            const auto& text = options.expressions[i];
            try {
                parsed.push_back(options.json ? JsonAdapter::parse_json_to_ast(text)
                                              : Parser::parse_infix(text));
                parsed_index.push_back(i);
            } catch (const std::runtime_error& e) {
                err << "[exprsimp] parse error: " << text << ": " << e.what() << std::endl;
                had_parse_error = true;
            }
        }

        // =========================================================
        // 2. 化简 (批量并行) 并按输入顺序输出
        // =========================================================
        try {
            std::vector<AST::ExprPtr> results;
            if (options.threads > 0) {
                oneapi::tbb::global_control control(oneapi::tbb::global_control::max_allowed_parallelism, options.threads);
                results = Simplifier::simplify_batch(parsed);
            } else {
                results = Simplifier::simplify_batch(parsed);
            }

            std::vector<AST::ExprPtr> by_input(options.expressions.size());
            for (size_t k = 0; k < results.size(); ++k) by_input[parsed_index[k]] = results[k];

            for (const auto& result : by_input) {
                if (!result) out << (options.json ? "null" : "<error>") << std::endl;
                else if (options.json) out << JsonAdapter::ast_to_json_string(result) << std::endl;
                else out << AST::to_string(result) << std::endl;
            }
        } catch (const Simplifier::RecursionLimitError& e) {
            err << "[exprsimp] internal error: " << e.what() << std::endl;
            return EXIT_INTERNAL;
        } catch (const std::exception& e) {
            err << "Critical Error: " << e.what() << std::endl;
            return EXIT_INTERNAL;
        }

        return had_parse_error ? EXIT_PARSE_ERROR : EXIT_OK;
    }

} // namespace ExprSimp::App
