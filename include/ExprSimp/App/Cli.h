// --- 文件路径: include/ExprSimp/App/Cli.h ---

#ifndef EXPRSIMP_APP_CLI_H
#define EXPRSIMP_APP_CLI_H

#include "../../../pch.h"


namespace ExprSimp::App {

    // 退出码
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_PARSE_ERROR = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_INTERNAL = 3;

    struct CliOptions {
        bool json = false;      // 输入输出均为 JSON
        bool trace = false;     // 打开化简器的跟踪日志
        int threads = 0;        // 0 表示由 TBB 自行决定
        bool help = false;
        std::vector<std::string> expressions;
    };

    // 解析命令行 (不含程序名)。选项错误抛 std::invalid_argument
    CliOptions parse_arguments(const std::vector<std::string>& args);

    void print_usage(std::ostream& os);

    /**
     * @brief 命令行的完整流程: 解析参数 -> 读取表达式 -> 批量化简 -> 输出
     *
     * 每个输入对应一行输出; 解析失败的输入输出占位行
     * (中缀模式 "<error>", JSON 模式 "null"), 错误写到 err。
     * @return 退出码, 见 EXIT_*
     */
    int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace ExprSimp::App

#endif // EXPRSIMP_APP_CLI_H
