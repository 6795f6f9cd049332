#include "../pch.h"
#include "../include/ExprSimp/App/Cli.h"
#include <iostream>
#include <vector>
#include <string>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return ExprSimp::App::run_cli(args, std::cin, std::cout, std::cerr);
}
