#include <gtest/gtest.h>
#include <sstream>

#include "../include/ExprSimp/App/Cli.h"
#include "../include/ExprSimp/symbolic/Simplifier.h"

using namespace ExprSimp::App;

namespace {
    struct CliRun {
        int status;
        std::string out;
        std::string err;
    };

    CliRun run(const std::vector<std::string>& args, const std::string& stdin_text = "") {
        std::istringstream in(stdin_text);
        std::ostringstream out, err;
        int status = run_cli(args, in, out, err);
        return {status, out.str(), err.str()};
    }

    // x + y + ... + y, 左结合, 共 levels 层 Add
    std::string deep_sum(size_t levels) {
        std::string text = "x";
        for (size_t k = 0; k < levels; ++k) text += " + y";
        return text;
    }
}

TEST(CliTest, SimplifiesPositionalExpressions) {
    auto r = run({"x + x", "4! + 1"});
    EXPECT_EQ(r.status, EXIT_OK);
    EXPECT_EQ(r.out, "2 * x\n25\n");
    EXPECT_EQ(r.err, "");
}

TEST(CliTest, ReadsNonEmptyStdinLines) {
    auto r = run({}, "a * b + a * c\n\n   \n3!\n");
    EXPECT_EQ(r.status, EXIT_OK);
    EXPECT_EQ(r.out, "(b + c) * a\n6\n");
}

TEST(CliTest, JsonMode) {
    auto r = run({"--json", R"(["Add","x","x"])"});
    EXPECT_EQ(r.status, EXIT_OK);
    EXPECT_EQ(r.out, "[\"Multiply\",2,\"x\"]\n");
}

TEST(CliTest, ParseErrorContinuesWithOtherInputs) {
    auto r = run({"x + x", "x $ y", "3!"});
    EXPECT_EQ(r.status, EXIT_PARSE_ERROR);
    EXPECT_EQ(r.out, "2 * x\n<error>\n6\n");
    EXPECT_NE(r.err.find("[exprsimp] parse error: x $ y"), std::string::npos);
}

TEST(CliTest, JsonParseErrorPrintsNull) {
    auto r = run({"--json", "[]", "7"});
    EXPECT_EQ(r.status, EXIT_PARSE_ERROR);
    EXPECT_EQ(r.out, "null\n7\n");
}

TEST(CliTest, UsageErrors) {
    EXPECT_EQ(run({"--frobnicate"}).status, EXIT_USAGE);
    EXPECT_EQ(run({"--threads"}).status, EXIT_USAGE);
    EXPECT_EQ(run({"--threads", "0"}).status, EXIT_USAGE);

    auto r = run({"--threads", "many", "x"});
    EXPECT_EQ(r.status, EXIT_USAGE);
    EXPECT_EQ(r.out, "");
    EXPECT_NE(r.err.find("Usage: exprsimp"), std::string::npos);
}

TEST(CliTest, HelpPrintsUsage) {
    auto r = run({"--help"});
    EXPECT_EQ(r.status, EXIT_OK);
    EXPECT_NE(r.out.find("--threads N"), std::string::npos);
}

TEST(CliTest, DepthCeilingIsInternalError) {
    auto r = run({"x + x", deep_sum(ExprSimp::Simplifier::kMaxRecursionDepth)});
    EXPECT_EQ(r.status, EXIT_INTERNAL);
    EXPECT_NE(r.err.find("[exprsimp] internal error"), std::string::npos);
}

TEST(CliTest, ThreadCapGivesSameOutput) {
    auto r = run({"--threads", "1", "x + x", "2 ^ 3"});
    EXPECT_EQ(r.status, EXIT_OK);
    EXPECT_EQ(r.out, "2 * x\n9\n");
}

TEST(CliTest, ParsesOptions) {
    auto options = parse_arguments({"--json", "--trace", "--threads", "4", "a", "b"});
    EXPECT_TRUE(options.json);
    EXPECT_TRUE(options.trace);
    EXPECT_EQ(options.threads, 4);
    EXPECT_FALSE(options.help);
    EXPECT_EQ(options.expressions, (std::vector<std::string>{"a", "b"}));
}
