/**
 * @file test_cli.cpp
 * @brief End-to-end tests for the canonjson CLI
 */

#include "canonjson/common.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sys/wait.h>

#include <gtest/gtest.h>

namespace canonjson::end_to_end::tests {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kCanonjsonBinary = CANONJSON_TEST_BIN;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

struct RunResult
{
    int exit_code;
    std::string out;
    std::string err;
};

[[nodiscard]] std::string quote_arg(std::string_view value)
{
    std::string escaped = "'";
    for (char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file(const fs::path& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}

/**
 * Run the CLI with args; stdin_path (optional) is redirected to standard input
 */
[[nodiscard]] RunResult run_cli(const TempDir& dir,
                                const std::vector<std::string>& args,
                                const fs::path& stdin_path = {})
{
    const fs::path out_path = dir.path() / "stdout.txt";
    const fs::path err_path = dir.path() / "stderr.txt";

    std::string command = quote_arg(kCanonjsonBinary);
    for (const auto& arg : args) {
        command += " " + quote_arg(arg);
    }
    if (!stdin_path.empty()) {
        command += " < " + quote_arg(stdin_path.string());
    }
    command += " > " + quote_arg(out_path.string()) + " 2> " + quote_arg(err_path.string());

    const int status = std::system(command.c_str());
    const int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return RunResult{.exit_code = exit_code, .out = read_file(out_path), .err = read_file(err_path)};
}

}  // namespace

TEST(Cli, CanonicalizesFileWithoutTrailingNewline)
{
    TempDir dir("canonjson_cli_file");
    const fs::path input = dir.path() / "input.json";
    write_file(input, "{\n  \"id\": \"1\",\n  \"b\": [1.0, 1e21],\n  \"a\": \"caf\xC3\xA9\"\n}\n");

    auto result = run_cli(dir, {input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, R"({"a":"caf\u00e9","b":[1,1e+21],"id":"1"})");
    EXPECT_TRUE(result.err.empty());
}

TEST(Cli, ReadsStandardInput)
{
    TempDir dir("canonjson_cli_stdin");
    const fs::path input = dir.path() / "input.json";
    write_file(input, R"([ "one", "two", "three" ])");

    auto implicit_stdin = run_cli(dir, {}, input);
    EXPECT_EQ(implicit_stdin.exit_code, 0) << implicit_stdin.err;
    EXPECT_EQ(implicit_stdin.out, R"(["one","two","three"])");

    auto dash = run_cli(dir, {"-"}, input);
    EXPECT_EQ(dash.exit_code, 0) << dash.err;
    EXPECT_EQ(dash.out, R"(["one","two","three"])");
}

TEST(Cli, ParseErrorExitsNonZero)
{
    TempDir dir("canonjson_cli_parse_error");
    const fs::path input = dir.path() / "input.json";
    write_file(input, R"({"a": )");

    auto result = run_cli(dir, {input.string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("Error:"), std::string::npos);
}

TEST(Cli, SerializeErrorWritesNothing)
{
    TempDir dir("canonjson_cli_serialize_error");
    const fs::path input = dir.path() / "input.json";
    const fs::path output = dir.path() / "out.json";
    write_file(input, R"({"ok": 1, "big": 1e400})");

    auto result = run_cli(dir, {input.string(), "--output", output.string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_NE(result.err.find("NumberOutOfRange"), std::string::npos);
    EXPECT_FALSE(fs::exists(output));
}

TEST(Cli, MissingInputFile)
{
    TempDir dir("canonjson_cli_missing");
    auto result = run_cli(dir, {(dir.path() / "absent.json").string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("Failed to open input file"), std::string::npos);
}

TEST(Cli, OutputFile)
{
    TempDir dir("canonjson_cli_output");
    const fs::path input = dir.path() / "input.json";
    const fs::path output = dir.path() / "out.json";
    write_file(input, R"({"b": 2, "a": 1})");

    auto result = run_cli(dir, {"-o", output.string(), input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(read_file(output), R"({"a":1,"b":2})");
}

TEST(Cli, HashMode)
{
    TempDir dir("canonjson_cli_hash");
    const fs::path input = dir.path() / "input.json";
    write_file(input, R"({"b": 2, "a": 1})");

    auto result = run_cli(dir, {"--hash", input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, canonjson::common::sha256_prefixed(R"({"a":1,"b":2})"));
}

TEST(Cli, CheckMode)
{
    TempDir dir("canonjson_cli_check");
    const fs::path canonical = dir.path() / "canonical.json";
    const fs::path loose = dir.path() / "loose.json";
    write_file(canonical, R"({"a":1,"b":[true,null]})");
    write_file(loose, R"({"b": [true, null], "a": 1})");

    auto ok = run_cli(dir, {"--check", canonical.string()});
    EXPECT_EQ(ok.exit_code, 0) << ok.err;
    EXPECT_TRUE(ok.out.empty());

    auto not_canonical = run_cli(dir, {"--check", loose.string()});
    EXPECT_EQ(not_canonical.exit_code, 2);
    EXPECT_NE(not_canonical.err.find("not in canonical form"), std::string::npos);
}

TEST(Cli, MaxDepth)
{
    TempDir dir("canonjson_cli_depth");
    const fs::path input = dir.path() / "input.json";
    write_file(input, "[[[[1]]]]");

    auto within = run_cli(dir, {"--max-depth", "4", input.string()});
    EXPECT_EQ(within.exit_code, 0) << within.err;
    EXPECT_EQ(within.out, "[[[[1]]]]");

    auto beyond = run_cli(dir, {"--max-depth", "3", input.string()});
    EXPECT_EQ(beyond.exit_code, 1);
    EXPECT_NE(beyond.err.find("DepthLimitExceeded"), std::string::npos);
}

TEST(Cli, InvalidArguments)
{
    TempDir dir("canonjson_cli_args");

    auto bad_depth = run_cli(dir, {"--max-depth", "deep"});
    EXPECT_EQ(bad_depth.exit_code, 1);
    EXPECT_NE(bad_depth.err.find("Invalid --max-depth value"), std::string::npos);

    auto missing = run_cli(dir, {"--output"});
    EXPECT_EQ(missing.exit_code, 1);
    EXPECT_NE(missing.err.find("Missing value for option"), std::string::npos);

    auto unknown = run_cli(dir, {"--pretty"});
    EXPECT_EQ(unknown.exit_code, 1);
    EXPECT_NE(unknown.err.find("Unknown option"), std::string::npos);
}

TEST(Cli, HelpAndVersion)
{
    TempDir dir("canonjson_cli_help");

    auto help = run_cli(dir, {"--help"});
    EXPECT_EQ(help.exit_code, 0);
    EXPECT_NE(help.out.find("Usage: canonjson"), std::string::npos);

    auto version = run_cli(dir, {"--version"});
    EXPECT_EQ(version.exit_code, 0);
    EXPECT_TRUE(version.out.starts_with("canonjson "));
}

}  // namespace canonjson::end_to_end::tests
