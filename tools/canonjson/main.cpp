/**
 * @file main.cpp
 * @brief canonjson CLI entry point
 *
 * Reads JSON from a file or standard input and writes its canonical form
 * to standard output (no trailing newline), or to --output FILE.
 *
 * Modes:
 *   (default) - print canonical JSON
 *   --hash    - print "sha256:<hex>" of the canonical bytes
 *   --check   - exit 0 if the input already is canonical, 2 if not
 */

#include "canonjson/canonical_json.hpp"
#include "canonjson/common.hpp"
#include "canonjson/json_view.hpp"
#include "canonjson/version.hpp"

#include <charconv>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <print>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNotCanonical = 2;

void print_version()
{
    std::println("canonjson {} ({})", canonjson::kVersion, canonjson::kBuildId);
    std::println("  canonical form: {}", canonjson::kCanonicalFormVersion);
}

void print_help()
{
    std::print(R"(canonjson - Canonical JSON serializer

Usage: canonjson [options] [FILE]

Reads JSON from FILE (or standard input when FILE is omitted or '-') and
writes its canonical form: sorted keys, no whitespace, ASCII-only strings,
shortest round-trip numbers.

Options:
  --output FILE, -o       Write canonical JSON to FILE instead of stdout
  --hash                  Print sha256:<hex> of the canonical bytes
  --check                 Exit 0 if the input is already canonical, 2 if not
  --max-depth N           Reject input nested deeper than N (default: unlimited)
  --help, -h              Show this help message
  --version, -v           Show version information

Exit status:
  0  success
  1  parse, serialization or I/O error
  2  --check: input is valid JSON but not canonical
)");
}

struct CliOptions
{
    std::string input;
    std::string output;
    std::size_t max_depth = 0;
    bool hash = false;
    bool check = false;
    bool show_help = false;
    bool show_version = false;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> canonjson::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            canonjson::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] canonjson::Result<std::size_t> parse_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(
            canonjson::Error::make("InvalidArgument",
                                   std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] canonjson::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version" || arg == "-v") {
            options.show_version = true;
        } else if (arg == "--hash") {
            options.hash = true;
        } else if (arg == "--check") {
            options.check = true;
        } else if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            ++i;
        } else if (arg == "--max-depth") {
            auto value = read_option_value(args, i, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto depth = parse_depth_value(*value);
            if (!depth) {
                return std::unexpected(depth.error());
            }
            options.max_depth = *depth;
            ++i;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return std::unexpected(canonjson::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        } else if (options.input.empty()) {
            options.input = std::string(arg);
        } else {
            return std::unexpected(canonjson::Error::make(
                "InvalidArgument", std::string("Unexpected argument: ") + std::string(arg)));
        }
    }
    if (options.hash && options.check) {
        return std::unexpected(
            canonjson::Error::make("InvalidArgument", "--hash and --check are mutually exclusive"));
    }
    return options;
}

[[nodiscard]] canonjson::Result<std::string> read_input(const std::string& input)
{
    if (input.empty() || input == "-") {
        std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
        if (std::cin.bad()) {
            return std::unexpected(
                canonjson::Error::make("IOError", "Failed to read standard input"));
        }
        return text;
    }

    std::ifstream in(std::filesystem::path(input), std::ios::binary);
    if (!in) {
        return std::unexpected(canonjson::Error::make("IOError", "Failed to open input file: " + input));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(canonjson::Error::make("IOError", "Failed to read input file: " + input));
    }
    return buffer.str();
}

[[nodiscard]] canonjson::VoidResult write_output_file(const std::filesystem::path& path,
                                                      std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            canonjson::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        return std::unexpected(
            canonjson::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] int run(const CliOptions& options)
{
    auto text = read_input(options.input);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return kExitError;
    }

    auto parsed = canonjson::value::parse_json(*text);
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return kExitError;
    }

    const canonjson::canonical::SerializeOptions serialize_options{.max_depth = options.max_depth};
    auto canonical = canonjson::canonical::canonicalize(*parsed, serialize_options);
    if (!canonical) {
        std::println(stderr, "Error: {}: {}", canonical.error().code, canonical.error().message);
        return kExitError;
    }

    if (options.check) {
        if (*canonical != *text) {
            std::println(stderr, "Input is not in canonical form");
            return kExitNotCanonical;
        }
        return kExitOk;
    }

    const std::string payload =
        options.hash ? canonjson::common::sha256_prefixed(*canonical) : std::move(*canonical);
    if (!options.output.empty()) {
        if (auto result = write_output_file(options.output, payload); !result) {
            std::println(stderr, "Error: {}", result.error().message);
            return kExitError;
        }
        return kExitOk;
    }
    std::print("{}", payload);
    return kExitOk;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc)).subspan(1);
        auto options = parse_args(args);
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return kExitError;
        }
        if (options->show_help) {
            print_help();
            return kExitOk;
        }
        if (options->show_version) {
            print_version();
            return kExitOk;
        }
        return run(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
