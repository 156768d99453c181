/**
 * @file main.cpp
 * @brief engwall CLI entry point
 *
 * Commands:
 *   check     - Check reference trees against the engine boundary policy
 *   checksum  - Print the modification-time checksum of all engine API files
 *   version   - Show version information
 *
 * Exit status: 0 no offenses, 1 offenses reported, 2 usage or input errors.
 */

#include "engwall/api_metadata.hpp"
#include "engwall/boundary.hpp"
#include "engwall/common.hpp"
#include "engwall/config.hpp"
#include "engwall/logging.hpp"
#include "engwall/model_oracle.hpp"
#include "engwall/policy.hpp"
#include "engwall/reference_tree.hpp"
#include "engwall/report.hpp"
#include "engwall/version.hpp"

#include <exception>
#include <filesystem>
#include <iterator>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitOffenses = 1;
constexpr int kExitError = 2;

#if defined(ENGWALL_DEFAULT_SCHEMA_DIR)
constexpr const char* kDefaultSchemaDir = ENGWALL_DEFAULT_SCHEMA_DIR;
#else
constexpr const char* kDefaultSchemaDir = "schemas";
#endif

void print_version()
{
    std::println("engwall {} ({})", engwall::kVersion, engwall::kBuildId);
    std::println("  config: {}", engwall::kConfigSchemaVersion);
    std::println("  tree:   {}", engwall::kTreeSchemaVersion);
    std::println("  report: {}", engwall::kReportSchemaVersion);
}

void print_help()
{
    std::print(R"(engwall - Engine API boundary checker

Usage: engwall <command> [options]

Commands:
  check       Check reference trees against the engine boundary policy
  checksum    Print the checksum of all engine API files
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'engwall <command> --help' for command-specific options.
)");
}

void print_check_help()
{
    std::print(R"(Usage: engwall check [options] TREE...

Check reference_tree.v1 documents for direct access of protected engines

Options:
  --config FILE             Boundary configuration (engwall_config.v1, required)
  --schema-dir DIR          Path to schema directory
  --format text|json        Output format (default: text)
  --output FILE, -o FILE    Write the report to FILE instead of stdout
  --log-level LEVEL         trace, debug, info, warn, error, off (default: warn)
  --help, -h                Show this help

Exit status:
  0  no offenses
  1  offenses reported
  2  invalid arguments, configuration or tree documents
)");
}

void print_checksum_help()
{
    std::print(R"(Usage: engwall checksum [options]

Print the modification-time checksum over every engine's API directory

Options:
  --config FILE             Boundary configuration (engwall_config.v1, required)
  --schema-dir DIR          Path to schema directory
  --log-level LEVEL         Log level (default: warn)
  --help, -h                Show this help
)");
}

struct CheckOptions
{
    std::string config_path;
    std::string schema_dir;
    engwall::report::ReportFormat format;
    std::optional<std::string> output;
    std::string log_level;
    std::vector<std::string> trees;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> engwall::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            engwall::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] engwall::Result<CheckOptions> parse_check_args(std::span<char*> args)
{
    CheckOptions options{.config_path = std::string{},
                         .schema_dir = kDefaultSchemaDir,
                         .format = engwall::report::ReportFormat::kText,
                         .output = std::nullopt,
                         .log_level = "warn",
                         .trees = {},
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--config" || arg == "--schema-dir" || arg == "--format" || arg == "--output"
            || arg == "-o" || arg == "--log-level") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            skip_next = true;
            if (arg == "--config") {
                options.config_path = *value;
            } else if (arg == "--schema-dir") {
                options.schema_dir = *value;
            } else if (arg == "--format") {
                auto format = engwall::report::parse_report_format(*value);
                if (!format) {
                    return std::unexpected(format.error());
                }
                options.format = *format;
            } else if (arg == "--log-level") {
                options.log_level = *value;
            } else {
                options.output = *value;
            }
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(engwall::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
        options.trees.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] engwall::Result<engwall::config::PolicyConfig>
load_policy_config(const CheckOptions& options)
{
    engwall::init_logging(options.log_level);
    return engwall::config::load_config(options.config_path, options.schema_dir);
}

[[nodiscard]] int run_check(const CheckOptions& options)
{
    auto config = load_policy_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return kExitError;
    }
    auto oracle = engwall::oracle::make_oracle(config->oracle);
    if (!oracle) {
        std::println(stderr, "Error: {}", oracle.error().message);
        return kExitError;
    }

    const engwall::policy::PolicyStore policy(std::move(*config));
    engwall::api::ApiMetadataReader metadata(policy);
    engwall::boundary::BoundaryChecker checker(policy, metadata, **oracle);

    engwall::report::ReportSummary summary;
    bool had_errors = false;
    for (const auto& path : options.trees) {
        auto tree = engwall::tree::load_tree(path, options.schema_dir);
        if (!tree) {
            std::println(stderr, "Error: {}", tree.error().message);
            had_errors = true;
            continue;
        }
        auto offenses = checker.check(*tree);
        ENGWALL_LOG_INFO("{}: {} offense(s)", tree->file(), offenses.size());
        summary.offenses.insert(summary.offenses.end(),
                                std::make_move_iterator(offenses.begin()),
                                std::make_move_iterator(offenses.end()));
        ++summary.files_inspected;
    }
    summary.checksum = metadata.checksum();
    engwall::report::sort_offenses(summary.offenses);

    const engwall::report::WriteOptions write_options{
        .format = options.format,
        .output_path =
            options.output ? std::optional<std::filesystem::path>(*options.output) : std::nullopt,
        .schema_dir = options.schema_dir,
    };
    if (auto written = engwall::report::write_report(summary, write_options); !written) {
        std::println(stderr, "Error: report output failed: {}", written.error().message);
        return kExitError;
    }

    if (had_errors) {
        return kExitError;
    }
    return summary.offenses.empty() ? kExitClean : kExitOffenses;
}

[[nodiscard]] int run_checksum(const CheckOptions& options)
{
    auto config = load_policy_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return kExitError;
    }
    const engwall::policy::PolicyStore policy(std::move(*config));
    const engwall::api::ApiMetadataReader metadata(policy);
    std::println("{}", metadata.checksum());
    return kExitClean;
}

int cmd_check(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_check_help();
        return kExitClean;
    }
    if (options->config_path.empty()) {
        std::println(stderr, "Error: --config is required");
        print_check_help();
        return kExitError;
    }
    if (options->trees.empty()) {
        std::println(stderr, "Error: at least one TREE is required");
        print_check_help();
        return kExitError;
    }
    return run_check(*options);
}

int cmd_checksum(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_checksum_help();
        return kExitClean;
    }
    if (options->config_path.empty()) {
        std::println(stderr, "Error: --config is required");
        print_checksum_help();
        return kExitError;
    }
    return run_checksum(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitClean;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitClean;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "check") {
            return cmd_check(sub_argc, sub_argv);
        }
        if (cmd == "checksum") {
            return cmd_checksum(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
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
