/**
 * @file main.cpp
 * @brief sorocost CLI entry point
 *
 * Commands:
 *   analyze   - Compute costs, scores, hints and safety violations
 *   config    - Print the effective network configuration
 *   version   - Show version information
 */

#include "sorocost/analysis.hpp"
#include "sorocost/common.hpp"
#include "sorocost/config.hpp"
#include "sorocost/report.hpp"
#include "sorocost/require_cpp23.hpp"
#include "sorocost/simulation.hpp"
#include "sorocost/version.hpp"

#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr const char* kDefaultSchemaDir = SOROCOST_SCHEMA_DIR;

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitSafetyViolation = 2;

void print_version()
{
    std::println("sorocost {} ({})", sorocost::kVersion, sorocost::kBuildId);
    std::println("  cost_model: {}", sorocost::kCostModelVersion);
    std::println("  report:     {}", sorocost::kAnalysisSchemaVersion);
}

void print_help()
{
    std::print(R"(sorocost - Soroban transaction resource cost analyzer

Usage: sorocost <command> [options]

Commands:
  analyze     Compute costs, efficiency scores and hints for a simulation result
  config      Print the effective network configuration as JSON
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'sorocost <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: sorocost analyze [options]

Compute costs, efficiency scores, hints and safety violations

Options:
  --simulation FILE, -s     Path to simulateTransaction result JSON (required)
  --config FILE, -c         Network configuration JSON (default: mainnet-v20)
  --format text|json        Output format (default: text)
  --output FILE, -o         Output file (default: stdout)
  --schema-dir DIR          Path to schema directory
  --strict                  Exit with status 2 when a safety margin is exceeded
  --help, -h                Show this help
)");
}

void print_config_help()
{
    std::print(R"(Usage: sorocost config [options]

Print the effective network configuration as JSON

Options:
  --config FILE, -c         Network configuration JSON (default: mainnet-v20)
  --schema-dir DIR          Path to schema directory
  --help, -h                Show this help
)");
}

struct AnalyzeOptions
{
    std::string simulation;
    std::optional<std::string> config;
    std::optional<std::string> output;
    std::string schema_dir;
    sorocost::report::ReportFormat format;
    bool strict;
    bool show_help;
};

struct ConfigOptions
{
    std::optional<std::string> config;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> sorocost::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            sorocost::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] sorocost::Error unknown_option(std::string_view arg)
{
    return sorocost::Error::make("InvalidArgument", "Unknown option: " + std::string(arg));
}

// NOLINTBEGIN(readability-function-size) - Option table kept in one place.
[[nodiscard]] sorocost::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.simulation = std::string{},
                           .config = std::nullopt,
                           .output = std::nullopt,
                           .schema_dir = kDefaultSchemaDir,
                           .format = sorocost::report::ReportFormat::kText,
                           .strict = false,
                           .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--strict") {
            options.strict = true;
            continue;
        }
        if (arg == "--simulation" || arg == "-s") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.simulation = *value;
            ++idx;
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config = *value;
            ++idx;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            ++idx;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            ++idx;
            continue;
        }
        if (arg == "--format") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (*value == "text") {
                options.format = sorocost::report::ReportFormat::kText;
            } else if (*value == "json") {
                options.format = sorocost::report::ReportFormat::kJson;
            } else {
                return std::unexpected(
                    sorocost::Error::make("InvalidArgument", "Invalid --format value: " + *value));
            }
            ++idx;
            continue;
        }
        return std::unexpected(unknown_option(arg));
    }
    return options;
}
// NOLINTEND(readability-function-size)

[[nodiscard]] sorocost::Result<ConfigOptions> parse_config_args(std::span<char*> args)
{
    ConfigOptions options{.config = std::nullopt,
                          .schema_dir = kDefaultSchemaDir,
                          .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.config = *value;
            ++idx;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            ++idx;
            continue;
        }
        return std::unexpected(unknown_option(arg));
    }
    return options;
}

[[nodiscard]] sorocost::Result<sorocost::config::NetworkConfig>
resolve_config(const std::optional<std::string>& path, const std::string& schema_dir)
{
    if (!path) {
        return sorocost::config::default_config();
    }
    return sorocost::config::load_config(std::filesystem::path(*path), schema_dir);
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    auto cfg = resolve_config(options.config, options.schema_dir);
    if (!cfg) {
        std::println(stderr, "Error: config load failed: {}", cfg.error().message);
        return kExitError;
    }
    auto sim = sorocost::simulation::load_simulation(std::filesystem::path(options.simulation),
                                                     options.schema_dir);
    if (!sim) {
        std::println(stderr, "Error: simulation load failed: {}", sim.error().message);
        return kExitError;
    }

    auto analysis = sorocost::analysis::analyze_transaction(*sim, *cfg);
    if (!analysis) {
        std::println(stderr,
                     "Error: analyze failed [{}]: {}",
                     analysis.error().code,
                     analysis.error().message);
        return kExitError;
    }

    sorocost::report::ReportOptions report_options{
        .format = options.format,
        .output_path =
            options.output ? std::optional<std::filesystem::path>(*options.output) : std::nullopt,
    };
    if (auto write = sorocost::report::write_report(report_options, *analysis); !write) {
        std::println(stderr, "Error: report output failed: {}", write.error().message);
        return kExitError;
    }
    if (options.output) {
        std::println("[analyze] total score {}/100, {} safety violation(s)",
                     analysis->scores.total,
                     analysis->safety_violations.size());
        std::println("  output: {}", *options.output);
    }

    if (options.strict && analysis->has_violations()) {
        std::println(stderr,
                     "Error: {} safety violation(s) in strict mode",
                     analysis->safety_violations.size());
        return kExitSafetyViolation;
    }
    return kExitOk;
}

[[nodiscard]] int run_config(const ConfigOptions& options)
{
    auto cfg = resolve_config(options.config, options.schema_dir);
    if (!cfg) {
        std::println(stderr, "Error: config load failed: {}", cfg.error().message);
        return kExitError;
    }
    std::println("{}", sorocost::config::config_to_json(*cfg).dump(2));
    return kExitOk;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_analyze_help();
        return kExitOk;
    }
    if (options->simulation.empty()) {
        std::println(stderr, "Error: --simulation is required");
        print_analyze_help();
        return kExitError;
    }
    return run_analyze(*options);
}

int cmd_config(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_config_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_config_help();
        return kExitOk;
    }
    return run_config(*options);
}

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
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "config") {
            return cmd_config(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
    } catch (const std::exception& ex) {
        std::println(stderr, "Error: {}", ex.what());
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
