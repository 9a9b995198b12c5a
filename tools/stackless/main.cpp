/**
 * @file main.cpp
 * @brief stackless CLI entry point
 *
 * Commands:
 *   render    - Render the function targets described by a fixture
 *   version   - Show version information
 */

#include "stackless/annotation_formatters.hpp"
#include "stackless/common.hpp"
#include "stackless/env.hpp"
#include "stackless/fixture.hpp"
#include "stackless/function_target.hpp"
#include "stackless/function_targets_holder.hpp"
#include "stackless/render.hpp"
#include "stackless/require_cpp23.hpp"
#include "stackless/version.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

enum class RenderFormat {
    kText,
    kJson,
};

void print_version()
{
    std::println("stackless {} ({})", stackless::kVersion, stackless::kBuildId);
    std::println("  fixture: {}", stackless::kFixtureSchemaVersion);
    std::println("  dump:    {}", stackless::kDumpFormatVersion);
}

void print_help()
{
    std::print(R"(stackless - function target inspection for stackless bytecode

Usage: stackless <command> [options]

Commands:
  render      Render the function targets of a fixture
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'stackless <command> --help' for command-specific options.
)");
}

void print_render_help()
{
    std::print(R"(Usage: stackless render [options]

Render the function targets of a fixture

Options:
  --fixture FILE            Path to the fixture JSON (required)
  --function M::f           Render only this function
  --no-annotations          Do not print annotation comments
  --format text|json        Output format (default: text)
  --output FILE, -o         Output file (default: stdout)
  --verbose                 Print progress to stderr
  --help, -h                Show this help
)");
}

struct RenderOptions
{
    std::string fixture;
    std::optional<std::string> function;
    bool annotations = true;
    RenderFormat format = RenderFormat::kText;
    std::optional<std::string> output;
    bool verbose = false;
    bool show_help = false;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> stackless::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(stackless::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] stackless::Result<RenderFormat> parse_format_value(std::string_view value)
{
    if (value == "text") {
        return RenderFormat::kText;
    }
    if (value == "json") {
        return RenderFormat::kJson;
    }
    return std::unexpected(stackless::Error::make(
        "InvalidArgument", "Invalid --format value: " + std::string(value)));
}

[[nodiscard]] auto set_render_option(std::string_view arg,
                                     // CLI parsing signature is stable.
                                     // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                     std::span<char*> args,
                                     std::size_t idx,
                                     RenderOptions& options,
                                     bool& skip_next) -> stackless::Result<bool>
{
    if (arg == "--no-annotations") {
        options.annotations = false;
        return stackless::Result<bool>{true};
    }
    if (arg == "--verbose") {
        options.verbose = true;
        return stackless::Result<bool>{true};
    }
    if (arg != "--fixture" && arg != "--function" && arg != "--format" && arg != "--output"
        && arg != "-o")
    {
        return std::unexpected(
            stackless::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;
    if (arg == "--fixture") {
        options.fixture = *value;
    } else if (arg == "--function") {
        options.function = *value;
    } else if (arg == "--format") {
        auto format = parse_format_value(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    } else {
        options.output = *value;
    }
    return stackless::Result<bool>{true};
}

[[nodiscard]] stackless::Result<RenderOptions> parse_render_args(std::span<char*> args)
{
    RenderOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_render_option(arg, args, static_cast<std::size_t>(i), options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
    }
    return options;
}

[[nodiscard]] stackless::Result<std::vector<stackless::QualifiedId<stackless::FunId>>>
select_functions(const stackless::GlobalEnv& env,
                 const stackless::FunctionTargetsHolder& holder,
                 const std::optional<std::string>& function)
{
    if (!function) {
        return holder.functions();
    }
    const auto pos = function->find("::");
    const stackless::ModuleEnv* mod =
        pos == std::string::npos ? nullptr : env.find_module(function->substr(0, pos));
    const stackless::FunctionEnv* func_env =
        mod == nullptr ? nullptr : mod->find_function(function->substr(pos + 2));
    if (func_env == nullptr || !holder.contains(func_env->qualified_id())) {
        return std::unexpected(
            stackless::Error::make("TargetNotFound", "No target for function: " + *function));
    }
    return std::vector{func_env->qualified_id()};
}

[[nodiscard]] stackless::VoidResult write_output(const std::optional<std::string>& output,
                                                 std::string_view content)
{
    if (!output) {
        std::print("{}", content);
        return {};
    }
    std::ofstream out(std::filesystem::path(*output), std::ios::binary);
    if (!out) {
        return std::unexpected(
            stackless::Error::make("IOError", "Failed to open output file: " + *output));
    }
    out << content;
    if (!out) {
        return std::unexpected(
            stackless::Error::make("IOError", "Failed to write output file: " + *output));
    }
    return {};
}

[[nodiscard]] int run_render(const RenderOptions& options)
{
    auto fixture = stackless::read_fixture_file(options.fixture);
    if (!fixture) {
        std::println(stderr, "Error: {}", fixture.error().message);
        return 1;
    }
    auto env = stackless::load_environment(*fixture);
    if (!env) {
        std::println(stderr, "Error: failed to load environment: {}", env.error().message);
        return 1;
    }
    stackless::FunctionTargetsHolder holder;
    if (auto loaded = stackless::load_targets(*fixture, **env, holder); !loaded) {
        std::println(stderr, "Error: failed to load targets: {}", loaded.error().message);
        return 1;
    }
    auto functions = select_functions(**env, holder, options.function);
    if (!functions) {
        std::println(stderr, "Error: {}", functions.error().message);
        return 1;
    }

    std::string text;
    nlohmann::json dumps = nlohmann::json::array();
    for (const auto& fun : *functions) {
        auto target = holder.target(fun);
        if (!target) {
            std::println(stderr, "Error: {}", target.error().message);
            return 1;
        }
        if (options.annotations) {
            stackless::register_annotation_formatters_for_test(*target);
        }
        if (options.verbose) {
            std::println(stderr,
                         "[render] {}::{} (generation {})",
                         target->symbol_pool().string(target->module_env().name()),
                         target->symbol_pool().string(target->name()),
                         target->data().generation());
        }

        if (options.format == RenderFormat::kJson) {
            auto dump = stackless::to_json(*target);
            if (!dump) {
                std::println(stderr, "Error: {}", dump.error().message);
                return 1;
            }
            dumps.push_back(std::move(*dump));
            continue;
        }
        auto rendered = stackless::render_function_target(*target);
        if (!rendered) {
            std::println(stderr, "Error: {}", rendered.error().message);
            return 1;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += *rendered;
    }

    if (options.format == RenderFormat::kJson) {
        text = dumps.dump(2) + "\n";
    }
    if (auto written = write_output(options.output, text); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    if (options.verbose) {
        std::println(stderr, "[render] {} function(s)", functions->size());
    }
    return 0;
}

int cmd_render(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_render_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_render_help();
        return 0;
    }
    if (options->fixture.empty()) {
        std::println(stderr, "Error: --fixture is required");
        print_render_help();
        return 1;
    }
    return run_render(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        if (cmd == "render") {
            return cmd_render(argc - 2, argv + 2);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
