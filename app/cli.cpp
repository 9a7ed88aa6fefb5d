#include "cli.hpp"

#include "internal/platform.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace opfreq::literals;

namespace opfreq::cli {

    namespace detail {

        static constexpr auto usage_footer =
                "Patterns are files, directories, or globs, e.g.:\n"
                "  opfreq tests/conformance/*.luau\n"
                "  opfreq 'tests/**/*.luau'\n"
                "  opfreq /path/to/project/";

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg) {
        CLI::App app{"Static opcode frequency analysis of compiled Luau scripts", "opfreq"};
        app.footer(detail::usage_footer);

        bool show_version = false;
        bool json_flag = false;
        std::string config_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string jobs_arg{std::to_string(cfg.jobs)};
        std::string compiler_arg{cfg.compiler_path.string()};
        std::vector<std::string> compiler_args{};
        std::vector<std::string> ext_args{};
        int timeout_arg{cfg.timeout_ms};

        app.add_option("patterns", cfg.patterns, "Files, directories, or glob patterns to analyze");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file applied before command-line options");
        app.add_flag("--show-asm", cfg.show_asm, "Show the disassembly of every file before the summary");
        app.add_flag("--json", json_flag, "Output results as JSON (same as --output json)");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_flag("--per-file", cfg.per_file, "Print a frequency table for each file after the aggregate");
        app.add_option(
                "--compiler",
                compiler_arg,
                "Disassembling compiler executable (default: {})"_format(internal::platform::tool::default_compiler));
        app.add_option(
                "--compiler-arg",
                compiler_args,
                "Argument passed before the input path, repeatable; write --compiler-arg=--text for dashed values")
                ->allow_extra_args(false);
        app.add_option("--ext", ext_args, "Accepted file extension, repeatable (default: .luau .lua)")
                ->allow_extra_args(false);
        app.add_option("-j,--jobs", jobs_arg, "Concurrent compiler invocations");
        app.add_option("--timeout-ms", timeout_arg, "Per-file compiler time budget in ms, 0 for none");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--verbose", cfg.verbose, "Report each failed file on stderr");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // help keeps CLI11's success code; every other parse error is a usage error
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? 0 : 2};
        }

        if (show_version) {
            std::cout << "opfreq " << internal::platform::version << '\n';
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            load_config_file(config_arg, cfg);
        }

        if (app.count("--output") > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (json_flag) {
            cfg.output = output_mode::json;
        }
        if (app.count("--jobs") > 0U && !try_parse_jobs(jobs_arg, cfg.jobs)) {
            std::cerr << "invalid --jobs value: " << jobs_arg << " (expected 1.." << max_jobs << ")\n";
            return std::optional<int>{2};
        }
        if (app.count("--timeout-ms") > 0U) {
            if (timeout_arg < 0) {
                std::cerr << "invalid --timeout-ms value: " << timeout_arg << '\n';
                return std::optional<int>{2};
            }
            cfg.timeout_ms = timeout_arg;
        }
        if (app.count("--compiler") > 0U) {
            cfg.compiler_path = compiler_arg;
        }
        if (!compiler_args.empty()) {
            cfg.compiler_args = std::move(compiler_args);
        }
        if (!ext_args.empty()) {
            cfg.extensions.clear();
            for (const auto& ext : ext_args) {
                if (auto normalized = utils::normalize_extension(ext); !normalized.empty()) {
                    cfg.extensions.push_back(std::move(normalized));
                }
            }
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.patterns.empty()) {
            std::cerr << app.help();
            return std::optional<int>{1};
        }

        return std::nullopt;
    }

}  // namespace opfreq::cli
