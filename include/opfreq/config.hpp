#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#ifndef OPFREQ_DEFAULT_COMPILER
#define OPFREQ_DEFAULT_COMPILER "luau-compile"
#endif

namespace opfreq {

    using namespace std::string_view_literals;

    /*
     * Opfreq Run Config Options
     *
     * Toolchain
     * - compiler_path: Executable invoked once per input file to produce disassembly text.
     * - compiler_args: Arguments placed between the executable and the input path.
     * - timeout_ms: Wall-time budget per invocation; 0 waits indefinitely.
     *
     * Discovery
     * - patterns: Files, directories, or glob patterns to analyze.
     * - extensions: File extensions accepted during discovery.
     *
     * Execution
     * - jobs: Worker concurrency for compiler invocations.
     *
     * Output
     * - output: Report shape ("table" or "json").
     * - show_asm: Print every file's disassembly ahead of the aggregate table.
     * - per_file: Follow the aggregate table with one table per file.
     * - verbose: List each failed file with its exit code on the diagnostic stream.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr unsigned max_jobs = 256U;

    inline constexpr bool try_parse_jobs(std::string_view text, unsigned& out) {
        auto parsed = utils::parse_arithmetic<unsigned>(utils::trim_view(text));
        if (!parsed || *parsed == 0U || *parsed > max_jobs) {
            return false;
        }
        out = *parsed;
        return true;
    }

    struct run_config {
        std::filesystem::path compiler_path{OPFREQ_DEFAULT_COMPILER};
        std::vector<std::string> compiler_args{"--text"};
        int timeout_ms{30'000};

        std::vector<std::string> patterns{};
        std::vector<std::string> extensions{".luau", ".lua"};

        unsigned jobs{1U};

        output_mode output{output_mode::table};
        bool show_asm{false};
        bool per_file{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace opfreq
