#pragma once

#include "analysis.hpp"
#include "config.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace opfreq {

    using namespace std::string_view_literals;

    inline constexpr auto aggregate_table_title = "OPCODE FREQUENCY TABLE (AGGREGATE)"sv;
    inline constexpr auto aggregate_table_title_with_asm = "=== AGGREGATE OPCODE FREQUENCY TABLE ==="sv;
    inline constexpr auto disassembly_banner = "=== FULL BYTECODE DISASSEMBLY (all files) ==="sv;

    struct ranked_opcode {
        std::string name{};
        uint64_t count{};
    };

    struct report_options {
        output_mode output{output_mode::table};
        bool show_asm{false};
        bool per_file{false};
        bool verbose{false};
    };

    // Descending count, ties broken by ascending name.
    std::vector<ranked_opcode> rank_opcodes(const opcode_counts& counts);

    void render_frequency_table(
            const opcode_counts& counts, std::string_view title, std::optional<size_t> file_count, std::ostream& os);

    void render_table(const run_result& result, const report_options& options, std::ostream& os);

    void render_json(const run_result& result, std::ostream& os);

    // Primary report on `out`; the failed-file warning (and details when verbose) on `err`.
    void render_report(const run_result& result, const report_options& options, std::ostream& out, std::ostream& err);

}  // namespace opfreq
