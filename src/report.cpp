#include "opfreq/report.hpp"

#include "opfreq/format.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace opfreq::literals;

namespace opfreq::detail {

    static constexpr auto table_rule_width = 42U;

    static std::string_view first_line(std::string_view text) {
        text = utils::trim_view(text);
        auto eol = text.find_first_of("\r\n");
        return eol == std::string_view::npos ? text : text.substr(0U, eol);
    }

    static internal::json_report make_json_report(const run_result& result) {
        internal::json_report report{};
        report.file_count = result.succeeded;
        report.aggregate = result.aggregate;
        report.total_opcodes = result.total_opcodes();
        for (const auto& file : result.per_file) {
            report.per_file.insert_or_assign(file.path, file.counts);
        }
        return report;
    }

}  // namespace opfreq::detail

namespace opfreq {

    std::vector<ranked_opcode> rank_opcodes(const opcode_counts& counts) {
        std::vector<ranked_opcode> ranked{};
        ranked.reserve(counts.size());
        for (const auto& [name, count] : counts) {
            ranked.push_back(ranked_opcode{.name = name, .count = count});
        }

        std::ranges::sort(ranked, [](const ranked_opcode& lhs, const ranked_opcode& rhs) {
            if (lhs.count != rhs.count) {
                return lhs.count > rhs.count;
            }
            return lhs.name < rhs.name;
        });
        return ranked;
    }

    void render_frequency_table(
            const opcode_counts& counts, std::string_view title, std::optional<size_t> file_count, std::ostream& os) {
        uint64_t total = 0U;
        for (const auto& [_, count] : counts) {
            total += count;
        }

        os << title << '\n';
        os << std::string(detail::table_rule_width, '=') << '\n';
        if (file_count) {
            os << "  Analyzed {} files\n"_format(*file_count);
        }
        os << '\n';

        for (const auto& entry : rank_opcodes(counts)) {
            os << "{:<20} {:>5}  {:>6}%\n"_format(entry.name, entry.count, format_percentage(entry.count, total));
        }

        os << '\n';
        os << "{:<20} {:>5}\n"_format("TOTAL", total);
    }

    void render_table(const run_result& result, const report_options& options, std::ostream& os) {
        auto title = aggregate_table_title;

        if (options.show_asm) {
            os << disassembly_banner << '\n';
            for (const auto& file : result.disassembly) {
                os << "=== {} ===\n"_format(file.path);
                os << file.text;
            }
            os << "\n\n";
            title = aggregate_table_title_with_asm;
        }

        render_frequency_table(result.aggregate, title, result.succeeded, os);

        if (options.per_file) {
            for (const auto& file : result.per_file) {
                os << '\n';
                render_frequency_table(file.counts, "=== {} ==="_format(file.path), std::nullopt, os);
            }
        }
    }

    void render_json(const run_result& result, std::ostream& os) {
        auto report = detail::make_json_report(result);

        std::string json{};
        auto ec = glz::write<glz::opts{.prettify = true}>(report, json);
        if (ec) {
            throw std::runtime_error("failed to serialize opcode report");
        }
        os << json << '\n';
    }

    void render_report(const run_result& result, const report_options& options, std::ostream& out, std::ostream& err) {
        if (options.output == output_mode::json) {
            render_json(result, out);
        }
        else {
            render_table(result, options, out);
        }
        out.flush();

        if (result.failed == 0U) {
            return;
        }

        err << "\nWarning: {} file(s) failed to compile\n"_format(result.failed);
        if (options.verbose) {
            for (const auto& failure : result.failures) {
                auto reason = detail::first_line(failure.diagnostics);
                if (reason.empty()) {
                    err << "  {} (exit {})\n"_format(failure.path, failure.exit_code);
                }
                else {
                    err << "  {} (exit {}): {}\n"_format(failure.path, failure.exit_code, reason);
                }
            }
        }
    }

}  // namespace opfreq
