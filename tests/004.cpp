#include "utils.hpp"

namespace opfreq::test {
    using namespace std::string_view_literals;

    namespace {
        run_result make_result(std::vector<file_counts> files) {
            opcode_aggregator aggregator{};
            for (auto& file : files) {
                aggregator.add_success(file.path, file.counts);
            }
            return std::move(aggregator).finish();
        }

        std::vector<std::string> names_of(const std::vector<ranked_opcode>& ranked) {
            std::vector<std::string> names{};
            for (const auto& entry : ranked) {
                names.push_back(entry.name);
            }
            return names;
        }
    }  // namespace

    TEST_CASE("004: ranking orders by count then name", "[004][report][rank]") {
        auto ranked = rank_opcodes(opcode_counts{{"RETURN", 1U}, {"LOADK", 1U}, {"ADD", 1U}});
        CHECK(names_of(ranked) == std::vector<std::string>{"ADD", "LOADK", "RETURN"});

        auto mixed = rank_opcodes(opcode_counts{{"CALL", 2U}, {"MOVE", 7U}, {"ADD", 2U}, {"NOP", 9U}});
        CHECK(names_of(mixed) == std::vector<std::string>{"NOP", "MOVE", "ADD", "CALL"});
        CHECK(mixed[1].count == 7U);

        CHECK(rank_opcodes(opcode_counts{}).empty());
    }

    TEST_CASE("004: ranking is stable across repeated renders", "[004][report][rank]") {
        opcode_counts counts{{"B", 3U}, {"A", 3U}, {"C", 1U}, {"D", 3U}};
        auto first = names_of(rank_opcodes(counts));
        for (int i = 0; i < 5; ++i) {
            CHECK(names_of(rank_opcodes(counts)) == first);
        }
        CHECK(first == std::vector<std::string>{"A", "B", "D", "C"});
    }

    TEST_CASE("004: percentages use one decimal and survive a zero total", "[004][report][percent]") {
        CHECK(format_percentage(5U, 6U) == "83.3");
        CHECK(format_percentage(1U, 6U) == "16.7");
        CHECK(format_percentage(1U, 3U) == "33.3");
        CHECK(format_percentage(2U, 2U) == "100.0");
        CHECK(format_percentage(0U, 0U) == "0.0");
        CHECK(format_percentage(4U, 0U) == "0.0");
    }

    TEST_CASE("004: aggregate table layout", "[004][report][table]") {
        auto result = make_result(
                {file_counts{.path = "a.luau", .counts = {{"MOVE", 3U}, {"ADD", 1U}}},
                 file_counts{.path = "b.luau", .counts = {{"MOVE", 2U}}}});

        std::ostringstream os{};
        render_table(result, report_options{}, os);

        auto expected = "OPCODE FREQUENCY TABLE (AGGREGATE)\n"
                        "==========================================\n"
                        "  Analyzed 2 files\n"
                        "\n"
                        "MOVE                     5    83.3%\n"
                        "ADD                      1    16.7%\n"
                        "\n"
                        "TOTAL                    6\n"sv;
        CHECK(os.str() == expected);
    }

    TEST_CASE("004: zero-opcode run renders without dividing by zero", "[004][report][table]") {
        auto result = make_result({file_counts{.path = "empty.luau", .counts = {}}});

        std::ostringstream os{};
        render_table(result, report_options{}, os);
        CHECK(os.str().find("TOTAL                    0\n") != std::string::npos);

        std::ostringstream rows{};
        render_frequency_table(opcode_counts{{"NOP", 0U}}, "zero", std::nullopt, rows);
        CHECK(rows.str().find("NOP                      0     0.0%\n") != std::string::npos);
    }

    TEST_CASE("004: show-asm prefixes each file's listing", "[004][report][table][asm]") {
        opcode_aggregator aggregator{};
        aggregator.add_success("a.luau", extract_opcodes("LOADK R0 K0\n"), std::string{"LOADK R0 K0\n"});
        aggregator.add_success("b.luau", extract_opcodes("RETURN R0 0\n"), std::string{"RETURN R0 0\n"});
        auto result = std::move(aggregator).finish();

        std::ostringstream os{};
        render_table(result, report_options{.show_asm = true}, os);
        auto text = os.str();

        auto banner = text.find("=== FULL BYTECODE DISASSEMBLY (all files) ===\n");
        auto first = text.find("=== a.luau ===\nLOADK R0 K0\n");
        auto second = text.find("=== b.luau ===\nRETURN R0 0\n");
        auto table = text.find("=== AGGREGATE OPCODE FREQUENCY TABLE ===\n");

        REQUIRE(banner != std::string::npos);
        REQUIRE(first != std::string::npos);
        REQUIRE(second != std::string::npos);
        REQUIRE(table != std::string::npos);
        CHECK(banner < first);
        CHECK(first < second);
        CHECK(second < table);
        // listings run back to back; the blank line comes once, after the last one
        CHECK(text.find("LOADK R0 K0\n=== b.luau ===") != std::string::npos);
        CHECK(text.find("RETURN R0 0\n\n\n=== AGGREGATE") != std::string::npos);
        CHECK(text.find("OPCODE FREQUENCY TABLE (AGGREGATE)") == std::string::npos);
    }

    TEST_CASE("004: per-file tables follow the aggregate", "[004][report][table]") {
        auto result = make_result(
                {file_counts{.path = "a.luau", .counts = {{"MOVE", 1U}}},
                 file_counts{.path = "b.luau", .counts = {{"CALL", 1U}}}});

        std::ostringstream os{};
        render_table(result, report_options{.per_file = true}, os);
        auto text = os.str();

        auto aggregate = text.find("OPCODE FREQUENCY TABLE (AGGREGATE)");
        auto a = text.find("=== a.luau ===\n");
        auto b = text.find("=== b.luau ===\n");
        REQUIRE(a != std::string::npos);
        REQUIRE(b != std::string::npos);
        CHECK(aggregate < a);
        CHECK(a < b);
        CHECK(text.find("MOVE                     1   100.0%\n", a) != std::string::npos);
    }

    TEST_CASE("004: structured report carries counts, totals and per-file detail", "[004][report][json]") {
        auto result = make_result(
                {file_counts{.path = "a.luau", .counts = {{"MOVE", 3U}, {"ADD", 1U}}},
                 file_counts{.path = "b.luau", .counts = {{"MOVE", 2U}}}});

        std::ostringstream os{};
        render_json(result, os);

        auto json = os.str();
        internal::json_report parsed{};
        auto ec = glz::read_json(parsed, json);
        REQUIRE_FALSE(ec);

        CHECK(parsed.file_count == 2U);
        CHECK(parsed.total_opcodes == 6U);
        CHECK(parsed.aggregate == opcode_counts{{"ADD", 1U}, {"MOVE", 5U}});
        REQUIRE(parsed.per_file.size() == 2U);
        CHECK(parsed.per_file.at("a.luau") == opcode_counts{{"ADD", 1U}, {"MOVE", 3U}});
        CHECK(parsed.per_file.at("b.luau") == opcode_counts{{"MOVE", 2U}});

        auto text = json;
        CHECK(text.find("\"file_count\"") != std::string::npos);
        CHECK(text.find("\"aggregate\"") != std::string::npos);
        CHECK(text.find("\"total_opcodes\"") != std::string::npos);
        CHECK(text.find("\"per_file\"") != std::string::npos);
    }

    TEST_CASE("004: structured output is byte-identical for the same result", "[004][report][json]") {
        auto result = make_result(
                {file_counts{.path = "z.luau", .counts = {{"NOP", 1U}, {"CALL", 2U}}},
                 file_counts{.path = "a.luau", .counts = {{"JUMP", 4U}}}});

        std::ostringstream first{};
        std::ostringstream second{};
        render_json(result, first);
        render_json(result, second);
        CHECK(first.str() == second.str());
    }

    TEST_CASE("004: failure warning goes to the diagnostic stream only", "[004][report][warning]") {
        opcode_aggregator aggregator{};
        aggregator.add_success("ok.luau", opcode_counts{{"MOVE", 1U}});
        aggregator.add_failure(file_failure{.path = "bad.luau", .exit_code = 1, .diagnostics = "bad.luau:1: oops\n"});
        auto result = std::move(aggregator).finish();

        std::ostringstream out{};
        std::ostringstream err{};
        render_report(result, report_options{}, out, err);

        CHECK(out.str().find("Warning") == std::string::npos);
        CHECK(err.str().find("1 file(s) failed") != std::string::npos);
        CHECK(err.str().find("bad.luau") == std::string::npos);

        std::ostringstream verbose_out{};
        std::ostringstream verbose_err{};
        render_report(result, report_options{.verbose = true}, verbose_out, verbose_err);
        CHECK(verbose_out.str() == out.str());
        CHECK(verbose_err.str().find("  bad.luau (exit 1): bad.luau:1: oops\n") != std::string::npos);
    }

    TEST_CASE("004: no warning when every file succeeded", "[004][report][warning]") {
        auto result = make_result({file_counts{.path = "a.luau", .counts = {{"MOVE", 1U}}}});

        std::ostringstream out{};
        std::ostringstream err{};
        render_report(result, report_options{.output = output_mode::json}, out, err);
        CHECK(err.str().empty());
        CHECK(out.str().find("\"total_opcodes\"") != std::string::npos);
    }
}  // namespace opfreq::test
