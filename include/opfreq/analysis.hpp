#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opfreq {

    // opcode mnemonic -> occurrence count; keys iterate in name order
    using opcode_counts = std::map<std::string, uint64_t, std::less<>>;

    struct disassembly_result {
        bool success{false};
        int exit_code{};
        std::string text{};
        std::string diagnostics{};
    };

    /*
     * Produces the disassembly listing for one source file. Implementations report a failed
     * compile through `disassembly_result::success`; throwing is reserved for failures of the
     * host itself (process creation, descriptor exhaustion).
     */
    class disassembly_source {
      public:
        virtual ~disassembly_source() = default;

        virtual disassembly_result disassemble(const std::filesystem::path& file) = 0;
    };

    struct process_source_options {
        std::filesystem::path compiler_path{OPFREQ_DEFAULT_COMPILER};
        std::vector<std::string> compiler_args{"--text"};
        int timeout_ms{30'000};
    };

    inline constexpr int exit_code_exec_failed = 127;
    inline constexpr int exit_code_timed_out = 124;

    // Runs `<compiler> <args...> <file>` and captures its output streams.
    class process_disassembly_source final : public disassembly_source {
      public:
        explicit process_disassembly_source(process_source_options options) : opts{std::move(options)} {}

        disassembly_result disassemble(const std::filesystem::path& file) override;

        [[nodiscard]] std::vector<std::string> command_for(const std::filesystem::path& file) const;

      private:
        process_source_options opts;
    };

    struct file_counts {
        std::string path{};
        opcode_counts counts{};
    };

    struct file_disassembly {
        std::string path{};
        std::string text{};
    };

    struct file_failure {
        std::string path{};
        int exit_code{};
        std::string diagnostics{};
    };

    struct run_result {
        size_t succeeded{};
        size_t failed{};
        opcode_counts aggregate{};
        std::vector<file_counts> per_file{};
        std::vector<file_disassembly> disassembly{};
        std::vector<file_failure> failures{};

        [[nodiscard]] uint64_t total_opcodes() const noexcept;
    };

    /*
     * Single owner of the cross-file tally. Successful files are merged key-wise into the
     * aggregate in the order they are added; a success with no opcodes still counts toward
     * `succeeded`.
     */
    class opcode_aggregator {
      public:
        static void merge(opcode_counts& into, const opcode_counts& addition);

        void add_success(std::string path, opcode_counts counts, std::optional<std::string> disassembly = {});

        void add_failure(file_failure failure);

        [[nodiscard]] const run_result& current() const noexcept { return result; }

        [[nodiscard]] run_result finish() && { return std::move(result); }

      private:
        run_result result{};
    };

    struct analysis_request {
        std::vector<std::filesystem::path> files{};
        bool keep_disassembly{false};
        unsigned jobs{1U};
    };

    run_result run_analysis(const analysis_request& request, disassembly_source& source);

    // One listing -> mnemonic counts; lines without a leading opcode are ignored.
    opcode_counts extract_opcodes(std::string_view disassembly);

}  // namespace opfreq
