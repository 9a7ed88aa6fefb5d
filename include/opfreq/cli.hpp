#pragma once

#include "analysis.hpp"
#include "config.hpp"
#include "report.hpp"

#include <filesystem>
#include <ostream>

namespace opfreq::cli {

    // Applies the keys present in a JSON config file on top of `cfg`; throws on unreadable or malformed input.
    void load_config_file(const std::filesystem::path& path, run_config& cfg);

    void print_config(const run_config& cfg, std::ostream& os);

    report_options make_report_options(const run_config& cfg);

    process_source_options make_source_options(const run_config& cfg);

    /*
     * Discovers inputs, analyzes them, and renders the report. Returns the process exit status:
     * 1 when no input matched or when every input failed to compile, 0 otherwise.
     */
    int run(const run_config& cfg, disassembly_source& source, std::ostream& out, std::ostream& err);

    int run(const run_config& cfg, std::ostream& out, std::ostream& err);

}  // namespace opfreq::cli
