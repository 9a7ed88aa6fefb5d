#include "opfreq/cli.hpp"

#include "opfreq/discovery.hpp"
#include "opfreq/format.hpp"
#include "opfreq/utils.hpp"

#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace opfreq::literals;

namespace opfreq::cli {

    namespace detail {

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

        static std::vector<std::string> normalize_extensions(const std::vector<std::string>& raw) {
            std::vector<std::string> out{};
            out.reserve(raw.size());
            for (const auto& ext : raw) {
                if (auto normalized = utils::normalize_extension(ext); !normalized.empty()) {
                    out.push_back(std::move(normalized));
                }
            }
            return out;
        }

    }  // namespace detail

    void load_config_file(const fs::path& path, run_config& cfg) {
        internal::persisted_config persisted{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(persisted, json);
        if (ec) {
            throw std::runtime_error("failed to parse config file {}"_format(path.string()));
        }

        if (persisted.compiler) {
            cfg.compiler_path = *persisted.compiler;
        }
        if (persisted.compiler_args) {
            cfg.compiler_args = *persisted.compiler_args;
        }
        if (persisted.extensions) {
            cfg.extensions = detail::normalize_extensions(*persisted.extensions);
        }
        if (persisted.jobs) {
            if (*persisted.jobs == 0U || *persisted.jobs > max_jobs) {
                throw std::runtime_error("invalid jobs in {}: {}"_format(path.string(), *persisted.jobs));
            }
            cfg.jobs = *persisted.jobs;
        }
        if (persisted.timeout_ms) {
            if (*persisted.timeout_ms < 0) {
                throw std::runtime_error("invalid timeout_ms in {}: {}"_format(path.string(), *persisted.timeout_ms));
            }
            cfg.timeout_ms = *persisted.timeout_ms;
        }
        if (persisted.output && !try_parse_output_mode(*persisted.output, cfg.output)) {
            throw std::runtime_error(
                    "invalid output in {}: {} (expected table|json)"_format(path.string(), *persisted.output));
        }
    }

    void print_config(const run_config& cfg, std::ostream& os) {
        os << "compiler=" << cfg.compiler_path.string() << '\n';
        os << "compiler_args=" << utils::join_with_separator(cfg.compiler_args, " ") << '\n';
        os << "extensions=" << utils::join_with_separator(cfg.extensions, ",") << '\n';
        os << "jobs=" << cfg.jobs << '\n';
        os << "timeout_ms=" << cfg.timeout_ms << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "show_asm=" << (cfg.show_asm ? "true" : "false") << '\n';
        os << "per_file=" << (cfg.per_file ? "true" : "false") << '\n';
        os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
    }

    report_options make_report_options(const run_config& cfg) {
        return report_options{
                .output = cfg.output,
                .show_asm = cfg.output == output_mode::table && cfg.show_asm,
                .per_file = cfg.per_file,
                .verbose = cfg.verbose};
    }

    process_source_options make_source_options(const run_config& cfg) {
        return process_source_options{
                .compiler_path = cfg.compiler_path, .compiler_args = cfg.compiler_args, .timeout_ms = cfg.timeout_ms};
    }

    int run(const run_config& cfg, disassembly_source& source, std::ostream& out, std::ostream& err) {
        auto files = find_input_files(cfg.patterns, cfg.extensions);
        if (files.empty()) {
            err << "No {} files found matching the given patterns.\n"_format(
                    utils::join_with_separator(cfg.extensions, "/"));
            return 1;
        }

        auto options = make_report_options(cfg);
        auto result = run_analysis(
                analysis_request{.files = std::move(files), .keep_disassembly = options.show_asm, .jobs = cfg.jobs},
                source);

        if (result.succeeded == 0U) {
            err << "No files compiled successfully.\n";
            if (cfg.verbose) {
                for (const auto& failure : result.failures) {
                    err << "  {} (exit {})\n"_format(failure.path, failure.exit_code);
                }
            }
            return 1;
        }

        render_report(result, options, out, err);
        return 0;
    }

    int run(const run_config& cfg, std::ostream& out, std::ostream& err) {
        process_disassembly_source source{make_source_options(cfg)};
        return run(cfg, source, out, err);
    }

}  // namespace opfreq::cli
