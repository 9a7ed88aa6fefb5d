#pragma once

#include "opfreq/analysis.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace opfreq::internal {

    // Structured report; field names are part of the external contract.
    struct json_report {
        size_t file_count{};
        opcode_counts aggregate{};
        uint64_t total_opcodes{};
        std::map<std::string, opcode_counts> per_file{};
    };

    // On-disk config; absent keys leave the corresponding run_config field untouched.
    struct persisted_config {
        std::optional<std::string> compiler{};
        std::optional<std::vector<std::string>> compiler_args{};
        std::optional<std::vector<std::string>> extensions{};
        std::optional<unsigned> jobs{};
        std::optional<int> timeout_ms{};
        std::optional<std::string> output{};
    };

}  // namespace opfreq::internal

namespace glz {

    template <>
    struct meta<opfreq::internal::json_report> {
        using T = opfreq::internal::json_report;
        static constexpr auto value =
                object("file_count",
                       &T::file_count,
                       "aggregate",
                       &T::aggregate,
                       "total_opcodes",
                       &T::total_opcodes,
                       "per_file",
                       &T::per_file);
    };

    template <>
    struct meta<opfreq::internal::persisted_config> {
        using T = opfreq::internal::persisted_config;
        static constexpr auto value =
                object("compiler",
                       &T::compiler,
                       "compiler_args",
                       &T::compiler_args,
                       "extensions",
                       &T::extensions,
                       "jobs",
                       &T::jobs,
                       "timeout_ms",
                       &T::timeout_ms,
                       "output",
                       &T::output);
    };

}  // namespace glz
