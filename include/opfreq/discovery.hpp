#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace opfreq {

    /*
     * Expands file, directory, and glob patterns into the ordered set of inputs for a run.
     *
     * - directories are walked recursively
     * - patterns containing '*', '?', or '[' are globs; "**" spans any number of directories
     * - anything else must name an existing regular file
     *
     * Only regular files whose extension appears in `extensions` are kept. The result is sorted
     * and free of duplicates.
     */
    std::vector<std::filesystem::path> find_input_files(
            std::span<const std::string> patterns, std::span<const std::string> extensions);

    bool is_glob_pattern(std::string_view pattern) noexcept;

    bool glob_match(std::string_view pattern, std::string_view path);

}  // namespace opfreq
