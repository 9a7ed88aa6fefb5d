#include "opfreq/discovery.hpp"

#include "opfreq/format.hpp"
#include "opfreq/utils.hpp"

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace opfreq::literals;
using namespace std::string_view_literals;

namespace opfreq::detail {

    static bool has_extension(const fs::path& path, std::span<const std::string> extensions) {
        auto name = path.filename().string();
        return std::ranges::any_of(
                extensions, [&name](const std::string& accepted) { return name.ends_with(accepted); });
    }

    static bool is_regular_file(const fs::path& path) {
        std::error_code ec{};
        return fs::is_regular_file(path, ec);
    }

    // Longest leading run of path components free of glob metacharacters.
    static fs::path glob_root(std::string_view pattern) {
        auto meta = pattern.find_first_of("*?["sv);
        auto prefix = pattern.substr(0U, meta);
        auto slash = prefix.rfind('/');
        if (slash == std::string_view::npos) {
            return fs::path{"."};
        }
        if (slash == 0U) {
            return fs::path{"/"};
        }
        return fs::path{std::string{prefix.substr(0U, slash)}};
    }

    static void walk(const fs::path& root, const auto& visit) {
        std::error_code ec{};
        auto it = fs::recursive_directory_iterator{root, fs::directory_options::skip_permission_denied, ec};
        if (ec) {
            debug_log("cannot walk {}: {}"_format(root.string(), ec.message()));
            return;
        }
        for (auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec)) {
            if (ec) {
                debug_log("walk error under {}: {}"_format(root.string(), ec.message()));
                break;
            }
            if (it->is_regular_file(ec)) {
                visit(it->path());
            }
        }
    }

    // Wildcards never match a leading '.' of a path component; hidden entries need an explicit dot.
    static bool fnmatch_path(const std::string& pattern, const std::string& path) {
        return ::fnmatch(pattern.c_str(), path.c_str(), FNM_PATHNAME | FNM_PERIOD) == 0;
    }

    static bool has_hidden_component(std::string_view path) {
        return path.starts_with('.') || path.find("/."sv) != std::string_view::npos;
    }

    // Tries each way of letting the "**" segments at and after `from` consume zero or more directories.
    static bool match_globstar(std::string pattern, const std::string& path, size_t from) {
        auto star = pattern.find("**"sv, from);
        if (star == std::string::npos) {
            return fnmatch_path(pattern, path);
        }

        auto at_segment_start = star == 0U || pattern[star - 1U] == '/';
        auto at_segment_end = star + 2U == pattern.size() || pattern[star + 2U] == '/';
        if (!at_segment_start || !at_segment_end) {
            return match_globstar(std::move(pattern), path, star + 2U);
        }

        // "**" as the final segment matches everything beneath its parent
        if (star + 2U == pattern.size()) {
            auto parent = pattern.substr(0U, star);
            if (parent.empty()) {
                return !has_hidden_component(path);
            }
            parent.pop_back();
            auto slash = path.find('/', 0U);
            for (; slash != std::string::npos; slash = path.find('/', slash + 1U)) {
                if (!has_hidden_component(std::string_view{path}.substr(slash + 1U))
                    && fnmatch_path(parent, path.substr(0U, slash))) {
                    return true;
                }
            }
            return false;
        }

        // zero directories: drop "**/"
        auto collapsed = pattern;
        collapsed.erase(star, 3U);
        if (match_globstar(collapsed, path, star)) {
            return true;
        }

        // one or more directories: expand to "*/" repeated as deep as the path allows
        auto depth = static_cast<size_t>(std::ranges::count(path, '/'));
        auto expanded = pattern;
        expanded.replace(star, 3U, "*/"sv);
        for (size_t d = 0U; d < depth; ++d) {
            if (match_globstar(expanded, path, star + (d + 1U) * 2U)) {
                return true;
            }
            expanded.insert(star, "*/"sv);
        }
        return false;
    }

}  // namespace opfreq::detail

namespace opfreq {

    bool is_glob_pattern(std::string_view pattern) noexcept {
        return pattern.find_first_of("*?["sv) != std::string_view::npos;
    }

    bool glob_match(std::string_view pattern, std::string_view path) {
        return detail::match_globstar(std::string{pattern}, std::string{path}, 0U);
    }

    std::vector<fs::path> find_input_files(
            std::span<const std::string> patterns, std::span<const std::string> extensions) {
        // plain string order, so "a-b" sorts before "a/b"
        std::set<std::string> files{};

        for (const auto& pattern : patterns) {
            std::error_code ec{};
            auto as_path = fs::path{pattern};

            if (fs::is_directory(as_path, ec)) {
                detail::walk(as_path, [&](const fs::path& file) {
                    if (detail::has_extension(file, extensions)) {
                        files.insert(file.string());
                    }
                });
                continue;
            }

            if (is_glob_pattern(pattern)) {
                auto root = detail::glob_root(pattern);
                auto relative_to_cwd = !pattern.starts_with("./"sv) && root == fs::path{"."};
                detail::walk(root, [&](const fs::path& file) {
                    if (!detail::has_extension(file, extensions)) {
                        return;
                    }
                    // walking "." yields "./x"; bare patterns are written against "x"
                    auto candidate = file.generic_string();
                    if (relative_to_cwd && candidate.starts_with("./"sv)) {
                        candidate.erase(0U, 2U);
                    }
                    if (glob_match(pattern, candidate)) {
                        files.insert(std::move(candidate));
                    }
                });
                continue;
            }

            if (detail::is_regular_file(as_path) && detail::has_extension(as_path, extensions)) {
                files.insert(as_path.string());
            }
            else {
                debug_log("pattern matched nothing: {}"_format(pattern));
            }
        }

        debug_log("discovered {} file(s)"_format(files.size()));
        std::vector<fs::path> ordered{};
        ordered.reserve(files.size());
        for (const auto& file : files) {
            ordered.emplace_back(file);
        }
        return ordered;
    }

}  // namespace opfreq
