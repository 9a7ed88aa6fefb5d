#pragma once

#include "opfreq.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/opcode.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace opfreq::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Restores the working directory on scope exit.
    struct cwd_guard {
        fs::path previous{fs::current_path()};

        explicit cwd_guard(const fs::path& next) { fs::current_path(next); }

        ~cwd_guard() {
            std::error_code ec{};
            fs::current_path(previous, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec,
                fs::perm_options::replace);
    }

    // Canned disassembly keyed by file path; unknown paths fail with exit code 1.
    class fake_source final : public disassembly_source {
      public:
        fake_source& succeed(const fs::path& file, std::string text) {
            canned[file.string()] = disassembly_result{.success = true, .exit_code = 0, .text = std::move(text)};
            return *this;
        }

        fake_source& fail(const fs::path& file, int exit_code = 1, std::string diagnostics = {}) {
            canned[file.string()] =
                    disassembly_result{.success = false, .exit_code = exit_code, .diagnostics = std::move(diagnostics)};
            return *this;
        }

        disassembly_result disassemble(const fs::path& file) override {
            {
                std::lock_guard lock{mutex};
                calls.push_back(file.string());
            }
            if (auto it = canned.find(file.string()); it != canned.end()) {
                return it->second;
            }
            return disassembly_result{.success = false, .exit_code = 1, .diagnostics = "no canned output"};
        }

        std::vector<std::string> invoked() {
            std::lock_guard lock{mutex};
            return calls;
        }

      private:
        std::map<std::string, disassembly_result> canned{};
        std::mutex mutex{};
        std::vector<std::string> calls{};
    };

}  // namespace opfreq::test::detail
