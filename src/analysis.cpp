#include "opfreq/analysis.hpp"

#include "opfreq/format.hpp"
#include "opfreq/utils.hpp"

#include "internal/opcode.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace opfreq::literals;

namespace opfreq::detail {

    struct process_output {
        int exit_code{};
        bool timed_out{false};
        std::string stdout_text{};
        std::string stderr_text{};
    };

    struct pipe_pair {
        std::array<int, 2> fds{-1, -1};

        pipe_pair() {
            if (::pipe2(fds.data(), O_CLOEXEC) < 0) {
                throw std::runtime_error("pipe failed: errno {}"_format(errno));
            }
        }

        pipe_pair(const pipe_pair&) = delete;
        pipe_pair& operator=(const pipe_pair&) = delete;

        ~pipe_pair() {
            close_read();
            close_write();
        }

        int read_end() const noexcept { return fds[0]; }
        int write_end() const noexcept { return fds[1]; }

        void close_read() noexcept {
            if (fds[0] >= 0) {
                ::close(fds[0]);
                fds[0] = -1;
            }
        }

        void close_write() noexcept {
            if (fds[1] >= 0) {
                ::close(fds[1]);
                fds[1] = -1;
            }
        }
    };

    static int decode_wait_status(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

    static int wait_for_child(pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::runtime_error("waitpid failed: errno {}"_format(errno));
            }
        }
        return decode_wait_status(status);
    }

    // Polls for the child's exit until `deadline`; std::nullopt means it is still running.
    static std::optional<int> wait_for_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
        int status = 0;
        while (true) {
            auto reaped = ::waitpid(pid, &status, WNOHANG);
            if (reaped == pid) {
                return decode_wait_status(status);
            }
            if (reaped < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("waitpid failed: errno {}"_format(errno));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
    }

    // Returns false once the descriptor reached end-of-file.
    static bool drain_fd(int fd, std::string& sink) {
        std::array<char, 8192> buffer{};
        while (true) {
            auto n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            return false;
        }
    }

    /*
     * Forks and execs `args`, collecting stdout and stderr in memory. Both pipes are polled
     * together so a child that fills one of them never blocks. With a positive `timeout_ms`
     * the child is killed once the budget is spent and the result is flagged as timed out.
     */
    static process_output run_process(const std::vector<std::string>& args, int timeout_ms) {
        if (args.empty()) {
            throw std::runtime_error("run_process requires a command");
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pipe_pair out_pipe{};
        pipe_pair err_pipe{};

        auto pid = ::fork();
        if (pid < 0) {
            throw std::runtime_error("fork failed: errno {}"_format(errno));
        }

        if (pid == 0) {
            auto null_fd = ::open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
            }
            if (::dup2(out_pipe.write_end(), STDOUT_FILENO) < 0) {
                _exit(exit_code_exec_failed);
            }
            if (::dup2(err_pipe.write_end(), STDERR_FILENO) < 0) {
                _exit(exit_code_exec_failed);
            }

            ::execvp(argv[0], argv.data());
            _exit(exit_code_exec_failed);
        }

        out_pipe.close_write();
        err_pipe.close_write();
        ::fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
        ::fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

        process_output output{};
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds{timeout_ms};

        std::array<pollfd, 2> fds{
                pollfd{.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
                pollfd{.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0}};

        while (fds[0].fd >= 0 || fds[1].fd >= 0) {
            auto wait_ms = -1;
            if (timeout_ms > 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    output.timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(remaining.count());
            }

            auto ready = ::poll(fds.data(), fds.size(), wait_ms);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto poll_errno = errno;
                ::kill(pid, SIGKILL);
                wait_for_child(pid);
                throw std::runtime_error("poll failed: errno {}"_format(poll_errno));
            }
            if (ready == 0) {
                continue;
            }

            for (size_t i = 0U; i < fds.size(); ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }
                auto& sink = i == 0U ? output.stdout_text : output.stderr_text;
                if (!drain_fd(fds[i].fd, sink)) {
                    fds[i].fd = -1;
                }
            }
        }

        // a child may close both pipes and keep running, so the reap honours the deadline too
        if (!output.timed_out && timeout_ms > 0) {
            if (auto code = wait_for_child_until(pid, deadline)) {
                output.exit_code = *code;
                return output;
            }
            output.timed_out = true;
        }

        if (output.timed_out) {
            ::kill(pid, SIGKILL);
            wait_for_child(pid);
            output.exit_code = exit_code_timed_out;
            return output;
        }

        output.exit_code = wait_for_child(pid);
        return output;
    }

    struct file_slot {
        disassembly_result result{};
        opcode_counts counts{};
    };

    static file_slot process_file(disassembly_source& source, const fs::path& file) {
        file_slot slot{};
        try {
            slot.result = source.disassemble(file);
        } catch (const std::exception& e) {
            slot.result = disassembly_result{.success = false, .exit_code = -1, .diagnostics = e.what()};
        }

        if (slot.result.success) {
            slot.counts = opcode::extract_opcodes(slot.result.text);
        }
        debug_log("{} -> exit {} ({} opcodes)"_format(
                file.string(), slot.result.exit_code, slot.result.success ? slot.counts.size() : 0U));
        return slot;
    }

}  // namespace opfreq::detail

namespace opfreq {

    std::vector<std::string> process_disassembly_source::command_for(const fs::path& file) const {
        std::vector<std::string> command{};
        command.reserve(opts.compiler_args.size() + 2U);
        command.push_back(opts.compiler_path.string());
        command.insert(command.end(), opts.compiler_args.begin(), opts.compiler_args.end());
        command.push_back(file.string());
        return command;
    }

    disassembly_result process_disassembly_source::disassemble(const fs::path& file) {
        auto output = detail::run_process(command_for(file), opts.timeout_ms);

        disassembly_result result{};
        result.exit_code = output.exit_code;
        result.success = !output.timed_out && output.exit_code == 0;
        result.diagnostics = opcode::sanitize_utf8(output.stderr_text);

        if (output.timed_out) {
            result.diagnostics = "timed out after {} ms"_format(opts.timeout_ms);
        }
        else if (output.exit_code == exit_code_exec_failed && result.diagnostics.empty()) {
            result.diagnostics = "failed to execute {}"_format(opts.compiler_path.string());
        }

        if (result.success) {
            result.text = opcode::sanitize_utf8(output.stdout_text);
        }
        return result;
    }

    uint64_t run_result::total_opcodes() const noexcept {
        return std::accumulate(
                aggregate.begin(), aggregate.end(), uint64_t{0U}, [](uint64_t sum, const auto& entry) {
                    return sum + entry.second;
                });
    }

    void opcode_aggregator::merge(opcode_counts& into, const opcode_counts& addition) {
        for (const auto& [name, count] : addition) {
            into[name] += count;
        }
    }

    void opcode_aggregator::add_success(
            std::string path, opcode_counts counts, std::optional<std::string> disassembly) {
        ++result.succeeded;
        merge(result.aggregate, counts);
        if (disassembly) {
            result.disassembly.push_back(file_disassembly{.path = path, .text = std::move(*disassembly)});
        }
        result.per_file.push_back(file_counts{.path = std::move(path), .counts = std::move(counts)});
    }

    void opcode_aggregator::add_failure(file_failure failure) {
        ++result.failed;
        result.failures.push_back(std::move(failure));
    }

    opcode_counts extract_opcodes(std::string_view disassembly) {
        return opcode::extract_opcodes(disassembly);
    }

    run_result run_analysis(const analysis_request& request, disassembly_source& source) {
        const auto& files = request.files;
        std::vector<detail::file_slot> slots(files.size());

        auto workers = std::min<size_t>(std::max(request.jobs, 1U), files.size());
        debug_log("analyzing {} file(s) with {} worker(s)"_format(files.size(), workers));

        if (workers <= 1U) {
            for (size_t i = 0U; i < files.size(); ++i) {
                slots[i] = detail::process_file(source, files[i]);
            }
        }
        else {
            std::atomic<size_t> cursor{0U};
            {
                std::vector<std::jthread> pool{};
                pool.reserve(workers);
                for (size_t w = 0U; w < workers; ++w) {
                    pool.emplace_back([&] {
                        for (auto i = cursor.fetch_add(1U); i < files.size(); i = cursor.fetch_add(1U)) {
                            slots[i] = detail::process_file(source, files[i]);
                        }
                    });
                }
            }
        }

        // merge in input order so the report never depends on completion order
        opcode_aggregator aggregator{};
        for (size_t i = 0U; i < files.size(); ++i) {
            auto& slot = slots[i];
            auto path = files[i].string();
            if (slot.result.success) {
                std::optional<std::string> text{};
                if (request.keep_disassembly) {
                    text = std::move(slot.result.text);
                }
                aggregator.add_success(std::move(path), std::move(slot.counts), std::move(text));
            }
            else {
                aggregator.add_failure(
                        file_failure{
                                .path = std::move(path),
                                .exit_code = slot.result.exit_code,
                                .diagnostics = std::move(slot.result.diagnostics)});
            }
        }

        return std::move(aggregator).finish();
    }

}  // namespace opfreq
