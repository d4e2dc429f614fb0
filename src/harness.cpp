#include "plansync/harness.hpp"

#include "plansync/format.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>

using namespace plansync::literals;

namespace plansync {

    namespace detail {

        struct pipe_fds {
            int read_fd{-1};
            int write_fd{-1};

            explicit pipe_fds(int flags = 0) {
                int fds[2]{};
                if (::pipe2(fds, flags) != 0) {
                    throw std::runtime_error("pipe failed: {}"_format(std::strerror(errno)));
                }
                read_fd = fds[0];
                write_fd = fds[1];
            }

            ~pipe_fds() {
                close_read();
                close_write();
            }

            pipe_fds(const pipe_fds&) = delete;
            pipe_fds& operator=(const pipe_fds&) = delete;

            void close_read() {
                if (read_fd >= 0) {
                    ::close(read_fd);
                    read_fd = -1;
                }
            }

            void close_write() {
                if (write_fd >= 0) {
                    ::close(write_fd);
                    write_fd = -1;
                }
            }
        };

        static std::string drain(int fd) {
            std::string out{};
            std::array<char, 4096> buf{};
            while (true) {
                auto n = ::read(fd, buf.data(), buf.size());
                if (n > 0) {
                    out.append(buf.data(), static_cast<size_t>(n));
                    continue;
                }
                if (n == 0) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("failed to read harness output: {}"_format(std::strerror(errno)));
            }
            return out;
        }

        static int wait_for(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw std::runtime_error("waitpid failed: {}"_format(std::strerror(errno)));
                }
            }

            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        enum class child_stage : int { redirect, chdir, exec };

        // Written by the child over the close-on-exec error pipe when it cannot become the harness
        struct child_error {
            child_stage stage{child_stage::exec};
            int error{0};
        };

        [[noreturn]] static void fail_child(int fd, child_stage stage) {
            child_error err{.stage = stage, .error = errno};
            auto written = ::write(fd, &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        // EOF without a record means exec succeeded
        static std::optional<child_error> read_child_error(int fd) {
            child_error err{};
            while (true) {
                auto n = ::read(fd, &err, sizeof(err));
                if (n == static_cast<ssize_t>(sizeof(err))) {
                    return err;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                return std::nullopt;
            }
        }

    }  // namespace detail

    harness_request make_harness_request(const reconcile_config& cfg) {
        return harness_request{
                .command = cfg.harness_command,
                .filter_flag = cfg.filter_flag,
                .filter = cfg.filter,
                .working_dir = cfg.working_dir};
    }

    std::vector<std::string> harness_argv(const harness_request& request) {
        auto args = request.command;
        if (!request.filter.empty()) {
            if (!request.filter_flag.empty()) {
                args.push_back(request.filter_flag);
            }
            args.push_back(request.filter);
        }
        return args;
    }

    harness_result run_process_harness(const harness_request& request) {
        auto args = harness_argv(request);
        if (args.empty()) {
            throw std::runtime_error("harness command is empty");
        }

        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto working_dir = request.working_dir.string();

        detail::pipe_fds output_pipe{O_CLOEXEC};
        detail::pipe_fds error_pipe{O_CLOEXEC};
        debug_log("running harness: ", args.front(), " in ", working_dir);

        auto pid = ::fork();
        if (pid < 0) {
            throw std::runtime_error("fork failed: {}"_format(std::strerror(errno)));
        }

        if (pid == 0) {
            if (::dup2(output_pipe.write_fd, STDOUT_FILENO) < 0 || ::dup2(output_pipe.write_fd, STDERR_FILENO) < 0) {
                detail::fail_child(error_pipe.write_fd, detail::child_stage::redirect);
            }

            if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
                detail::fail_child(error_pipe.write_fd, detail::child_stage::chdir);
            }

            ::execvp(argv[0], argv.data());
            detail::fail_child(error_pipe.write_fd, detail::child_stage::exec);
        }

        output_pipe.close_write();
        error_pipe.close_write();

        if (auto err = detail::read_child_error(error_pipe.read_fd)) {
            output_pipe.close_read();
            (void)detail::wait_for(pid);
            auto reason = std::strerror(err->error);
            switch (err->stage) {
                case detail::child_stage::redirect:
                    throw std::runtime_error("failed to redirect harness output: {}"_format(reason));
                case detail::child_stage::chdir:
                    throw std::runtime_error("failed to enter harness working dir {}: {}"_format(working_dir, reason));
                case detail::child_stage::exec:
                    break;
            }
            throw std::runtime_error("failed to exec harness {}: {}"_format(args.front(), reason));
        }
        error_pipe.close_read();

        harness_result result{};
        try {
            result.output = detail::drain(output_pipe.read_fd);
        } catch (const std::exception&) {
            output_pipe.close_read();
            (void)detail::wait_for(pid);
            throw;
        }
        result.exit_code = detail::wait_for(pid);

        debug_log("harness exited with ", result.exit_code, " (", result.output.size(), " bytes)");
        return result;
    }

}  // namespace plansync
