#include <coloc/host/subprocess.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string_view>
#include <utility>

namespace coloc::host {

using core::Error;
using core::ErrorKind;

namespace {

/// Pipe whose ends are closed on scope exit unless released.
class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    Pipe(Pipe&&) = delete;
    Pipe& operator=(Pipe&&) = delete;

    [[nodiscard]] bool open() { return ::pipe2(fds_.data(), O_CLOEXEC) == 0; }

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() noexcept {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    std::array<int, 2> fds_{-1, -1};
};

std::vector<char*> to_argv(std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (auto& arg : args) {
        out.push_back(arg.data());
    }
    out.push_back(nullptr);
    return out;
}

// Only async-signal-safe calls from here until exec.
[[noreturn]] void fail_child(int report_fd) {
    int err = errno;
    [[maybe_unused]] auto written = ::write(report_fd, &err, sizeof(err));
    ::_exit(127);
}

void reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

void replace_all(std::string& text, std::string_view from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

int exit_code_of(int wait_status) noexcept {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

core::Result<pid_t> spawn_process(const std::vector<std::string>& argv,
                                  const SpawnOptions& options) {
    if (argv.empty()) {
        return Error{ErrorKind::Permanent, "empty command"};
    }

    // Everything the child needs is prepared before fork.
    auto args = argv;
    auto c_argv = to_argv(args);
    cpu_set_t affinity;
    CPU_ZERO(&affinity);
    if (options.cores) {
        for (auto cpu : *options.cores) {
            CPU_SET(cpu, &affinity);
        }
    }
    const std::string output_path = options.output ? options.output->string() : "/dev/null";
    const int output_flags = options.output ? (O_WRONLY | O_CREAT | O_APPEND) : O_WRONLY;

    Pipe report;
    if (!report.open()) {
        return Error{ErrorKind::Transient, std::string("pipe: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorKind::Transient, std::string("fork: ") + std::strerror(errno)};
    }
    if (pid == 0) {
        report.close_read();
        if (options.new_process_group && ::setpgid(0, 0) != 0) {
            fail_child(report.write_end());
        }
        if (options.cores && ::sched_setaffinity(0, sizeof(affinity), &affinity) != 0) {
            fail_child(report.write_end());
        }
        int null_in = ::open("/dev/null", O_RDONLY);
        int out = ::open(output_path.c_str(), output_flags, 0644);
        if (null_in < 0 || out < 0 || ::dup2(null_in, STDIN_FILENO) < 0 ||
            ::dup2(out, STDOUT_FILENO) < 0 || ::dup2(out, STDERR_FILENO) < 0) {
            fail_child(report.write_end());
        }
        ::execvp(c_argv[0], c_argv.data());
        fail_child(report.write_end());
    }

    report.close_write();
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(report.read_end(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    if (got > 0) {
        reap(pid);
        return Error{ErrorKind::Permanent,
                     "cannot execute '" + argv.front() + "': " + std::strerror(child_errno)};
    }
    return pid;
}

core::Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                        core::Duration timeout) {
    if (argv.empty()) {
        return Error{ErrorKind::Permanent, "empty command"};
    }

    auto args = argv;
    auto c_argv = to_argv(args);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe report;
    if (!out_pipe.open() || !err_pipe.open() || !report.open()) {
        return Error{ErrorKind::Transient, std::string("pipe: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorKind::Transient, std::string("fork: ") + std::strerror(errno)};
    }
    if (pid == 0) {
        report.close_read();
        int null_in = ::open("/dev/null", O_RDONLY);
        if (null_in < 0 || ::dup2(null_in, STDIN_FILENO) < 0 ||
            ::dup2(out_pipe.write_end(), STDOUT_FILENO) < 0 ||
            ::dup2(err_pipe.write_end(), STDERR_FILENO) < 0) {
            fail_child(report.write_end());
        }
        ::execvp(c_argv[0], c_argv.data());
        fail_child(report.write_end());
    }

    out_pipe.close_write();
    err_pipe.close_write();
    report.close_write();

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(report.read_end(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got > 0) {
        reap(pid);
        auto kind = child_errno == ENOENT || child_errno == EACCES ? ErrorKind::Permanent
                                                                   : ErrorKind::Transient;
        return Error{kind, "cannot execute '" + argv.front() + "': " + std::strerror(child_errno)};
    }

    CommandOutput output;
    const auto deadline = std::chrono::steady_clock::now() + timeout.to_chrono();
    std::array<pollfd, 2> fds{{{out_pipe.read_end(), POLLIN, 0}, {err_pipe.read_end(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&output.out, &output.err};
    std::array<char, 4096> buffer{};
    int open_streams = 2;

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            ::kill(pid, SIGKILL);
            reap(pid);
            return Error{ErrorKind::Transient, "'" + join_command(argv) + "' timed out after " +
                                                   std::to_string(timeout.milliseconds()) + " ms"};
        }
        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(pid, SIGKILL);
            reap(pid);
            return Error{ErrorKind::Transient, std::string("poll: ") + std::strerror(errno)};
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            auto count = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (count > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        return Error{ErrorKind::Transient, std::string("waitpid: ") + std::strerror(errno)};
    }
    output.exit_code = exit_code_of(status);
    return output;
}

std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                             uint32_t threads, const core::CoreSet& cores) {
    const auto thread_text = std::to_string(threads);
    const auto core_text = cores.to_cpuset();
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (auto arg : argv) {
        replace_all(arg, "{threads}", thread_text);
        replace_all(arg, "{cores}", core_text);
        out.push_back(std::move(arg));
    }
    return out;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

} // namespace coloc::host
