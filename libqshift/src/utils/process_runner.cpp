#include "../../include/process_runner.hpp"
#include "../../include/errors.hpp"
#include "../../include/heartbeat.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace qshift {

namespace {

constexpr size_t kStderrTailBytes = 64 * 1024;
constexpr size_t kStdoutLimitBytes = 16 * 1024 * 1024;
constexpr auto kTermGrace = std::chrono::seconds(3);
constexpr int kPollTimeoutMs = 100;

std::optional<double> parse_double(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr == text.data()) return std::nullopt;
    return value;
}

/// @return The token following `key` (spaces after '=' skipped), or empty.
std::string_view field_after(std::string_view line, std::string_view key) {
    const auto pos = line.find(key);
    if (pos == std::string_view::npos) return {};
    auto rest = line.substr(pos + key.size());
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    const auto end = rest.find(' ');
    return rest.substr(0, end);
}

bool contains_error(std::string_view line) {
    return line.find("Error") != std::string_view::npos ||
           line.find("error") != std::string_view::npos;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Terminates the child: SIGTERM, wait up to the grace period, then SIGKILL.
void terminate_child(const pid_t pid) {
    ::kill(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    Logger::log(LogLevel::Warning, "child " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL",
                "Process");
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

} // namespace

std::optional<double> ProgressParser::parse_timestamp(std::string_view text) {
    const auto c1 = text.find(':');
    if (c1 == std::string_view::npos) return std::nullopt;
    const auto c2 = text.find(':', c1 + 1);
    if (c2 == std::string_view::npos) return std::nullopt;
    const auto h = parse_double(text.substr(0, c1));
    const auto m = parse_double(text.substr(c1 + 1, c2 - c1 - 1));
    const auto s = parse_double(text.substr(c2 + 1));
    if (!h || !m || !s) return std::nullopt;
    return *h * 3600.0 + *m * 60.0 + *s;
}

std::optional<ProgressSample> ProgressParser::parse_line(std::string_view line) {
    if (line.find("frame=") == std::string_view::npos &&
        line.find("time=") == std::string_view::npos) {
        return std::nullopt;
    }

    ProgressSample sample;
    if (const auto f = field_after(line, "frame="); !f.empty()) {
        std::uint64_t frame = 0;
        if (std::from_chars(f.data(), f.data() + f.size(), frame).ec == std::errc()) {
            sample.frame = frame;
        }
    }
    if (const auto f = field_after(line, "fps="); !f.empty()) {
        sample.fps = parse_double(f);
    }
    if (const auto f = field_after(line, "time="); !f.empty()) {
        sample.time_secs = parse_timestamp(f);
    }
    if (auto f = field_after(line, "speed="); !f.empty()) {
        if (f.back() == 'x') f.remove_suffix(1);
        sample.speed = parse_double(f);
    }

    if (!sample.frame && !sample.time_secs) return std::nullopt;
    return sample;
}

std::string format_error_tail(std::string_view stderr_text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= stderr_text.size()) {
        const auto end = stderr_text.find_first_of("\r\n", start);
        const auto line = stderr_text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!line.empty()) lines.push_back(line);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (contains_error(*it)) return std::string(*it);
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!ProgressParser::parse_line(*it)) return std::string(*it);
    }
    return "Unknown ffmpeg error";
}

bool program_available(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;
    std::string_view paths(path_env);
    while (!paths.empty()) {
        const auto sep = paths.find(':');
        const auto dir = paths.substr(0, sep);
        const auto candidate = std::filesystem::path(dir.empty() ? "." : std::string(dir)) / program;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
        if (sep == std::string_view::npos) break;
        paths.remove_prefix(sep + 1);
    }
    return false;
}

ProcessResult run_process(const std::vector<std::string>& argv, const CallContext& ctx) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty argv");
    }
    if (ctx.stop.stop_requested()) {
        throw OperationCancelled("cancelled before start: " + argv.front());
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::system_error(err, std::generic_category(), "pipe2");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Logger::log(LogLevel::Debug, join_argv(argv), "Process");

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        const int err = errno;
        [[maybe_unused]] const auto n = ::write(exec_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    ProcessResult result;

    // exec_pipe is closed on a successful exec, so this read returns 0.
    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.termination = ProcessResult::Termination::SpawnFailed;
        result.stderr_text = argv.front() + ": " + std::strerror(exec_errno);
        return result;
    }

    std::optional<HeartbeatSupervisor::Handle> beat;
    if (ctx.heartbeat) {
        beat.emplace(ctx.heartbeat->begin(ctx.label.empty() ? argv.front() : ctx.label));
    }

    std::string line_buffer;
    auto consume_stderr = [&](const char* data, const size_t n) {
        result.stderr_text.append(data, n);
        if (result.stderr_text.size() > 2 * kStderrTailBytes) {
            result.stderr_text.erase(0, result.stderr_text.size() - kStderrTailBytes);
        }
        line_buffer.append(data, n);
        size_t start = 0;
        for (;;) {
            const auto end = line_buffer.find_first_of("\r\n", start);
            if (end == std::string::npos) break;
            if (beat && ProgressParser::parse_line(std::string_view(line_buffer).substr(start, end - start))) {
                beat->progress();
            }
            start = end + 1;
        }
        line_buffer.erase(0, start);
        if (line_buffer.size() > kStderrTailBytes) line_buffer.clear();
    };

    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    char buf[8192];
    bool cancelled = false;
    bool stuck = false;

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (ctx.stop.stop_requested()) {
            cancelled = true;
            break;
        }
        if (beat && beat->stuck()) {
            stuck = true;
            break;
        }

        const int rc = ::poll(fds, 2, kPollTimeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            terminate_child(pid);
            throw std::system_error(err, std::generic_category(), "poll");
        }
        if (rc == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                continue;
            }
            if (i == 0) {
                if (result.stdout_text.size() < kStdoutLimitBytes) {
                    result.stdout_text.append(buf, static_cast<size_t>(n));
                }
            } else {
                consume_stderr(buf, static_cast<size_t>(n));
            }
        }
    }
    out_pipe[0] = fds[0].fd;
    err_pipe[0] = fds[1].fd;
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (result.stderr_text.size() > kStderrTailBytes) {
        result.stderr_text.erase(0, result.stderr_text.size() - kStderrTailBytes);
    }

    if (cancelled) {
        terminate_child(pid);
        throw OperationCancelled("cancelled: " + (ctx.label.empty() ? argv.front() : ctx.label));
    }
    if (stuck) {
        terminate_child(pid);
        result.termination = ProcessResult::Termination::Stuck;
        return result;
    }

    // Both pipes are closed; the child may still be running without output.
    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (ctx.stop.stop_requested()) {
            terminate_child(pid);
            throw OperationCancelled("cancelled: " + (ctx.label.empty() ? argv.front() : ctx.label));
        }
        if (beat && beat->stuck()) {
            terminate_child(pid);
            result.termination = ProcessResult::Termination::Stuck;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs / 4));
    }
    if (WIFEXITED(status)) {
        result.termination = ProcessResult::Termination::Exited;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termination = ProcessResult::Termination::Signaled;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace qshift
