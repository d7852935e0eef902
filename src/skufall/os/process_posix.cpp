#if !defined(_WIN32)

#include "skufall/os/process.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace skufall::os {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n,
                    std::size_t limit, bool& truncated) {
    if (n <= 0) return;
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<std::size_t>(n)) truncated = true;
}

/// Poll for exit for up to @p grace. Returns true once the child is reaped.
bool reap_within(pid_t pid, int& status, std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) return true;
        if (w < 0 && errno != EINTR) return true; // nothing left to wait for
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void reap_blocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

/// SIGTERM the child's process group, escalate to SIGKILL after the grace period.
void terminate_group(pid_t pid, int& status) {
    ::kill(-pid, SIGTERM);
    if (!reap_within(pid, status, std::chrono::milliseconds(config::constants::TERMINATE_GRACE_MS))) {
        ::kill(-pid, SIGKILL);
        reap_blocking(pid, status);
    }
}

bool is_executable_file(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;
    if (spec.command.empty()) {
        result.error_message = "empty command";
        return result;
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> all;
    all.reserve(spec.args.size() + 1);
    all.push_back(spec.command);
    all.insert(all.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& s : all) argv.push_back(s.data());
    argv.push_back(nullptr);
    const std::string exec_failed = "failed to execute '" + spec.command + "'\n";

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string("fork: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        const ssize_t ignored = ::write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
        (void)ignored;
        ::_exit(config::constants::EXIT_CODE_MISSING_BINARY);
    }

    ::setpgid(pid, pid); // also done in the child; whichever runs first wins
    result.started = true;
    ::close(fds[1]);
    const int fd = fds[0];

    const auto start = std::chrono::steady_clock::now();
    char buf[4096];
    int status = 0;
    bool eof = false;
    while (!eof) {
        int wait_ms = -1;
        if (spec.timeout.count() > 0) {
            const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            const auto left = spec.timeout - spent;
            if (left.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = left.count() > INT_MAX ? INT_MAX : static_cast<int>(left.count());
        }

        pollfd pfd{fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::string("poll: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue; // deadline re-checked at the top

        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(result.output, buf, n, spec.max_output_bytes, result.truncated);
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof = true;
        }
    }
    ::close(fd);

    if (result.timed_out || !result.error_message.empty()) {
        terminate_group(pid, status);
    } else {
        reap_blocking(pid, status);
    }

    if (result.truncated) result.output += "\n(output truncated)";

    if (result.timed_out) {
        result.exit_code = config::constants::EXIT_CODE_TIMED_OUT;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::optional<std::string> find_in_path(std::string_view name) {
    if (name.empty()) return std::nullopt;
    const std::string n{name};
    if (n.find('/') != std::string::npos) {
        return is_executable_file(n) ? std::optional<std::string>{n} : std::nullopt;
    }

    const char* env = std::getenv("PATH");
    const std::string path = env ? env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t begin = 0;
    while (begin <= path.size()) {
        const std::size_t end = std::min(path.find(':', begin), path.size());
        std::string dir = path.substr(begin, end - begin);
        if (dir.empty()) dir = "."; // empty PATH entry means the working directory
        const std::string candidate = dir + "/" + n;
        if (is_executable_file(candidate)) return candidate;
        begin = end + 1;
    }
    return std::nullopt;
}

} // namespace skufall::os
#endif
