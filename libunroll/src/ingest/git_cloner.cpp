#include "../../include/cloner.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace unroll {

namespace {

constexpr std::string_view kTag = "GitCloner";
constexpr std::size_t kMaxDiagnosticBytes = 64 * 1024;

std::string trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string errno_message(const int err) {
    return std::strerror(err);
}

/// Owns a file descriptor; closes it on destruction.
class Fd {
public:
    explicit Fd(int fd = -1) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    void reset() {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
};

/// posix_spawn bookkeeping released in one place.
struct SpawnSetup {
    posix_spawn_file_actions_t actions{};
    posix_spawnattr_t attr{};

    SpawnSetup() {
        posix_spawn_file_actions_init(&actions);
        posix_spawnattr_init(&attr);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

// returns false once the pipe reached EOF
bool drain(const int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            const auto room = kMaxDiagnosticBytes - std::min(out.size(), kMaxDiagnosticBytes);
            out.append(buf, std::min(static_cast<std::size_t>(n), room));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

GitCloner::GitCloner(std::string git_binary) : git_binary_(std::move(git_binary)) {}

std::vector<std::string> GitCloner::hardened_environment() {
    static const std::vector<std::pair<std::string, std::string>> kOverrides = {
        {"GIT_TERMINAL_PROMPT", "0"},
        {"GIT_ASKPASS", "echo"},
        {"GIT_SSH_COMMAND", "ssh -oBatchMode=yes"},
    };

    std::vector<std::string> env;
    for (char** it = environ; it && *it; ++it) {
        const std::string_view entry(*it);
        const bool overridden = std::any_of(kOverrides.begin(), kOverrides.end(), [&](const auto& kv) {
            return entry.starts_with(kv.first + "=");
        });
        if (!overridden)
            env.emplace_back(entry);
    }
    for (const auto& [key, value] : kOverrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

void GitCloner::clone(const RepoUrl& url,
                      const std::filesystem::path& destination,
                      const std::chrono::seconds timeout) {
    run_clone(url.clone_url(), destination, timeout);
}

void GitCloner::run_clone(const std::string& url,
                          const std::filesystem::path& destination,
                          const std::chrono::seconds timeout) const {
    std::vector<std::string> args = {
        git_binary_, "clone", "--depth", "1", "--quiet", "--", url, destination.string()
    };
    std::vector<std::string> env = hardened_environment();

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        throw IngestError(ErrorKind::Internal, "pipe failed: " + errno_message(errno));
    }
    Fd read_end(pipe_fds[0]);
    Fd write_end(pipe_fds[1]);
    // only our end polls; the child's stderr stays blocking
    ::fcntl(read_end.get(), F_SETFL, ::fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

    SpawnSetup setup;
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, write_end.get(), STDERR_FILENO);
    posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&setup.attr, 0);

    Logger::log(LogLevel::Debug, "Spawning: " + git_binary_ + " clone --depth 1 -- " + url, kTag);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, git_binary_.c_str(), &setup.actions, &setup.attr,
                                  argv.data(), envp.data());
    write_end.reset();
    if (rc != 0) {
        Logger::log(LogLevel::Error, "Failed to start " + git_binary_ + ": " + errno_message(rc), kTag);
        throw IngestError(ErrorKind::AcquisitionFailed, "Failed to start git: " + errno_message(rc));
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + timeout;
    std::string diagnostics;
    bool pipe_open = true;
    int status = 0;

    for (;;) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid)
            break;
        if (done < 0 && errno != EINTR) {
            throw IngestError(ErrorKind::Internal, "waitpid failed: " + errno_message(errno));
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::kill(-pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            Logger::log(LogLevel::Warning,
                "Clone exceeded " + std::to_string(timeout.count()) + "s, killed: " + url, kTag);
            throw IngestError(ErrorKind::AcquisitionTimeout, "Git clone timed out");
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, 100));
        if (pipe_open) {
            pollfd pfd{read_end.get(), POLLIN, 0};
            if (::poll(&pfd, 1, wait_ms) > 0) {
                pipe_open = drain(read_end.get(), diagnostics);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        }
    }
    if (pipe_open) {
        drain(read_end.get(), diagnostics);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string message = trim(diagnostics);
        if (message.empty())
            message = "Git clone failed";
        Logger::log(LogLevel::Error, "Clone failed for " + url + ": " + message, kTag);
        throw IngestError(ErrorKind::AcquisitionFailed, message);
    }

    Logger::log(LogLevel::Info,
        "Cloned " + url + " in " + std::to_string(elapsed.count()) + " ms", kTag);
}

} // namespace unroll
