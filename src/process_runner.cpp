#include "process_runner.hpp"
#include "droid_log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace droid {

namespace {

// argv storage must outlive fork(); the child only touches the raw pointers
std::vector<char*> makeArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

std::string joinArgv(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

// exec failure in the child is reported through exit code 127, like a shell
constexpr int EXEC_FAILED = 127;

} // anonymous namespace

// =============================================================================
// runProcess
// =============================================================================

Result<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
    if (argv.empty() || argv[0].empty()) {
        return Err(ErrorCode::Configuration, "empty command line");
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Err(ErrorCode::Io, std::string("pipe failed: ") + std::strerror(errno));
    }
    auto cargv = makeArgv(argv);

    DLOG_DEBUG("proc", "exec: %s", joinArgv(argv).c_str());
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Err(ErrorCode::Io, std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        ::close(fds[0]);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[1]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(EXEC_FAILED);
    }

    ::close(fds[1]);
    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            DLOG_WARN("proc", "poll failed: %s", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;  // loop re-evaluates the deadline

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;  // EOF: child closed its output
        size_t room = MAX_PROCESS_OUTPUT - std::min(result.output.size(), MAX_PROCESS_OUTPUT);
        result.output.append(buf, std::min(static_cast<size_t>(n), room));
    }
    ::close(fds[0]);

    if (result.timed_out) {
        DLOG_WARN("proc", "Timeout (%lldms), killing: %s",
                  (long long)timeout.count(), joinArgv(argv).c_str());
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Err(ErrorCode::Io, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    result.exit_code = decodeStatus(status);

    if (!result.timed_out && result.exit_code == EXEC_FAILED && result.output.empty()) {
        return Err(ErrorCode::Io, "could not execute '" + argv[0] + "'");
    }
    return result;
}

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

// =============================================================================
// ChildProcess
// =============================================================================

Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return Err(ErrorCode::Configuration, "empty command line");
    }
    // Report a missing binary synchronously instead of as an early exit
    if (!findExecutable(argv[0])) {
        return Err(ErrorCode::Io, "'" + argv[0] + "' not found in PATH");
    }
    auto cargv = makeArgv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err(ErrorCode::Io, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        ::_exit(EXEC_FAILED);
    }
    // Also set from the parent so terminate() cannot race the child's setpgid
    ::setpgid(pid, pid);

    DLOG_INFO("proc", "Spawned pid %d: %s", (int)pid, joinArgv(argv).c_str());
    return ChildProcess(pid);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.reaped_ = true;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !reaped_) terminate();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = true;
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) terminate();
}

bool ChildProcess::hasExited() {
    if (pid_ <= 0 || reaped_) return true;
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        reaped_ = true;
        exit_code_ = decodeStatus(status);
        DLOG_INFO("proc", "pid %d exited (code %d)", (int)pid_, exit_code_);
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        reaped_ = true;  // reaped elsewhere
        return true;
    }
    return false;
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (hasExited()) return;

    DLOG_INFO("proc", "Terminating pid %d", (int)pid_);
    ::kill(-pid_, SIGTERM);
    ::kill(pid_, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (hasExited()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    DLOG_WARN("proc", "pid %d ignored SIGTERM, sending SIGKILL", (int)pid_);
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    reaped_ = true;
    exit_code_ = -1;
}

} // namespace droid
