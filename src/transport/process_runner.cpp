#include "process_runner.hpp"
#include "../pelo_log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace pelo::transport {

std::string renderCommandLine(const std::string& program,
                              const std::vector<std::string>& args) {
    std::string line = std::filesystem::path(program).filename().string();
    for (const auto& a : args) {
        line += ' ';
        if (a.empty() || a.find(' ') != std::string::npos) {
            line += '"' + a + '"';
        } else {
            line += a;
        }
    }
    return line;
}

std::string findOnPath(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};
#ifdef _WIN32
    const char sep = ';';
    const std::vector<std::string> suffixes = {".exe", ""};
#else
    const char sep = ':';
    const std::vector<std::string> suffixes = {""};
#endif
    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, sep)) {
        if (dir.empty()) continue;
        for (const auto& suffix : suffixes) {
            std::filesystem::path candidate = std::filesystem::path(dir) / (name + suffix);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate.string();
            }
        }
    }
    return {};
}

#ifdef _WIN32

// =============================================================================
// Windows: CreateProcess with hidden console, pipes polled with PeekNamedPipe
// =============================================================================

namespace {

std::string buildCommandLine(const std::string& program, const std::vector<std::string>& args) {
    auto quote = [](const std::string& s) {
        if (!s.empty() && s.find_first_of(" \t\"") == std::string::npos) return s;
        std::string q = "\"";
        for (char c : s) {
            if (c == '"') q += '\\';
            q += c;
        }
        return q + "\"";
    };
    std::string cmd = quote(program);
    for (const auto& a : args) cmd += " " + quote(a);
    return cmd;
}

void drainPipe(HANDLE pipe, std::string& into) {
    char buffer[4096];
    DWORD available = 0;
    while (PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) && available > 0) {
        DWORD bytesRead = 0;
        DWORD toRead = available < sizeof(buffer) ? available : sizeof(buffer);
        if (!ReadFile(pipe, buffer, toRead, &bytesRead, nullptr) || bytesRead == 0) break;
        if (into.size() < MAX_CAPTURE_BYTES) into.append(buffer, bytesRead);
    }
}

class WinChildProcess : public ChildProcess {
public:
    explicit WinChildProcess(PROCESS_INFORMATION pi) : pi_(pi) {}
    ~WinChildProcess() override {
        if (running()) TerminateProcess(pi_.hProcess, 1);
        CloseHandle(pi_.hProcess);
        CloseHandle(pi_.hThread);
    }

    bool running() override {
        DWORD status = 0;
        return GetExitCodeProcess(pi_.hProcess, &status) && status == STILL_ACTIVE;
    }

    bool interrupt() override {
        // Child runs in its own process group
        return GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, pi_.dwProcessId) != 0;
    }

    Result<int> wait(std::chrono::milliseconds timeout) override {
        if (WaitForSingleObject(pi_.hProcess, (DWORD)timeout.count()) != WAIT_OBJECT_0) {
            return Err<int>(ErrorKind::TransportFailure, "child did not exit in time");
        }
        DWORD status = 0;
        GetExitCodeProcess(pi_.hProcess, &status);
        return Ok((int)status);
    }

private:
    PROCESS_INFORMATION pi_;
};

} // namespace

Result<ProcessResult> runProcess(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE outRead = nullptr, outWrite = nullptr, errRead = nullptr, errWrite = nullptr;
    if (!CreatePipe(&outRead, &outWrite, &sa, 0)) {
        return Err<ProcessResult>(ErrorKind::TransportFailure, "CreatePipe failed");
    }
    if (!CreatePipe(&errRead, &errWrite, &sa, 0)) {
        CloseHandle(outRead);
        CloseHandle(outWrite);
        return Err<ProcessResult>(ErrorKind::TransportFailure, "CreatePipe failed");
    }
    SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.hStdOutput = outWrite;
    si.hStdError = errWrite;
    si.hStdInput = nullptr;
    si.wShowWindow = SW_HIDE;

    PROCESS_INFORMATION pi = {};
    std::string cmd = buildCommandLine(program, args);

    BOOL created = CreateProcessA(nullptr, cmd.data(), nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    CloseHandle(outWrite);
    CloseHandle(errWrite);
    if (!created) {
        CloseHandle(outRead);
        CloseHandle(errRead);
        return Err<ProcessResult>(ErrorKind::TransportFailure,
                                  "failed to start " + program, (int)GetLastError());
    }

    ProcessResult result;
    DWORD start_tick = GetTickCount();
    while (true) {
        drainPipe(outRead, result.out);
        drainPipe(errRead, result.err);
        DWORD status = STILL_ACTIVE;
        GetExitCodeProcess(pi.hProcess, &status);
        if (status != STILL_ACTIVE) {
            drainPipe(outRead, result.out);
            drainPipe(errRead, result.err);
            result.exit_status = (int)status;
            break;
        }
        if (GetTickCount() - start_tick > (DWORD)timeout.count()) {
            TerminateProcess(pi.hProcess, 1);
            result.timed_out = true;
            break;
        }
        Sleep(25);
    }
    WaitForSingleObject(pi.hProcess, 1000);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    CloseHandle(outRead);
    CloseHandle(errRead);
    return Ok(std::move(result));
}

Result<std::unique_ptr<ChildProcess>> spawnProcess(const std::string& program,
                                                   const std::vector<std::string>& args) {
    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;
    PROCESS_INFORMATION pi = {};
    std::string cmd = buildCommandLine(program, args);
    if (!CreateProcessA(nullptr, cmd.data(), nullptr, nullptr, FALSE,
                        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
                        nullptr, nullptr, &si, &pi)) {
        return Err<std::unique_ptr<ChildProcess>>(ErrorKind::TransportFailure,
                                                  "failed to start " + program, (int)GetLastError());
    }
    return Ok(std::unique_ptr<ChildProcess>(new WinChildProcess(pi)));
}

#else

// =============================================================================
// POSIX: fork/execvp with two pipes multiplexed by poll()
// =============================================================================

namespace {

struct FdCloser {
    int fd = -1;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
    void reset() { if (fd >= 0) ::close(fd); fd = -1; }
};

std::vector<char*> buildArgv(const std::string& program, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

bool makePipe(int fds[2]) {
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid) : pid_(pid) {}
    ~PosixChildProcess() override {
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            ::waitpid(pid_, &status, 0);
        }
    }

    bool running() override {
        if (reaped_) return false;
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            reaped_ = true;
            exit_status_ = decodeStatus(status);
            return false;
        }
        return r == 0;
    }

    bool interrupt() override {
        if (reaped_) return false;
        return ::kill(pid_, SIGINT) == 0;
    }

    Result<int> wait(std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (running()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return Err<int>(ErrorKind::TransportFailure, "child did not exit in time");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return Ok(exit_status_);
    }

private:
    pid_t pid_;
    bool reaped_ = false;
    int exit_status_ = -1;
};

} // namespace

Result<ProcessResult> runProcess(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    int out_fds[2], err_fds[2];
    if (!makePipe(out_fds)) {
        return Err<ProcessResult>(ErrorKind::TransportFailure, "pipe failed", errno);
    }
    FdCloser out_read{out_fds[0]}, out_write{out_fds[1]};
    if (!makePipe(err_fds)) {
        return Err<ProcessResult>(ErrorKind::TransportFailure, "pipe failed", errno);
    }
    FdCloser err_read{err_fds[0]}, err_write{err_fds[1]};

    auto argv = buildArgv(program, args);
    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<ProcessResult>(ErrorKind::TransportFailure, "fork failed", errno);
    }
    if (pid == 0) {
        ::dup2(out_fds[1], STDOUT_FILENO);
        ::dup2(err_fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(program.c_str(), argv.data());
        _exit(127);
    }
    out_write.reset();
    err_write.reset();

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true, err_open = true;
    char buffer[8192];

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        struct pollfd pfds[2];
        int n = 0;
        if (out_open) pfds[n++] = {out_read.fd, POLLIN, 0};
        if (err_open) pfds[n++] = {err_read.fd, POLLIN, 0};
        int rc = ::poll(pfds, n, (int)remaining.count());
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;
        for (int i = 0; i < n; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = pfds[i].fd == out_read.fd;
            ssize_t got = ::read(pfds[i].fd, buffer, sizeof(buffer));
            if (got <= 0) {
                (is_out ? out_open : err_open) = false;
                continue;
            }
            std::string& into = is_out ? result.out : result.err;
            if (into.size() < MAX_CAPTURE_BYTES) into.append(buffer, (size_t)got);
        }
    }

    int status = 0;
    if (result.timed_out) {
        PLOG_WARN("process", "%s timed out after %lldms, killing",
                  program.c_str(), (long long)timeout.count());
        ::kill(pid, SIGKILL);
    }
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    result.exit_status = result.timed_out ? -1 : decodeStatus(status);

    if (result.exit_status == 127 && result.out.empty() && result.err.empty()) {
        return Err<ProcessResult>(ErrorKind::TransportFailure,
                                  "failed to execute " + program, 127);
    }
    return Ok(std::move(result));
}

Result<std::unique_ptr<ChildProcess>> spawnProcess(const std::string& program,
                                                   const std::vector<std::string>& args) {
    auto argv = buildArgv(program, args);
    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<std::unique_ptr<ChildProcess>>(ErrorKind::TransportFailure, "fork failed", errno);
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(program.c_str(), argv.data());
        _exit(127);
    }
    return Ok(std::unique_ptr<ChildProcess>(new PosixChildProcess(pid)));
}

#endif

} // namespace pelo::transport
