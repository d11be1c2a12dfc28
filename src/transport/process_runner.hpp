// =============================================================================
// PeloBridge - Child process execution
// =============================================================================
// Runs external tools (adb, curl) without a shell, capturing stdout and
// stderr separately, with a hard timeout. Long-running children (screen
// recording) are returned as a handle that can be interrupted later.
// =============================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../result.hpp"

namespace pelo::transport {

struct ProcessResult {
    std::string out;
    std::string err;
    int exit_status = -1;
    bool timed_out = false;

    // stdout followed by stderr, as a terminal would show it
    std::string combined() const {
        if (err.empty()) return out;
        if (out.empty()) return err;
        return out + (out.back() == '\n' ? "" : "\n") + err;
    }
};

// Handle to a child that keeps running until interrupted
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual bool running() = 0;
    // Ask the child to finish (SIGINT / console break)
    virtual bool interrupt() = 0;
    // Wait up to timeout; returns exit status or error on timeout
    virtual Result<int> wait(std::chrono::milliseconds timeout) = 0;
};

// Function seam used by everything that shells out (tests inject fakes)
using CommandRunner = std::function<Result<ProcessResult>(
    const std::string& program,
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout)>;

using ChildSpawner = std::function<Result<std::unique_ptr<ChildProcess>>(
    const std::string& program,
    const std::vector<std::string>& args)>;

// Output beyond this is dropped (screencap PNGs fit comfortably)
constexpr size_t MAX_CAPTURE_BYTES = 64 * 1024 * 1024;

Result<ProcessResult> runProcess(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout);

Result<std::unique_ptr<ChildProcess>> spawnProcess(const std::string& program,
                                                   const std::vector<std::string>& args);

// "adb -s X shell ls" style rendering for log lines
std::string renderCommandLine(const std::string& program,
                              const std::vector<std::string>& args);

// Locate an executable on PATH; empty if not found
std::string findOnPath(const std::string& name);

} // namespace pelo::transport
