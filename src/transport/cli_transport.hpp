#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "adb_transport.hpp"

namespace pelo::transport {

/**
 * Process-backed transport: every call spawns the adb executable.
 * Each invocation is echoed to the log sink as "$ adb ..." (command)
 * followed by its stdout and stderr.
 */
class CliTransport : public AdbTransport {
public:
    CliTransport(std::string adb_path,
                 std::chrono::milliseconds command_timeout,
                 std::chrono::milliseconds pair_timeout,
                 CommandRunner runner = runProcess,
                 ChildSpawner spawner = spawnProcess);

    const char* name() const override { return "cli"; }
    const std::string& adbPath() const { return adb_path_; }

    Result<std::vector<DeviceEntry>> enumerate() override;
    Result<std::string> getProperty(const std::string& serial, const std::string& key) override;
    Result<std::string> shell(const std::string& serial, const std::string& command) override;
    Result<std::string> install(const std::string& serial, const std::string& apk_path) override;
    Result<std::string> uninstall(const std::string& serial, const std::string& package,
                                  bool as_primary_user) override;
    Result<std::string> pull(const std::string& serial, const std::string& remote_path,
                             const std::string& local_path) override;
    Result<std::string> push(const std::string& serial, const std::string& local_path,
                             const std::string& remote_path) override;
    Result<std::string> setNetworkMode(const std::string& serial, int port) override;
    Result<std::string> pair(const std::string& ip, int port, const std::string& code) override;
    Result<std::string> pairService(const std::string& service_name, const std::string& code) override;
    Result<std::string> connect(const std::string& ip, int port) override;
    Result<std::string> listServices() override;
    Result<std::vector<uint8_t>> screencapBytes(const std::string& serial) override;
    Result<std::unique_ptr<ChildProcess>> startLongRunning(const std::string& serial,
                                                           const std::string& command) override;

private:
    // Run adb with args; non-zero exit -> TransportFailure carrying the output
    Result<ProcessResult> exec(const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout,
                               bool echo_output = true);
    Result<std::string> execText(const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout);

    std::string adb_path_;
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds pair_timeout_;
    CommandRunner runner_;
    ChildSpawner spawner_;
};

} // namespace pelo::transport
