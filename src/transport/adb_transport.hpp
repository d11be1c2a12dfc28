// =============================================================================
// PeloBridge - Debug bridge transport interface
// =============================================================================
// One capability interface, two implementations:
//   CliTransport    - spawns the adb executable per command
//   SocketTransport - talks to a running adb server over its smart socket
// Callers hold an AdbTransport& and never branch on which one they got.
//
// Text-returning operations hand back the tool's raw output. Classification
// ("Success", INSTALL_FAILED_*) lives in adb_output_parser, not here.
// On a non-zero exit the raw output is still available in Error::output.
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../log_ring.hpp"
#include "../result.hpp"
#include "process_runner.hpp"

namespace pelo::transport {

// One line of "adb devices"
struct DeviceEntry {
    std::string serial;
    std::string status;   // "device", "offline", "unauthorized", ...
};

class AdbTransport {
public:
    virtual ~AdbTransport() = default;

    virtual const char* name() const = 0;

    virtual Result<std::vector<DeviceEntry>> enumerate() = 0;
    virtual Result<std::string> getProperty(const std::string& serial, const std::string& key) = 0;
    virtual Result<std::string> shell(const std::string& serial, const std::string& command) = 0;

    virtual Result<std::string> install(const std::string& serial, const std::string& apk_path) = 0;
    // as_primary_user: "pm uninstall --user 0" escalation
    virtual Result<std::string> uninstall(const std::string& serial, const std::string& package,
                                          bool as_primary_user) = 0;

    virtual Result<std::string> pull(const std::string& serial, const std::string& remote_path,
                                     const std::string& local_path) = 0;
    virtual Result<std::string> push(const std::string& serial, const std::string& local_path,
                                     const std::string& remote_path) = 0;

    // Restart adbd on the device listening on TCP port
    virtual Result<std::string> setNetworkMode(const std::string& serial, int port) = 0;
    virtual Result<std::string> pair(const std::string& ip, int port, const std::string& code) = 0;
    // Pair with a device known only by its mDNS pairing service name
    virtual Result<std::string> pairService(const std::string& service_name, const std::string& code) = 0;
    virtual Result<std::string> connect(const std::string& ip, int port) = 0;
    // Raw "adb mdns services" listing
    virtual Result<std::string> listServices() = 0;

    // PNG bytes of the current screen without touching device storage
    virtual Result<std::vector<uint8_t>> screencapBytes(const std::string& serial) = 0;

    // Shell command that keeps running until interrupted (screenrecord)
    virtual Result<std::unique_ptr<ChildProcess>> startLongRunning(const std::string& serial,
                                                                   const std::string& command) = 0;

    void setLogSink(LogSink sink) { log_sink_ = std::move(sink); }

protected:
    void emit(const std::string& message, const std::string& category) const {
        if (log_sink_) log_sink_(message, category);
    }

private:
    LogSink log_sink_;
};

// Raw text of a transport call whether it succeeded or not
inline std::string rawOutput(const Result<std::string>& r) {
    if (r.is_ok()) return r.value();
    return r.error().output.empty() ? r.error().message : r.error().output;
}

} // namespace pelo::transport
