#pragma once

#include <chrono>
#include <string>

#include "adb_transport.hpp"
#include "tcp_socket.hpp"

namespace pelo::transport {

/**
 * Socket-backed transport: speaks the adb server's smart-socket protocol
 * directly (no process per command). Needs an adb server already listening
 * on host:port; it does not speak the device-side wire protocol itself.
 *
 * Install is push to /data/local/tmp + "pm install", the same thing the
 * adb client does for a single APK.
 */
class SocketTransport : public AdbTransport {
public:
    SocketTransport(std::string host, uint16_t port,
                    std::chrono::milliseconds command_timeout,
                    std::chrono::milliseconds pair_timeout);

    const char* name() const override { return "socket"; }

    // host:version round trip; used for capability detection
    Result<int> serverVersion();

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
    // Connect and send one host service; consumes the OKAY/FAIL status
    Result<TcpSocket> openService(const std::string& service, std::chrono::milliseconds timeout);
    // host:transport:<serial> then the device service on the same socket
    Result<TcpSocket> openDeviceService(const std::string& serial, const std::string& service,
                                        std::chrono::milliseconds timeout);
    Result<void> readStatus(TcpSocket& sock);
    Result<std::string> readProtocolString(TcpSocket& sock);
    // One-shot host query answered with a length-prefixed string
    Result<std::string> hostQuery(const std::string& service, std::chrono::milliseconds timeout);
    Result<std::string> deviceStream(const std::string& serial, const std::string& service,
                                     std::chrono::milliseconds timeout);

    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds pair_timeout_;
};

} // namespace pelo::transport
