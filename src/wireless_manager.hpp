#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "adb_device_manager.hpp"
#include "device.hpp"
#include "log_ring.hpp"
#include "network_discovery.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"

namespace pelo {

/**
 * Wireless connection manager
 * Pairing/connecting to network devices and moving a USB device onto WiFi.
 * After a connection attempt it waits the settle delay and calls the refresh
 * hook so the new endpoint shows up in the registry.
 */
class WirelessManager {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RefreshHook = std::function<void()>;
    // (ip, pairing port to skip) -> an open port on the device, if any
    using PortScanner =
        std::function<Result<std::optional<int>>(const std::string& ip, std::optional<int> skip)>;

    // Pacing of connectCandidate's connect loop
    struct ConnectWait {
        std::chrono::milliseconds deadline{120000};          // give up after
        std::chrono::milliseconds mdns_refresh{10000};       // min gap between listings
        std::chrono::milliseconds retry_delay{5000};         // after a refused connect
        std::chrono::milliseconds missing_info_delay{3000};  // while the port is unknown
    };

    // Named outcome of one developer-setting write
    using ToggleResult = std::pair<std::string, bool>;

    static constexpr const char* TOGGLE_WIRELESS_DEBUGGING = "Wireless Debugging";
    static constexpr const char* TOGGLE_STAY_AWAKE = "Stay Awake While Charging";
    static constexpr const char* WIRELESS_DEBUG_TILE =
        "custom(com.android.settings/.development.qstile.DevelopmentTiles$WirelessDebugging)";

    WirelessManager(transport::AdbTransport& adb, AdbDeviceManager& devices,
                    int tcp_port, std::chrono::milliseconds settle_delay,
                    RefreshHook refresh, LogSink log = nullptr,
                    Sleeper sleeper = defaultSleeper);

    // Pair first when both pairing_port and code are given; then connect.
    // PairingFailure (connect skipped) / ConnectionTimeout.
    Result<void> pairAndConnect(const std::string& ip, std::optional<int> pairing_port,
                                const std::string& code, int connect_port);

    // Discovered device: pair by ip:pairing_port, else by mDNS service name
    // (skipped without a code), then connect until ConnectWait::deadline.
    // An unknown connect port is looked up in fresh mDNS listings, then by
    // one port scan. Returns the "ip:port" endpoint.
    // PairingFailure (connect skipped) / ConnectionTimeout.
    Result<std::string> connectCandidate(const WirelessCandidate& target, const std::string& code,
                                         std::optional<int> connect_port = std::nullopt);

    void setConnectWait(const ConnectWait& wait) { wait_ = wait; }
    void setPortScanner(PortScanner scanner) { port_scanner_ = std::move(scanner); }

    // USB device -> adbd over TCP -> connect to its WLAN address.
    // Returns the "ip:port" endpoint on success.
    Result<std::string> handoffToWireless(const Device& device);

    // Independent best-effort writes, one named result each
    std::vector<ToggleResult> applyDeveloperToggles(const std::string& serial);

    static void defaultSleeper(std::chrono::milliseconds d);

private:
    void settleAndRefresh();
    Result<void> connectEndpoint(const std::string& ip, int port);
    Result<void> checkPaired(const Result<std::string>& r, const std::string& target);
    // Connect advertisement of the same device in a fresh mDNS listing
    std::optional<parser::ServiceRecord> lookupConnectService(const WirelessCandidate& target);
    bool enableWirelessDebugging(const std::string& serial);
    bool enableStayAwake(const std::string& serial);
    void log(const std::string& message, const std::string& category) const;

    transport::AdbTransport& adb_;
    AdbDeviceManager& devices_;
    int tcp_port_;
    std::chrono::milliseconds settle_delay_;
    RefreshHook refresh_;
    LogSink log_;
    Sleeper sleep_;
    ConnectWait wait_;
    PortScanner port_scanner_;
};

} // namespace pelo
