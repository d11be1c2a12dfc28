// =============================================================================
// PeloBridge - BridgeController
// =============================================================================
// Single owner of all mutable state: configuration, user log ring, event bus,
// transport, registry and the operation modules. Front ends (CLI today) call
// the operations here and listen on the event bus.
//
// One busy flag serializes the long operations; a second one started while
// busy fails with ErrorKind::Busy. The heartbeat holds the same flag for the
// length of its poll and skips its cycle while busy.
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "adb_device_manager.hpp"
#include "app_catalog.hpp"
#include "config_loader.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "http_client.hpp"
#include "installer.hpp"
#include "log_ring.hpp"
#include "media_capture.hpp"
#include "network_discovery.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"
#include "update_checker.hpp"
#include "wireless_manager.hpp"

namespace pelo {

class BridgeController {
public:
    // Production wiring: transport and HTTP client picked from config
    explicit BridgeController(config::AppConfig cfg);
    // Injected collaborators (tests, alternative front ends)
    BridgeController(config::AppConfig cfg,
                     std::unique_ptr<transport::AdbTransport> adb,
                     std::unique_ptr<HttpClient> http,
                     NetworkDiscovery::Prober prober,
                     WirelessManager::Sleeper sleeper,
                     WirelessManager::PortScanner port_scanner = nullptr);
    ~BridgeController();

    BridgeController(const BridgeController&) = delete;
    BridgeController& operator=(const BridgeController&) = delete;

    // Lifecycle
    void start(bool with_heartbeat = true);   // first poll + heartbeat thread
    void shutdown();

    // --- Shared state ---
    EventBus& bus() { return bus_; }
    LogRing& logs() { return logs_; }
    DeviceRegistry& registry() { return *registry_; }
    transport::AdbTransport& adb() { return *adb_; }
    const config::AppConfig& config() const { return cfg_; }
    bool isBusy() const { return busy_.load(); }

    // User-facing log line: ring + LogEvent
    void log(const std::string& message, const std::string& category = "info");
    LogSink logSink();

    // One heartbeat cycle; false when skipped because busy
    bool heartbeatTick();

    // --- Devices ---
    bool refresh();
    bool selectDevice(const std::string& serial);

    // --- Install / uninstall ---
    Result<InstallReport> installSelected(const ConfirmReinstall& confirm);
    Result<void> installLocalApk(const std::string& path, const ConfirmReinstall& confirm);
    Result<std::vector<std::string>> scanPelotonPackages();
    Result<UninstallTally> uninstallPackages(const std::vector<std::string>& packages);

    // --- Wireless ---
    Result<std::vector<WirelessCandidate>> scanWireless(std::optional<int> port = std::nullopt);
    Result<void> pairAndConnect(const std::string& ip, std::optional<int> pairing_port,
                                const std::string& code, std::optional<int> connect_port);
    // Scan, pick the device at ip (or the first pairable one), pair with
    // code and connect. Returns the connected "ip:port".
    Result<std::string> pairDiscovered(const std::string& code,
                                       const std::optional<std::string>& ip = std::nullopt,
                                       std::optional<int> connect_port = std::nullopt);
    Result<std::string> handoffToWireless();
    Result<std::vector<WirelessManager::ToggleResult>> applyDeveloperToggles();

    // --- Media ---
    Result<std::string> takeScreenshot();
    Result<std::vector<uint8_t>> screenshotBytes();
    Result<void> startPreview(MediaCapture::FrameCallback on_frame);
    void stopPreview();
    Result<void> startRecording();
    Result<std::string> stopRecording();

    // --- Device tools ---
    Result<int> getRotation();
    Result<void> setRotation(int rotation);
    Result<bool> getAutoRotate();
    Result<void> setAutoRotate(bool enabled);
    Result<std::vector<std::string>> getInstalledLaunchers();
    Result<void> openAppSettings(const std::string& package);

    // --- Misc ---
    Result<UpdateInfo> checkForUpdates();
    // <guides_dir>/<file_name>
    Result<std::vector<GuideStep>> loadGuide(const std::string& file_name);

private:
    // RAII busy flag; ok() false if another operation holds it.
    // announce=false holds the flag without BusyChangedEvent (heartbeat)
    class BusyGuard {
    public:
        explicit BusyGuard(BridgeController& owner, bool announce = true);
        ~BusyGuard();
        bool ok() const { return acquired_; }

        BusyGuard(const BusyGuard&) = delete;
        BusyGuard& operator=(const BusyGuard&) = delete;

    private:
        BridgeController& owner_;
        bool announce_;
        bool acquired_ = false;
    };

    void wire(NetworkDiscovery::Prober prober, WirelessManager::Sleeper sleeper,
              WirelessManager::PortScanner port_scanner);
    Result<Device> requireActive();
    Error busyError() const;
    void heartbeatLoop();

    config::AppConfig cfg_;
    LogRing logs_;
    EventBus bus_;

    std::unique_ptr<transport::AdbTransport> adb_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<AdbDeviceManager> devices_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<NetworkDiscovery> discovery_;
    std::unique_ptr<WirelessManager> wireless_;
    std::unique_ptr<Installer> installer_;
    std::unique_ptr<MediaCapture> media_;
    std::unique_ptr<UpdateChecker> updates_;

    std::atomic<bool> busy_{false};
    std::atomic<bool> running_{false};
    std::thread heartbeat_thread_;
    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
};

} // namespace pelo
