#include "bridge_controller.hpp"
#include "pelo_log.hpp"
#include "transport/transport_factory.hpp"

#include <algorithm>
#include <filesystem>

namespace pelo {

// =============================================================================
// BusyGuard
// =============================================================================

BridgeController::BusyGuard::BusyGuard(BridgeController& owner, bool announce)
    : owner_(owner), announce_(announce) {
    bool expected = false;
    acquired_ = owner_.busy_.compare_exchange_strong(expected, true);
    if (acquired_ && announce_) {
        BusyChangedEvent e;
        e.busy = true;
        owner_.bus_.publish(e);
    }
}

BridgeController::BusyGuard::~BusyGuard() {
    if (!acquired_) return;
    owner_.busy_ = false;
    if (!announce_) return;
    BusyChangedEvent e;
    e.busy = false;
    owner_.bus_.publish(e);
}

// =============================================================================
// Construction / lifecycle
// =============================================================================

BridgeController::BridgeController(config::AppConfig cfg)
    : cfg_(std::move(cfg)),
      logs_(cfg_.log.ring_capacity > 0 ? (size_t)cfg_.log.ring_capacity : LogRing::DEFAULT_CAPACITY) {
    adb_ = transport::makeTransport(cfg_.adb, logSink());
    http_ = makeHttpClient(cfg_.install, logSink());
    const auto probe_timeout = std::chrono::milliseconds(cfg_.wireless.probe_timeout_ms);
    wire(makeSubnetProber(probe_timeout), WirelessManager::defaultSleeper,
         [probe_timeout](const std::string& ip, std::optional<int> skip) {
             return findOpenPort(ip, CONNECT_PORT_FIRST, CONNECT_PORT_LAST, skip, probe_timeout);
         });
}

BridgeController::BridgeController(config::AppConfig cfg,
                                   std::unique_ptr<transport::AdbTransport> adb,
                                   std::unique_ptr<HttpClient> http,
                                   NetworkDiscovery::Prober prober,
                                   WirelessManager::Sleeper sleeper,
                                   WirelessManager::PortScanner port_scanner)
    : cfg_(std::move(cfg)),
      logs_(cfg_.log.ring_capacity > 0 ? (size_t)cfg_.log.ring_capacity : LogRing::DEFAULT_CAPACITY),
      adb_(std::move(adb)),
      http_(std::move(http)) {
    adb_->setLogSink(logSink());
    wire(std::move(prober), std::move(sleeper), std::move(port_scanner));
}

void BridgeController::wire(NetworkDiscovery::Prober prober, WirelessManager::Sleeper sleeper,
                            WirelessManager::PortScanner port_scanner) {
    devices_ = std::make_unique<AdbDeviceManager>(*adb_);

    const std::string apps_path = cfg_.catalog.apps_path;
    registry_ = std::make_unique<DeviceRegistry>(
        [this]() { return devices_->listDevices(); },
        [apps_path](const std::optional<std::string>& abi) { return loadCatalog(apps_path, abi); },
        bus_, logSink());

    discovery_ = std::make_unique<NetworkDiscovery>(*adb_, std::move(prober), logSink());
    wireless_ = std::make_unique<WirelessManager>(
        *adb_, *devices_, cfg_.wireless.default_port,
        std::chrono::milliseconds(cfg_.wireless.settle_delay_ms),
        [this]() { registry_->poll(); }, logSink(), sleeper);
    WirelessManager::ConnectWait wait;
    wait.deadline = std::chrono::milliseconds(cfg_.wireless.connect_wait_ms);
    wait.mdns_refresh = std::chrono::milliseconds(cfg_.wireless.mdns_refresh_ms);
    wait.retry_delay = std::chrono::milliseconds(cfg_.wireless.connect_retry_ms);
    wait.missing_info_delay = std::chrono::milliseconds(cfg_.wireless.connect_info_wait_ms);
    wireless_->setConnectWait(wait);
    wireless_->setPortScanner(std::move(port_scanner));
    installer_ = std::make_unique<Installer>(*adb_, *devices_, *http_, cfg_.install.temp_dir, logSink());
    media_ = std::make_unique<MediaCapture>(*adb_, cfg_.media.save_location, logSink(), sleeper);
    updates_ = std::make_unique<UpdateChecker>(*http_, cfg_.update.releases_url);

    PLOG_INFO("controller", "Using %s transport", adb_->name());
}

BridgeController::~BridgeController() {
    shutdown();
}

void BridgeController::start(bool with_heartbeat) {
    log(DeviceRegistry::INITIAL_STATUS, "info");
    registry_->poll();
    if (!with_heartbeat || running_.exchange(true)) return;

    heartbeat_thread_ = std::thread([this]() { heartbeatLoop(); });
    PLOG_INFO("controller", "Heartbeat every %dms", cfg_.registry.heartbeat_interval_ms);
}

void BridgeController::shutdown() {
    if (running_.exchange(false)) {
        heartbeat_cv_.notify_all();
    }
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
        bus_.publish(ShutdownEvent{});
    }
    if (media_) media_->stopPreview();
}

void BridgeController::heartbeatLoop() {
    const auto interval = std::chrono::milliseconds(cfg_.registry.heartbeat_interval_ms);
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (running_.load()) {
        heartbeat_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        if (!running_.load()) break;
        lock.unlock();
        heartbeatTick();
        lock.lock();
    }
}

bool BridgeController::heartbeatTick() {
    BusyGuard guard(*this, false);
    if (!guard.ok()) {
        PLOG_DEBUG("controller", "Heartbeat skipped (busy)");
        return false;
    }
    registry_->poll(true);
    return true;
}

// =============================================================================
// Logging
// =============================================================================

void BridgeController::log(const std::string& message, const std::string& category) {
    LogEntry entry = logs_.append(message, category);
    LogEvent e;
    e.timestamp = entry.timestamp;
    e.message = entry.message;
    e.category = entry.category;
    bus_.publish(e);
}

LogSink BridgeController::logSink() {
    return [this](const std::string& message, const std::string& category) { log(message, category); };
}

Error BridgeController::busyError() const {
    return Error(ErrorKind::Busy, "another operation is in progress");
}

Result<Device> BridgeController::requireActive() {
    auto active = registry_->activeDevice();
    if (!active) {
        return Err<Device>(ErrorKind::NoDeviceDetected, "no device selected");
    }
    return Ok(*active);
}

// =============================================================================
// Devices
// =============================================================================

bool BridgeController::refresh() {
    return registry_->poll();
}

bool BridgeController::selectDevice(const std::string& serial) {
    return registry_->select(serial);
}

// =============================================================================
// Install / uninstall
// =============================================================================

Result<InstallReport> BridgeController::installSelected(const ConfirmReinstall& confirm) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    auto device = requireActive();
    if (device.is_err()) return device.error();

    auto entries = registry_->selectedEntries();
    if (entries.empty()) {
        log("No apps selected", "info");
        return Ok(InstallReport{});
    }
    return Ok(installer_->installEntries(device.value().serial, entries, confirm));
}

Result<void> BridgeController::installLocalApk(const std::string& path, const ConfirmReinstall& confirm) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return installer_->installLocalApk(device.value().serial, path, confirm);
}

Result<std::vector<std::string>> BridgeController::scanPelotonPackages() {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return installer_->findPelotonPackages(device.value().serial);
}

Result<UninstallTally> BridgeController::uninstallPackages(const std::vector<std::string>& packages) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    auto device = requireActive();
    if (device.is_err()) return device.error();
    auto tally = installer_->uninstallBatch(device.value().serial, packages);
    log("Uninstall finished: " + std::to_string(tally.success) + " succeeded, " +
        std::to_string(tally.fail) + " failed", "status");
    return Ok(tally);
}

// =============================================================================
// Wireless
// =============================================================================

Result<std::vector<WirelessCandidate>> BridgeController::scanWireless(std::optional<int> port) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    return Ok(discovery_->scan(port));
}

Result<void> BridgeController::pairAndConnect(const std::string& ip, std::optional<int> pairing_port,
                                              const std::string& code, std::optional<int> connect_port) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    return wireless_->pairAndConnect(ip, pairing_port, code,
                                     connect_port.value_or(cfg_.wireless.default_port));
}

Result<std::string> BridgeController::pairDiscovered(const std::string& code,
                                                     const std::optional<std::string>& ip,
                                                     std::optional<int> connect_port) {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();

    auto candidates = discovery_->scan();
    auto pick = std::find_if(candidates.begin(), candidates.end(), [&](const WirelessCandidate& c) {
        if (ip) return c.ip == *ip;
        return c.pairing_port.has_value() || c.pairing_service.has_value();
    });
    if (pick == candidates.end()) {
        std::string what = ip ? *ip : std::string("a device advertising wireless pairing");
        log("Could not find " + what + " on the network", "error");
        return Err<std::string>(ErrorKind::ScanFailure, "no wireless candidate: " + what);
    }
    return wireless_->connectCandidate(*pick, code, connect_port);
}

Result<std::string> BridgeController::handoffToWireless() {
    BusyGuard guard(*this);
    if (!guard.ok()) return busyError();
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return wireless_->handoffToWireless(device.value());
}

Result<std::vector<WirelessManager::ToggleResult>> BridgeController::applyDeveloperToggles() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return Ok(wireless_->applyDeveloperToggles(device.value().serial));
}

// =============================================================================
// Media
// =============================================================================

Result<std::string> BridgeController::takeScreenshot() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return media_->takeScreenshot(device.value().serial);
}

Result<std::vector<uint8_t>> BridgeController::screenshotBytes() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return media_->screenshotBytes(device.value().serial);
}

Result<void> BridgeController::startPreview(MediaCapture::FrameCallback on_frame) {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return media_->startPreview(device.value().serial, std::move(on_frame));
}

void BridgeController::stopPreview() {
    media_->stopPreview();
}

Result<void> BridgeController::startRecording() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return media_->startRecording(device.value().serial);
}

Result<std::string> BridgeController::stopRecording() {
    return media_->stopRecording();
}

// =============================================================================
// Device tools
// =============================================================================

Result<int> BridgeController::getRotation() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return devices_->getRotation(device.value().serial);
}

Result<void> BridgeController::setRotation(int rotation) {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    auto r = devices_->setRotation(device.value().serial, rotation);
    if (r.is_err()) log("Set rotation failed: " + r.error().message, "error");
    else log("Rotation set to " + std::to_string(rotation * 90) + "°", "info");
    return r;
}

Result<bool> BridgeController::getAutoRotate() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return devices_->getAutoRotate(device.value().serial);
}

Result<void> BridgeController::setAutoRotate(bool enabled) {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    auto r = devices_->setAutoRotate(device.value().serial, enabled);
    if (r.is_err()) log("Auto-rotate change failed: " + r.error().message, "error");
    else log(std::string("Auto-rotate ") + (enabled ? "enabled" : "disabled"), "info");
    return r;
}

Result<std::vector<std::string>> BridgeController::getInstalledLaunchers() {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    return devices_->getInstalledLaunchers(device.value().serial);
}

Result<void> BridgeController::openAppSettings(const std::string& package) {
    auto device = requireActive();
    if (device.is_err()) return device.error();
    auto r = devices_->openAppSettings(device.value().serial, package);
    if (r.is_err()) log("Could not open settings for " + package + ": " + r.error().message, "error");
    return r;
}

// =============================================================================
// Misc
// =============================================================================

Result<UpdateInfo> BridgeController::checkForUpdates() {
    auto r = updates_->check();
    if (r.is_err()) {
        log("Update check failed: " + r.error().message, "error");
    } else if (r.value().available) {
        log("Update available: " + r.value().latest + " (current " + r.value().current + ")", "status");
    } else {
        log("PeloBridge is up to date (" + r.value().current + ")", "info");
    }
    return r;
}

Result<std::vector<GuideStep>> BridgeController::loadGuide(const std::string& file_name) {
    auto path = std::filesystem::path(cfg_.catalog.guides_dir) / file_name;
    auto r = pelo::loadGuide(path.string());
    if (r.is_err()) log("Error loading guide: " + r.error().message, "error");
    return r;
}

} // namespace pelo
