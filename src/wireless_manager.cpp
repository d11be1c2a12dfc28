#include "wireless_manager.hpp"
#include "adb_output_parser.hpp"
#include "pelo_log.hpp"

#include <thread>

namespace pelo {

WirelessManager::WirelessManager(transport::AdbTransport& adb, AdbDeviceManager& devices,
                                 int tcp_port, std::chrono::milliseconds settle_delay,
                                 RefreshHook refresh, LogSink log, Sleeper sleeper)
    : adb_(adb),
      devices_(devices),
      tcp_port_(tcp_port),
      settle_delay_(settle_delay),
      refresh_(std::move(refresh)),
      log_(std::move(log)),
      sleep_(std::move(sleeper)) {}

void WirelessManager::defaultSleeper(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

void WirelessManager::log(const std::string& message, const std::string& category) const {
    if (log_) log_(message, category);
}

void WirelessManager::settleAndRefresh() {
    if (sleep_) sleep_(settle_delay_);
    if (refresh_) refresh_();
}

// =============================================================================
// Pair / connect
// =============================================================================

Result<void> WirelessManager::connectEndpoint(const std::string& ip, int port) {
    std::string endpoint = ip + ":" + std::to_string(port);
    auto r = adb_.connect(ip, port);
    std::string text = transport::rawOutput(r);
    if (r.is_err() || !parser::isConnectSuccess(text)) {
        PLOG_WARN("wireless", "connect %s failed: %s", endpoint.c_str(), parser::trim(text).c_str());
        log("Failed to connect to " + endpoint, "error");
        return Error(ErrorKind::ConnectionTimeout, "could not connect to " + endpoint,
                     parser::trim(text), r.is_err() ? r.error().code : 0);
    }
    PLOG_INFO("wireless", "Connected to %s", endpoint.c_str());
    log("Connected to " + endpoint, "info");
    return Ok();
}

Result<void> WirelessManager::checkPaired(const Result<std::string>& r, const std::string& target) {
    std::string text = transport::rawOutput(r);
    if (r.is_err() || !parser::isPairSuccess(text)) {
        PLOG_WARN("wireless", "pair %s failed: %s", target.c_str(), parser::trim(text).c_str());
        log("Pairing failed: " + parser::trim(text), "error");
        return Error(ErrorKind::PairingFailure, "pairing with " + target + " failed",
                     parser::trim(text), r.is_err() ? r.error().code : 0);
    }
    log("Paired with " + target, "info");
    return Ok();
}

Result<void> WirelessManager::pairAndConnect(const std::string& ip, std::optional<int> pairing_port,
                                             const std::string& code, int connect_port) {
    if (pairing_port && !code.empty()) {
        std::string target = ip + ":" + std::to_string(*pairing_port);
        log("Pairing with " + target + "...", "info");
        auto paired = checkPaired(adb_.pair(ip, *pairing_port, code), target);
        if (paired.is_err()) return paired;
    }

    auto connected = connectEndpoint(ip, connect_port);
    if (connected.is_err()) return connected;

    settleAndRefresh();
    return Ok();
}

// =============================================================================
// Discovered device: pair, then wait for the connect service
// =============================================================================

std::optional<parser::ServiceRecord> WirelessManager::lookupConnectService(
        const WirelessCandidate& target) {
    auto listing = adb_.listServices();
    if (listing.is_err()) {
        PLOG_WARN("wireless", "mDNS refresh failed: %s", listing.error().message.c_str());
        return std::nullopt;
    }
    // "adb-XYZ._adb-tls-pairing._tcp.local." advertises connect as "adb-XYZ"
    std::string instance;
    if (target.pairing_service) {
        auto cut = target.pairing_service->find("._adb-tls-pairing");
        if (cut != std::string::npos) instance = target.pairing_service->substr(0, cut);
    }
    for (auto& record : parser::parseMdnsServices(listing.value())) {
        if (record.role == parser::ServiceRole::Pairing || record.port <= 0) continue;
        if (record.ip == target.ip || (!instance.empty() && record.name == instance)) return record;
    }
    return std::nullopt;
}

Result<std::string> WirelessManager::connectCandidate(const WirelessCandidate& target,
                                                      const std::string& code,
                                                      std::optional<int> connect_port) {
    if (!code.empty()) {
        Result<void> paired = Ok();
        if (target.pairing_port) {
            std::string where = target.ip + ":" + std::to_string(*target.pairing_port);
            log("Pairing with " + where + "...", "info");
            paired = checkPaired(adb_.pair(target.ip, *target.pairing_port, code), where);
        } else if (target.pairing_service) {
            log("Pairing with " + *target.pairing_service + "...", "info");
            paired = checkPaired(adb_.pairService(*target.pairing_service, code), *target.pairing_service);
        } else {
            log("No pairing service known for " + target.ip, "error");
            return Err<std::string>(ErrorKind::PairingFailure,
                                    "no pairing port or service for " + target.ip);
        }
        if (paired.is_err()) return paired.error();
    }

    std::string ip = target.ip;
    std::optional<int> port = connect_port ? connect_port : target.connect_port;
    log("Waiting to complete connection (up to " +
        std::to_string(wait_.deadline.count() / 1000) + " seconds)...", "info");

    const auto started = std::chrono::steady_clock::now();
    std::chrono::milliseconds waited{0};
    std::optional<std::chrono::milliseconds> last_refresh;
    bool scanned = false;
    std::string last_error;
    auto pause = [&](std::chrono::milliseconds d) {
        if (sleep_) sleep_(d);
        waited += d;
    };
    auto expired = [&] {
        return waited >= wait_.deadline ||
               std::chrono::steady_clock::now() - started >= wait_.deadline;
    };

    do {
        if (!port && (!last_refresh || waited - *last_refresh >= wait_.mdns_refresh)) {
            last_refresh = waited;
            if (auto record = lookupConnectService(target)) {
                port = record->port;
                if (!record->ip.empty()) ip = record->ip;
                log("Found connect service on " + ip + ":" + std::to_string(*port), "info");
            }
        }
        if (!port && !scanned && port_scanner_) {
            scanned = true;
            log("Scanning " + ip + " ports " + std::to_string(CONNECT_PORT_FIRST) + "-" +
                std::to_string(CONNECT_PORT_LAST) + " for wireless debugging...", "info");
            auto found = port_scanner_(ip, target.pairing_port);
            if (found.is_err()) {
                log("Port scan failed: " + found.error().message, "error");
            } else if (found.value()) {
                port = *found.value();
                log("Detected wireless debugging port " + std::to_string(*port), "info");
            }
        }
        if (!port) {
            pause(wait_.missing_info_delay);
            continue;
        }

        auto r = adb_.connect(ip, *port);
        std::string text = transport::rawOutput(r);
        if (r.is_ok() && parser::isConnectSuccess(text)) {
            std::string endpoint = ip + ":" + std::to_string(*port);
            PLOG_INFO("wireless", "Connected to %s", endpoint.c_str());
            log("Connected to " + endpoint, "info");
            settleAndRefresh();
            return Ok(endpoint);
        }
        last_error = parser::trim(text);
        PLOG_DEBUG("wireless", "connect %s:%d: %s", ip.c_str(), *port, last_error.c_str());
        pause(wait_.retry_delay);
    } while (!expired());

    log("Automatic connection failed. Make sure wireless debugging is open on the device "
        "and try again.", "error");
    std::string endpoint = port ? ip + ":" + std::to_string(*port) : ip;
    return Error(ErrorKind::ConnectionTimeout, "could not connect to " + endpoint, last_error, 0);
}

// =============================================================================
// USB -> WiFi handoff
// =============================================================================

Result<std::string> WirelessManager::handoffToWireless(const Device& device) {
    if (device.isWifi()) {
        return Err<std::string>(ErrorKind::Generic,
                                device.serial + " is already a wireless connection");
    }

    log("Switching " + device.serial + " to wireless debugging on port " +
        std::to_string(tcp_port_) + "...", "info");
    auto tcp = adb_.setNetworkMode(device.serial, tcp_port_);
    if (tcp.is_err()) {
        log("Failed to enable TCP mode: " + tcp.error().message, "error");
        return tcp.error();
    }
    // adbd restarts on the device
    if (sleep_) sleep_(settle_delay_);

    auto ip = devices_.getWlanAddress(device.serial);
    if (ip.is_err()) {
        log(ip.error().message, "error");
        return ip.error();
    }

    auto connected = connectEndpoint(ip.value(), tcp_port_);
    if (connected.is_err()) return connected.error();

    settleAndRefresh();
    return Ok(ip.value() + ":" + std::to_string(tcp_port_));
}

// =============================================================================
// Developer settings
// =============================================================================

bool WirelessManager::enableWirelessDebugging(const std::string& serial) {
    auto on = adb_.shell(serial, "settings put global adb_wifi_enabled 1");
    if (on.is_err() || !parser::trim(on.value()).empty()) {
        PLOG_WARN("wireless", "adb_wifi_enabled on %s: %s", serial.c_str(),
                  parser::trim(transport::rawOutput(on)).c_str());
        return false;
    }

    auto tiles = adb_.shell(serial, "settings get secure sysui_qs_tiles");
    if (tiles.is_err()) return false;
    std::string current = parser::trim(tiles.value());
    if (current.find(WIRELESS_DEBUG_TILE) != std::string::npos) return true;

    std::string updated = (current.empty() || current == "null")
        ? std::string(WIRELESS_DEBUG_TILE)
        : current + "," + WIRELESS_DEBUG_TILE;
    // Tile id contains '$', quote it for the device shell
    auto put = adb_.shell(serial, "settings put secure sysui_qs_tiles '" + updated + "'");
    return put.is_ok() && parser::trim(put.value()).empty();
}

bool WirelessManager::enableStayAwake(const std::string& serial) {
    // 7 = AC | USB | wireless
    auto r = adb_.shell(serial, "settings put global stay_on_while_plugged_in 7");
    return r.is_ok() && parser::trim(r.value()).empty();
}

std::vector<WirelessManager::ToggleResult> WirelessManager::applyDeveloperToggles(
        const std::string& serial) {
    std::vector<ToggleResult> results;
    results.emplace_back(TOGGLE_WIRELESS_DEBUGGING, enableWirelessDebugging(serial));
    results.emplace_back(TOGGLE_STAY_AWAKE, enableStayAwake(serial));
    for (const auto& r : results) {
        log(r.first + ": " + (r.second ? "enabled" : "failed"), r.second ? "info" : "error");
    }
    return results;
}

} // namespace pelo
