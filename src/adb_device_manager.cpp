#include "adb_device_manager.hpp"
#include "adb_output_parser.hpp"
#include "pelo_log.hpp"

namespace pelo {

// =============================================================================
// Enumeration
// =============================================================================

Result<std::vector<Device>> AdbDeviceManager::listDevices() {
    auto entries = adb_.enumerate();
    if (entries.is_err()) return entries.error();

    std::vector<Device> devices;
    for (const auto& entry : entries.value()) {
        if (entry.status != "device") {
            PLOG_DEBUG("adb", "Skipping %s (%s)", entry.serial.c_str(), entry.status.c_str());
            continue;
        }
        Device d = Device::fromSerial(entry.serial, entry.status);
        d.name = getDeviceName(entry.serial);
        d.abi = getDeviceAbi(entry.serial);
        devices.push_back(std::move(d));
    }
    return Ok(std::move(devices));
}

std::string AdbDeviceManager::getDeviceProp(const std::string& serial, const std::string& prop) {
    auto r = adb_.getProperty(serial, prop);
    if (r.is_err()) {
        PLOG_WARN("adb", "getprop %s on %s failed: %s", prop.c_str(), serial.c_str(),
                  r.error().message.c_str());
        return {};
    }
    return parser::trim(r.value());
}

std::optional<std::string> AdbDeviceManager::getDeviceName(const std::string& serial) {
    std::string name = parser::trim(getDeviceProp(serial, "ro.product.manufacturer") + " " +
                                    getDeviceProp(serial, "ro.product.model"));
    if (name.empty()) return std::nullopt;
    return name;
}

std::optional<std::string> AdbDeviceManager::getDeviceAbi(const std::string& serial) {
    std::string abi = getDeviceProp(serial, "ro.product.cpu.abi");
    if (abi.empty()) return std::nullopt;
    return abi;
}

Result<std::vector<std::string>> AdbDeviceManager::listPackages(const std::string& serial) {
    auto r = adb_.shell(serial, "pm list packages");
    if (r.is_err()) return r.error();
    return Ok(parser::parsePackageList(r.value()));
}

Result<std::string> AdbDeviceManager::getWlanAddress(const std::string& serial) {
    auto r = adb_.shell(serial, "ip addr show wlan0");
    if (r.is_ok()) {
        if (auto ip = parser::parseWlanAddress(r.value())) return Ok(*ip);
    }
    std::string dhcp = getDeviceProp(serial, "dhcp.wlan0.ipaddress");
    if (auto ip = parser::parseWlanAddress(dhcp)) return Ok(*ip);

    return Err<std::string>(ErrorKind::NoNetworkAddress,
                            "Device has no WiFi address. Is it connected to a network?");
}

// =============================================================================
// Settings
// =============================================================================

Result<void> AdbDeviceManager::putSetting(const std::string& serial, const std::string& ns,
                                          const std::string& key, const std::string& value) {
    auto r = adb_.shell(serial, "settings put " + ns + " " + key + " " + value);
    if (r.is_err()) return r.error();
    // settings put prints nothing on success
    std::string out = parser::trim(r.value());
    if (!out.empty()) {
        return Error(ErrorKind::TransportFailure, "settings put " + key + ": " + out);
    }
    return Ok();
}

Result<int> AdbDeviceManager::getRotation(const std::string& serial) {
    auto r = adb_.shell(serial, "settings get system user_rotation");
    if (r.is_err()) return r.error();
    auto rotation = parser::parseRotation(r.value());
    if (!rotation) {
        // Unset on a fresh device means natural orientation
        return Ok(0);
    }
    return Ok(*rotation);
}

Result<void> AdbDeviceManager::setRotation(const std::string& serial, int rotation) {
    if (rotation < 0 || rotation > 3) {
        return Error(ErrorKind::Generic, "rotation must be 0-3");
    }
    auto off = putSetting(serial, "system", "accelerometer_rotation", "0");
    if (off.is_err()) return off;
    return putSetting(serial, "system", "user_rotation", std::to_string(rotation));
}

Result<bool> AdbDeviceManager::getAutoRotate(const std::string& serial) {
    auto r = adb_.shell(serial, "settings get system accelerometer_rotation");
    if (r.is_err()) return r.error();
    return Ok(parser::parseToggle(r.value()).value_or(false));
}

Result<void> AdbDeviceManager::setAutoRotate(const std::string& serial, bool enabled) {
    return putSetting(serial, "system", "accelerometer_rotation", enabled ? "1" : "0");
}

// =============================================================================
// Apps
// =============================================================================

Result<std::vector<std::string>> AdbDeviceManager::getInstalledLaunchers(const std::string& serial) {
    auto r = adb_.shell(serial,
        "cmd package query-activities --brief -a android.intent.action.MAIN "
        "-c android.intent.category.HOME");
    if (r.is_err()) return r.error();
    return Ok(parser::parseLaunchers(r.value()));
}

Result<void> AdbDeviceManager::openAppSettings(const std::string& serial, const std::string& package) {
    auto r = adb_.shell(serial,
        "am start -a android.settings.APPLICATION_DETAILS_SETTINGS -d package:" + package);
    if (r.is_err()) return r.error();
    if (r.value().find("Error") != std::string::npos) {
        return Error(ErrorKind::TransportFailure, parser::trim(r.value()));
    }
    return Ok();
}

Result<void> AdbDeviceManager::deleteFile(const std::string& serial, const std::string& remote_path) {
    auto r = adb_.shell(serial, "rm -f " + remote_path);
    if (r.is_err()) return r.error();
    return Ok();
}

} // namespace pelo
