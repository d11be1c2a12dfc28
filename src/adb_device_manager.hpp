#pragma once
#include <optional>
#include <string>
#include <vector>

#include "device.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"

namespace pelo {

/**
 * ADB Device Manager
 * Device-level queries on top of the transport: enumeration with name/ABI
 * lookup, package listing, WLAN address, rotation, launchers.
 * Holds no state of its own; the registry owns the device list.
 */
class AdbDeviceManager {
public:
    explicit AdbDeviceManager(transport::AdbTransport& adb) : adb_(adb) {}

    // Devices in "device" state, with name and ABI filled in
    Result<std::vector<Device>> listDevices();

    // "<manufacturer> <model>" trimmed; nullopt if both are empty
    std::optional<std::string> getDeviceName(const std::string& serial);
    // ro.product.cpu.abi
    std::optional<std::string> getDeviceAbi(const std::string& serial);

    Result<std::vector<std::string>> listPackages(const std::string& serial);

    // IPv4 of wlan0; NoNetworkAddress when the device has none
    Result<std::string> getWlanAddress(const std::string& serial);

    // --- Display rotation ---
    Result<int> getRotation(const std::string& serial);
    // Turns auto-rotate off first so the fixed rotation sticks
    Result<void> setRotation(const std::string& serial, int rotation);
    Result<bool> getAutoRotate(const std::string& serial);
    Result<void> setAutoRotate(const std::string& serial, bool enabled);

    // Packages answering the HOME intent
    Result<std::vector<std::string>> getInstalledLaunchers(const std::string& serial);
    // App info screen for package on the device
    Result<void> openAppSettings(const std::string& serial, const std::string& package);

    // Delete file from device
    Result<void> deleteFile(const std::string& serial, const std::string& remote_path);

private:
    std::string getDeviceProp(const std::string& serial, const std::string& prop);
    Result<void> putSetting(const std::string& serial, const std::string& ns,
                            const std::string& key, const std::string& value);

    transport::AdbTransport& adb_;
};

} // namespace pelo
