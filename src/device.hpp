#pragma once
#include <optional>
#include <string>

namespace pelo {

enum class DeviceTransport { Usb, Wifi };

inline const char* transportName(DeviceTransport t) {
    return t == DeviceTransport::Wifi ? "wifi" : "usb";
}

/**
 * One adb-visible device. Replaced wholesale on each registry poll.
 * Serial "ip:port" -> wifi (ip/port split off the serial), anything else -> usb.
 */
struct Device {
    std::string serial;
    std::string status = "device";
    DeviceTransport transport = DeviceTransport::Usb;
    std::optional<std::string> ip;
    std::optional<std::string> port;
    std::optional<std::string> name;   // "<manufacturer> <model>"
    std::optional<std::string> abi;    // arm64-v8a / armeabi-v7a

    bool isWifi() const { return transport == DeviceTransport::Wifi; }

    // "Peloton RB-X • WiFi (10.0.0.5:5555)" / "Peloton RB-X • USB"
    std::string displayName() const {
        std::string n = name.value_or("");
        if (isWifi() && ip) {
            return n + " • WiFi (" + *ip + (port ? ":" + *port : "") + ")";
        }
        return n + " • USB";
    }

    bool operator==(const Device& o) const {
        return serial == o.serial && status == o.status && transport == o.transport &&
               ip == o.ip && port == o.port && name == o.name && abi == o.abi;
    }
    bool operator!=(const Device& o) const { return !(*this == o); }

    // Build from an "adb devices" serial
    static Device fromSerial(const std::string& serial, const std::string& status = "device") {
        Device d;
        d.serial = serial;
        d.status = status;
        auto colon = serial.find(':');
        if (colon != std::string::npos) {
            d.transport = DeviceTransport::Wifi;
            d.ip = serial.substr(0, colon);
            auto rest = serial.substr(colon + 1);
            auto next = rest.find(':');
            if (next != std::string::npos) rest = rest.substr(0, next);
            if (!rest.empty()) d.port = rest;
        }
        return d;
    }
};

} // namespace pelo
