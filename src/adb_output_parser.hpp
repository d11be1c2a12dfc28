// =============================================================================
// PeloBridge - adb output classification
// =============================================================================
// Every substring/pattern match against free-form adb text lives here.
// The patterns follow what the real tool prints; if its wording changes,
// this is the only file to touch.
// =============================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "transport/adb_transport.hpp"

namespace pelo::parser {

// --- general --------------------------------------------------------------

std::string trim(const std::string& s);
std::vector<std::string> splitWhitespace(const std::string& s);
std::vector<std::string> splitLines(const std::string& s);

// --- devices --------------------------------------------------------------

// "List of devices attached" + "<serial>\t<status>" lines (header optional,
// as the socket client gets the list without it). All statuses are kept.
std::vector<transport::DeviceEntry> parseDeviceList(const std::string& text);

// --- install / uninstall --------------------------------------------------

enum class InstallStatus { Success, UpdateIncompatible, Failure };

InstallStatus classifyInstall(const std::string& text);
// Output contains "Success"
bool isSuccess(const std::string& text);
// Output contains "INSTALL_FAILED_UPDATE_INCOMPATIBLE"
bool isSignatureConflict(const std::string& text);
// "Package <name> signatures do not match ..." -> name
std::optional<std::string> extractConflictingPackage(const std::string& text);

// "package:com.foo" lines from pm list packages
std::vector<std::string> parsePackageList(const std::string& text);

// --- wireless -------------------------------------------------------------

enum class ServiceRole { Pairing, Connect, Unlabeled };

const char* serviceRoleName(ServiceRole role);

struct ServiceRecord {
    std::string name;           // instance name, trailing dot removed
    std::string service_type;   // "_adb-tls-pairing._tcp"
    std::string service_name;   // "<instance>.<type>.local."
    std::string ip;
    int port = 0;
    ServiceRole role = ServiceRole::Unlabeled;
};

ServiceRole roleForServiceType(const std::string& service_type);
// "adb mdns services" listing -> records with a resolvable host and port.
// Accepts "ip:port", "[v6]:port" and "host port" forms; lines that cannot be
// parsed are counted in *skipped.
std::vector<ServiceRecord> parseMdnsServices(const std::string& text, size_t* skipped = nullptr);

// "connected to 10.0.0.5:5555" / "already connected to ..."
bool isConnectSuccess(const std::string& text);
// "Successfully paired to 10.0.0.5:37123 [guid=...]", or output free of
// any failure wording (older adb prints nothing useful on success)
bool isPairSuccess(const std::string& text);

// First "inet a.b.c.d/nn" of "ip addr show wlan0", or a bare dotted quad
// (getprop dhcp.wlan0.ipaddress)
std::optional<std::string> parseWlanAddress(const std::string& text);

// --- device settings ------------------------------------------------------

// "settings get system user_rotation" -> 0..3
std::optional<int> parseRotation(const std::string& text);
// "settings get system accelerometer_rotation" -> 0/1
std::optional<bool> parseToggle(const std::string& text);
// "cmd package query-activities --brief" -> package names, in order, deduped
std::vector<std::string> parseLaunchers(const std::string& text);

} // namespace pelo::parser
