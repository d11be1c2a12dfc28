#include "adb_output_parser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <utility>

namespace pelo::parser {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) parts.push_back(token);
    return parts;
}

std::vector<std::string> splitLines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// =============================================================================
// Devices
// =============================================================================

std::vector<transport::DeviceEntry> parseDeviceList(const std::string& text) {
    std::vector<transport::DeviceEntry> devices;
    for (const auto& raw : splitLines(text)) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        if (line.rfind("List of devices", 0) == 0) continue;
        if (line[0] == '*') continue;  // "* daemon started successfully"

        auto parts = splitWhitespace(line);
        if (parts.size() < 2) continue;
        devices.push_back({parts[0], parts[1]});
    }
    return devices;
}

// =============================================================================
// Install
// =============================================================================

bool isSuccess(const std::string& text) {
    return text.find("Success") != std::string::npos;
}

bool isSignatureConflict(const std::string& text) {
    return text.find("INSTALL_FAILED_UPDATE_INCOMPATIBLE") != std::string::npos;
}

InstallStatus classifyInstall(const std::string& text) {
    if (isSignatureConflict(text)) return InstallStatus::UpdateIncompatible;
    if (isSuccess(text)) return InstallStatus::Success;
    return InstallStatus::Failure;
}

std::optional<std::string> extractConflictingPackage(const std::string& text) {
    static const std::regex re(R"(Package\s+([a-zA-Z0-9_\.]+)\s+signatures)");
    std::smatch m;
    if (std::regex_search(text, m, re)) return m[1].str();
    return std::nullopt;
}

std::vector<std::string> parsePackageList(const std::string& text) {
    static const std::regex re(R"(package:([^\s]+))");
    std::vector<std::string> packages;
    for (const auto& raw : splitLines(text)) {
        std::string line = trim(raw);
        if (line.rfind("package:", 0) == 0) {
            std::string pkg = trim(line.substr(8));
            if (!pkg.empty()) packages.push_back(pkg);
        } else if (line.find("package:") != std::string::npos) {
            std::smatch m;
            if (std::regex_search(line, m, re)) packages.push_back(m[1].str());
        }
    }
    return packages;
}

// =============================================================================
// Wireless
// =============================================================================

const char* serviceRoleName(ServiceRole role) {
    switch (role) {
        case ServiceRole::Pairing:   return "pairing";
        case ServiceRole::Connect:   return "connect";
        case ServiceRole::Unlabeled: return "unlabeled";
    }
    return "unlabeled";
}

ServiceRole roleForServiceType(const std::string& service_type) {
    if (service_type.find("_adb-tls-pairing") != std::string::npos) return ServiceRole::Pairing;
    if (service_type.find("_adb-tls-connect") != std::string::npos) return ServiceRole::Connect;
    if (service_type.find("_adb._tcp") != std::string::npos) return ServiceRole::Connect;
    return ServiceRole::Unlabeled;
}

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string stripTrailingDot(std::string s) {
    while (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

// "10.0.0.5:37000" / "[fe80::1]:37000" -> host, port ("" when absent)
std::pair<std::string, std::string> splitHostPort(const std::string& token) {
    std::string host = trim(token);
    if (!host.empty() && host[0] == '[') {
        auto closing = host.find(']');
        if (closing != std::string::npos) {
            std::string rest = host.substr(closing + 1);
            if (!rest.empty() && rest[0] == ':') rest.erase(0, 1);
            return {host.substr(1, closing - 1), isDigits(rest) ? rest : ""};
        }
    }
    auto colon = host.rfind(':');
    if (colon != std::string::npos && isDigits(host.substr(colon + 1))) {
        std::string h = host.substr(0, colon);
        h.erase(std::remove(h.begin(), h.end(), '['), h.end());
        h.erase(std::remove(h.begin(), h.end(), ']'), h.end());
        return {h, host.substr(colon + 1)};
    }
    return {host, ""};
}

std::string buildServiceName(const std::string& instance, const std::string& type) {
    std::string base = stripTrailingDot(instance + "." + type);
    const std::string local = ".local";
    if (base.size() < local.size() || base.compare(base.size() - local.size(), local.size(), local) != 0) {
        base += local;
    }
    return base + ".";
}

} // namespace

std::vector<ServiceRecord> parseMdnsServices(const std::string& text, size_t* skipped) {
    std::vector<ServiceRecord> records;
    size_t unparsed = 0;
    for (const auto& raw : splitLines(text)) {
        std::string line = trim(raw);
        if (line.empty()) continue;
        if (toLower(line).rfind("list of discovered", 0) == 0) continue;
        if (line.rfind("====", 0) == 0 || line.rfind("----", 0) == 0) continue;

        auto parts = splitWhitespace(line);
        if (parts.size() < 3) {
            ++unparsed;
            continue;
        }

        ServiceRecord rec;
        rec.name = stripTrailingDot(parts[0]);
        rec.service_type = stripTrailingDot(parts[1]);
        auto host_port = splitHostPort(parts.back());
        if (host_port.second.empty() && parts.size() >= 4 && isDigits(parts.back())) {
            host_port = {parts[parts.size() - 2], parts.back()};
        }
        if (rec.name.empty() || host_port.first.empty() || host_port.second.empty()) {
            ++unparsed;
            continue;
        }
        rec.ip = host_port.first;
        rec.port = std::stoi(host_port.second.substr(0, 6));
        if (rec.port <= 0 || rec.port > 65535) {
            ++unparsed;
            continue;
        }
        rec.service_name = buildServiceName(rec.name, rec.service_type);
        rec.role = roleForServiceType(rec.service_type);
        records.push_back(std::move(rec));
    }
    if (skipped) *skipped = unparsed;
    return records;
}

bool isConnectSuccess(const std::string& text) {
    std::string lower = toLower(text);
    if (lower.find("connected to") == std::string::npos &&
        lower.find("already connected") == std::string::npos) {
        return false;
    }
    return lower.find("failed") == std::string::npos &&
           lower.find("cannot") == std::string::npos;
}

bool isPairSuccess(const std::string& text) {
    if (text.find("Successfully paired") != std::string::npos) return true;
    return text.find("Failed") == std::string::npos &&
           text.find("failed") == std::string::npos &&
           text.find("error") == std::string::npos;
}

std::optional<std::string> parseWlanAddress(const std::string& text) {
    static const std::regex inet_re(R"(inet\s+(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})/)");
    static const std::regex quad_re(R"(^\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}$)");
    std::smatch m;
    if (std::regex_search(text, m, inet_re)) return m[1].str();
    std::string t = trim(text);
    if (std::regex_match(t, quad_re)) return t;
    return std::nullopt;
}

// =============================================================================
// Device settings
// =============================================================================

std::optional<int> parseRotation(const std::string& text) {
    std::string t = trim(text);
    if (t.size() != 1 || t[0] < '0' || t[0] > '3') return std::nullopt;
    return t[0] - '0';
}

std::optional<bool> parseToggle(const std::string& text) {
    std::string t = trim(text);
    if (t == "1") return true;
    if (t == "0") return false;
    return std::nullopt;
}

std::vector<std::string> parseLaunchers(const std::string& text) {
    std::vector<std::string> packages;
    for (const auto& raw : splitLines(text)) {
        std::string line = trim(raw);
        if (line.empty() || line.find(' ') != std::string::npos) continue;
        auto slash = line.find('/');
        if (slash == std::string::npos || slash == 0) continue;
        std::string pkg = line.substr(0, slash);
        if (std::find(packages.begin(), packages.end(), pkg) == packages.end()) {
            packages.push_back(pkg);
        }
    }
    return packages;
}

} // namespace pelo::parser
