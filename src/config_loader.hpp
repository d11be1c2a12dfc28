#pragma once
// =============================================================================
// PeloBridge Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json
// =============================================================================

#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "pelo_log.hpp"

namespace pelo {
namespace config {

struct AdbConfig {
    std::string path;                    // empty = locate "adb" on PATH
    std::string server_host = "127.0.0.1";
    int server_port = 5037;
    int command_timeout_ms = 30000;
    int pair_timeout_ms = 90000;
    bool prefer_socket = false;          // force the adb server socket client
};

struct RegistryConfig {
    int heartbeat_interval_ms = 5000;
};

struct WirelessConfig {
    int settle_delay_ms = 2000;
    int probe_timeout_ms = 300;
    int default_port = 5555;
    // Connecting a freshly paired device
    int connect_wait_ms = 120000;
    int mdns_refresh_ms = 10000;
    int connect_retry_ms = 5000;
    int connect_info_wait_ms = 3000;
};

struct CatalogConfig {
    std::string apps_path = "apps_config.json";
    std::string guides_dir = ".";
};

struct InstallConfig {
    std::string temp_dir;                // empty = system temp directory
    int max_redirects = 5;
};

struct MediaConfig {
    std::string save_location;           // empty = ~/PeloBridge
};

struct UpdateConfig {
    std::string releases_url;            // GitHub releases/latest API URL; empty = no update check
};

struct LogConfig {
    std::string log_path = "pelobridge.log";
    int ring_capacity = 1000;
    std::string level = "info";
};

struct AppConfig {
    AdbConfig adb;
    RegistryConfig registry;
    WirelessConfig wireless;
    CatalogConfig catalog;
    InstallConfig install;
    MediaConfig media;
    UpdateConfig update;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        PLOG_WARN("config", "%s.%s: %s", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig def;

    config.adb.path = jsonGet<std::string>(j, "adb", "path", def.adb.path);
    config.adb.server_host = jsonGet<std::string>(j, "adb", "server_host", def.adb.server_host);
    config.adb.server_port = jsonGet<int>(j, "adb", "server_port", def.adb.server_port);
    config.adb.command_timeout_ms = jsonGet<int>(j, "adb", "command_timeout_ms", def.adb.command_timeout_ms);
    config.adb.pair_timeout_ms = jsonGet<int>(j, "adb", "pair_timeout_ms", def.adb.pair_timeout_ms);
    config.adb.prefer_socket = jsonGet<bool>(j, "adb", "prefer_socket", def.adb.prefer_socket);

    config.registry.heartbeat_interval_ms =
        jsonGet<int>(j, "registry", "heartbeat_interval_ms", def.registry.heartbeat_interval_ms);

    config.wireless.settle_delay_ms = jsonGet<int>(j, "wireless", "settle_delay_ms", def.wireless.settle_delay_ms);
    config.wireless.probe_timeout_ms = jsonGet<int>(j, "wireless", "probe_timeout_ms", def.wireless.probe_timeout_ms);
    config.wireless.default_port = jsonGet<int>(j, "wireless", "default_port", def.wireless.default_port);
    config.wireless.connect_wait_ms = jsonGet<int>(j, "wireless", "connect_wait_ms", def.wireless.connect_wait_ms);
    config.wireless.mdns_refresh_ms = jsonGet<int>(j, "wireless", "mdns_refresh_ms", def.wireless.mdns_refresh_ms);
    config.wireless.connect_retry_ms = jsonGet<int>(j, "wireless", "connect_retry_ms", def.wireless.connect_retry_ms);
    config.wireless.connect_info_wait_ms =
        jsonGet<int>(j, "wireless", "connect_info_wait_ms", def.wireless.connect_info_wait_ms);

    config.catalog.apps_path = jsonGet<std::string>(j, "catalog", "apps_path", def.catalog.apps_path);
    config.catalog.guides_dir = jsonGet<std::string>(j, "catalog", "guides_dir", def.catalog.guides_dir);

    config.install.temp_dir = jsonGet<std::string>(j, "install", "temp_dir", def.install.temp_dir);
    config.install.max_redirects = jsonGet<int>(j, "install", "max_redirects", def.install.max_redirects);

    config.media.save_location = jsonGet<std::string>(j, "media", "save_location", def.media.save_location);

    config.update.releases_url = jsonGet<std::string>(j, "update", "releases_url", def.update.releases_url);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
    config.log.ring_capacity = jsonGet<int>(j, "log", "ring_capacity", def.log.ring_capacity);
    config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);

    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../config.json");
    }
    if (!file.is_open()) {
        PLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        PLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    PLOG_INFO("config", "Loaded %s (heartbeat=%dms settle=%dms probe=%dms)",
              configPath.c_str(), config.registry.heartbeat_interval_ms,
              config.wireless.settle_delay_ms, config.wireless.probe_timeout_ms);
    return config;
}

} // namespace config
} // namespace pelo
