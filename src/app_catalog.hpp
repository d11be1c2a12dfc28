// =============================================================================
// PeloBridge - App catalog and setup guides
// =============================================================================
// apps_config.json:
//   {"apps": {"<name>": {"url": ..., "package": ..., "abi": ..., "description": ...}}}
// Guides:
//   {"steps": [{"title": ..., "description": ...}]}
// =============================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "result.hpp"

namespace pelo {

constexpr const char* ABI_ARM64 = "arm64-v8a";
constexpr const char* ABI_ARMV7 = "armeabi-v7a";

struct CatalogEntry {
    std::string name;        // catalog key, unique
    std::string description;
    std::string url;
    std::optional<std::string> package;
    std::optional<std::string> abi;
    bool selected = false;   // session-local
};

struct GuideStep {
    std::string title;
    std::string description;
};

// All entries in document order (no ABI filtering)
Result<std::vector<CatalogEntry>> parseCatalog(const nlohmann::ordered_json& doc);

// armeabi-v7a -> only v7a entries; anything else, or unknown -> only arm64
// entries; untagged entries are never returned
std::vector<CatalogEntry> filterForAbi(const std::vector<CatalogEntry>& entries,
                                       const std::optional<std::string>& device_abi);

// Read + parse + filter. Missing/broken file -> ConfigError.
Result<std::vector<CatalogEntry>> loadCatalog(const std::string& path,
                                              const std::optional<std::string>& device_abi);

Result<std::vector<GuideStep>> parseGuide(const nlohmann::json& doc);
Result<std::vector<GuideStep>> loadGuide(const std::string& path);

} // namespace pelo
