#include "app_catalog.hpp"
#include "pelo_log.hpp"

#include <fstream>

namespace pelo {

namespace {

std::optional<std::string> optionalString(const nlohmann::ordered_json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

Result<std::vector<CatalogEntry>> parseCatalog(const nlohmann::ordered_json& doc) {
    if (!doc.is_object() || !doc.contains("apps") || !doc["apps"].is_object()) {
        return Err<std::vector<CatalogEntry>>(ErrorKind::ConfigError, "catalog has no \"apps\" object");
    }

    std::vector<CatalogEntry> entries;
    for (const auto& item : doc["apps"].items()) {
        const auto& value = item.value();
        if (!value.is_object()) {
            PLOG_WARN("catalog", "Skipping %s: not an object", item.key().c_str());
            continue;
        }
        CatalogEntry entry;
        entry.name = item.key();
        entry.description = optionalString(value, "description").value_or("");
        entry.url = optionalString(value, "url").value_or("");
        entry.package = optionalString(value, "package");
        if (!entry.package) entry.package = optionalString(value, "package_name");
        entry.abi = optionalString(value, "abi");
        entries.push_back(std::move(entry));
    }
    return Ok(std::move(entries));
}

std::vector<CatalogEntry> filterForAbi(const std::vector<CatalogEntry>& entries,
                                       const std::optional<std::string>& device_abi) {
    const std::string wanted = (device_abi && *device_abi == ABI_ARMV7) ? ABI_ARMV7 : ABI_ARM64;
    std::vector<CatalogEntry> filtered;
    for (const auto& e : entries) {
        if (e.abi && *e.abi == wanted) filtered.push_back(e);
    }
    return filtered;
}

Result<std::vector<CatalogEntry>> loadCatalog(const std::string& path,
                                              const std::optional<std::string>& device_abi) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::vector<CatalogEntry>>(ErrorKind::ConfigError, "cannot open " + path);
    }
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return Err<std::vector<CatalogEntry>>(ErrorKind::ConfigError,
                                              path + ": " + e.what());
    }
    auto all = parseCatalog(doc);
    if (all.is_err()) return all;

    auto filtered = filterForAbi(all.value(), device_abi);
    PLOG_INFO("catalog", "Loaded %zu/%zu apps for ABI %s", filtered.size(), all.value().size(),
              device_abi ? device_abi->c_str() : "(unknown)");
    return Ok(std::move(filtered));
}

Result<std::vector<GuideStep>> parseGuide(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("steps") || !doc["steps"].is_array()) {
        return Err<std::vector<GuideStep>>(ErrorKind::ConfigError, "guide has no \"steps\" array");
    }
    std::vector<GuideStep> steps;
    for (const auto& s : doc["steps"]) {
        if (!s.is_object()) continue;
        GuideStep step;
        step.title = s.value("title", "");
        step.description = s.value("description", "");
        steps.push_back(std::move(step));
    }
    return Ok(std::move(steps));
}

Result<std::vector<GuideStep>> loadGuide(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::vector<GuideStep>>(ErrorKind::ConfigError, "cannot open " + path);
    }
    try {
        return parseGuide(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        return Err<std::vector<GuideStep>>(ErrorKind::ConfigError, path + ": " + e.what());
    }
}

} // namespace pelo
