// =============================================================================
// PeloBridge - APK installer and signature-conflict resolver
// =============================================================================
// Per catalog entry: resolve URL (GitHub "latest release" -> asset) ->
// download to the temp directory -> adb install -> on
// INSTALL_FAILED_UPDATE_INCOMPATIBLE ask the caller, uninstall the installed
// copy and retry once. Batch operations never abort on a single failure.
// =============================================================================
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "adb_device_manager.hpp"
#include "app_catalog.hpp"
#include "http_client.hpp"
#include "log_ring.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"

namespace pelo {

// (app name) -> uninstall the old copy and reinstall?
using ConfirmReinstall = std::function<bool(const std::string& app_name)>;

struct InstallOutcome {
    std::string name;
    bool success = false;
    ErrorKind error = ErrorKind::Generic;   // valid when !success
    std::string message;
};

struct InstallReport {
    std::vector<InstallOutcome> outcomes;

    size_t succeeded() const;
    size_t failed() const { return outcomes.size() - succeeded(); }
};

struct UninstallTally {
    int success = 0;
    int fail = 0;
};

class Installer {
public:
    static constexpr const char* GITHUB_API_USER_AGENT = "PeloBridge/1.0";
    static constexpr const char* GITHUB_API_ACCEPT = "application/vnd.github+json";

    Installer(transport::AdbTransport& adb, AdbDeviceManager& devices, HttpClient& http,
              std::string temp_dir, LogSink log = nullptr);

    // Any failure falls back to url unchanged
    std::string resolveDownloadUrl(const std::string& url,
                                   const std::optional<std::string>& package);

    Result<void> installEntry(const std::string& serial, const CatalogEntry& entry,
                              const ConfirmReinstall& confirm);
    InstallReport installEntries(const std::string& serial,
                                 const std::vector<CatalogEntry>& entries,
                                 const ConfirmReinstall& confirm);
    Result<void> installLocalApk(const std::string& serial, const std::string& apk_path,
                                 const ConfirmReinstall& confirm);

    // Install + at most one uninstall/retry; returns the final raw output.
    // InstallConflict when the conflict is declined or its package unknown,
    // TransportFailure when adb itself could not run
    Result<std::string> installResolvingConflict(const std::string& serial,
                                                 const std::string& apk_path,
                                                 const std::string& app_name,
                                                 const std::optional<std::string>& package_hint,
                                                 const ConfirmReinstall& confirm);

    // Standard uninstall, escalated to "--user 0" on failure
    UninstallTally uninstallBatch(const std::string& serial,
                                  const std::vector<std::string>& packages);

    Result<std::vector<std::string>> findPelotonPackages(const std::string& serial);

    // "peloton" and none of affernet/input/sensor, case-insensitive, sorted
    static std::vector<std::string> filterPelotonPackages(const std::vector<std::string>& all);
    // github.com/<owner>/<repo>/releases/{latest,tag/<t>} -> API URL; nullopt otherwise
    static std::optional<std::string> githubApiUrl(const std::string& url);
    // Asset download URL from a releases API body: exact name, .apk, first
    static std::optional<std::string> pickReleaseAsset(const std::string& body,
                                                       const std::optional<std::string>& package);
    // package id or name with spaces as '_', always ending in .apk
    static std::string tempFileName(const CatalogEntry& entry);

private:
    void log(const std::string& message, const std::string& category) const;

    transport::AdbTransport& adb_;
    AdbDeviceManager& devices_;
    HttpClient& http_;
    std::string temp_dir_;
    LogSink log_;
};

} // namespace pelo
