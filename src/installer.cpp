#include "installer.hpp"
#include "adb_output_parser.hpp"
#include "pelo_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace pelo {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "https://host/path?q" -> host, path segments
bool splitUrl(const std::string& url, std::string& host, std::vector<std::string>& segments) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) return false;
    std::string rest = url.substr(scheme + 3);
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);

    auto slash = rest.find('/');
    host = lower(rest.substr(0, slash));
    segments.clear();
    if (slash == std::string::npos) return true;

    size_t pos = slash + 1;
    while (pos <= rest.size()) {
        auto next = rest.find('/', pos);
        std::string seg = rest.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (!seg.empty()) segments.push_back(seg);
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return true;
}

} // namespace

size_t InstallReport::succeeded() const {
    return (size_t)std::count_if(outcomes.begin(), outcomes.end(),
                                 [](const InstallOutcome& o) { return o.success; });
}

Installer::Installer(transport::AdbTransport& adb, AdbDeviceManager& devices, HttpClient& http,
                     std::string temp_dir, LogSink log)
    : adb_(adb), devices_(devices), http_(http), temp_dir_(std::move(temp_dir)), log_(std::move(log)) {
    if (temp_dir_.empty()) {
        std::error_code ec;
        auto tmp = fs::temp_directory_path(ec);
        temp_dir_ = ec ? std::string(".") : tmp.string();
    }
}

void Installer::log(const std::string& message, const std::string& category) const {
    if (log_) log_(message, category);
}

// =============================================================================
// URL resolution
// =============================================================================

std::optional<std::string> Installer::githubApiUrl(const std::string& url) {
    std::string host;
    std::vector<std::string> seg;
    if (!splitUrl(url, host, seg)) return std::nullopt;
    if (host != "github.com" || seg.size() < 2) return std::nullopt;

    const std::string base = "https://api.github.com/repos/" + seg[0] + "/" + seg[1];
    // /<owner>/<repo>/releases/tag/<tag>
    if (seg.size() >= 5 && seg[2] == "releases" && seg[3] == "tag") {
        return base + "/releases/tags/" + seg[4];
    }
    bool releases = std::find(seg.begin(), seg.end(), "releases") != seg.end();
    bool latest = std::find(seg.begin(), seg.end(), "latest") != seg.end();
    if (!releases || !latest) return std::nullopt;
    return base + "/releases/latest";
}

std::optional<std::string> Installer::pickReleaseAsset(const std::string& body,
                                                       const std::optional<std::string>& package) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    auto assets = doc.find("assets");
    if (assets == doc.end() || !assets->is_array() || assets->empty()) return std::nullopt;

    auto urlOf = [](const nlohmann::json& a) -> std::optional<std::string> {
        auto u = a.find("browser_download_url");
        if (u == a.end() || !u->is_string()) return std::nullopt;
        return u->get<std::string>();
    };

    if (package) {
        for (const auto& a : *assets) {
            if (a.value("name", "") == *package) return urlOf(a);
        }
    }
    for (const auto& a : *assets) {
        if (endsWith(lower(a.value("name", "")), ".apk")) return urlOf(a);
    }
    return urlOf(assets->front());
}

std::string Installer::resolveDownloadUrl(const std::string& url,
                                          const std::optional<std::string>& package) {
    std::string api = githubApiUrl(url).value_or(url);

    std::string host;
    std::vector<std::string> seg;
    if (!splitUrl(api, host, seg) || host.find("api.github.com") == std::string::npos) {
        return url;
    }

    log("Resolving GitHub API URL...", "info");
    HttpHeaders headers = {
        {"User-Agent", GITHUB_API_USER_AGENT},
        {"Accept", GITHUB_API_ACCEPT},
    };
    auto r = http_.get(api, headers);
    if (r.is_err()) {
        log("Error resolving URL: " + r.error().message, "error");
        return url;
    }
    if (r.value().status != 200) {
        PLOG_WARN("install", "GitHub API %s -> HTTP %d", api.c_str(), r.value().status);
        return url;
    }
    auto asset = pickReleaseAsset(r.value().body, package);
    if (!asset) {
        PLOG_WARN("install", "No usable release asset at %s", api.c_str());
        return url;
    }
    return *asset;
}

// =============================================================================
// Install
// =============================================================================

std::string Installer::tempFileName(const CatalogEntry& entry) {
    std::string name = entry.package.value_or("");
    if (name.empty()) {
        name = entry.name;
        std::replace(name.begin(), name.end(), ' ', '_');
    }
    if (!endsWith(lower(name), ".apk")) name += ".apk";
    return name;
}

Result<std::string> Installer::installResolvingConflict(const std::string& serial,
                                                        const std::string& apk_path,
                                                        const std::string& app_name,
                                                        const std::optional<std::string>& package_hint,
                                                        const ConfirmReinstall& confirm) {
    auto first = adb_.install(serial, apk_path);
    // Spawn / socket failure: nothing from the package manager to classify
    if (first.is_err() && first.error().output.empty()) return first.error();
    std::string output = transport::rawOutput(first);
    if (parser::classifyInstall(output) != parser::InstallStatus::UpdateIncompatible) {
        return Ok(output);
    }

    auto conflicting = parser::extractConflictingPackage(output);
    if (!conflicting) conflicting = package_hint;
    if (!conflicting) {
        PLOG_WARN("install", "%s: signature conflict with unknown package", app_name.c_str());
        return Error(ErrorKind::InstallConflict,
                     app_name + " conflicts with an installed package that could not be identified",
                     parser::trim(output), 0);
    }
    if (!confirm || !confirm(app_name)) {
        log("Reinstall of " + app_name + " declined", "info");
        return Error(ErrorKind::InstallConflict,
                     app_name + " conflicts with installed " + *conflicting + " (reinstall declined)",
                     parser::trim(output), 0);
    }

    log("Uninstalling old version of " + app_name + "...", "info");
    auto removed = adb_.uninstall(serial, *conflicting, false);
    if (!parser::isSuccess(transport::rawOutput(removed))) {
        // The retry reports the real outcome
        PLOG_WARN("install", "uninstall %s: %s", conflicting->c_str(),
                  parser::trim(transport::rawOutput(removed)).c_str());
    }

    log("Retrying install of " + app_name + "...", "info");
    auto retry = adb_.install(serial, apk_path);
    if (retry.is_err() && retry.error().output.empty()) return retry.error();
    return Ok(transport::rawOutput(retry));
}

Result<void> Installer::installEntry(const std::string& serial, const CatalogEntry& entry,
                                     const ConfirmReinstall& confirm) {
    std::string url = resolveDownloadUrl(entry.url, entry.package);
    log("Downloading " + entry.name + " from " + url + "...", "info");

    std::string apk_path = (fs::path(temp_dir_) / tempFileName(entry)).string();
    auto dl = http_.download(url, downloadHeaders(url), apk_path);
    if (dl.is_err()) {
        log("Failed to download " + entry.name + ": " + dl.error().message, "error");
        return dl;
    }

    log("Installing " + entry.name + "...", "info");
    auto r = installResolvingConflict(serial, apk_path, entry.name, entry.package, confirm);
    std::error_code ec;
    fs::remove(apk_path, ec);
    if (r.is_err()) {
        log("Error installing " + entry.name + ": " + r.error().message, "error");
        return r.error();
    }

    if (!parser::isSuccess(r.value())) {
        log("Error installing " + entry.name + ": " + parser::trim(r.value()), "error");
        return Error(ErrorKind::InstallFailure, "install of " + entry.name + " failed",
                     parser::trim(r.value()), 0);
    }
    log("Successfully installed " + entry.name, "info");
    return Ok();
}

InstallReport Installer::installEntries(const std::string& serial,
                                        const std::vector<CatalogEntry>& entries,
                                        const ConfirmReinstall& confirm) {
    InstallReport report;
    for (const auto& entry : entries) {
        InstallOutcome outcome;
        outcome.name = entry.name;
        auto r = installEntry(serial, entry, confirm);
        outcome.success = r.is_ok();
        if (r.is_err()) {
            outcome.error = r.error().kind;
            outcome.message = r.error().message;
        }
        report.outcomes.push_back(std::move(outcome));
    }
    PLOG_INFO("install", "Batch: %zu ok, %zu failed", report.succeeded(), report.failed());
    return report;
}

Result<void> Installer::installLocalApk(const std::string& serial, const std::string& apk_path,
                                        const ConfirmReinstall& confirm) {
    std::string file_name = fs::path(apk_path).filename().string();
    std::error_code ec;
    if (!fs::exists(apk_path, ec)) {
        log("APK not found: " + apk_path, "error");
        return Error(ErrorKind::InstallFailure, "no such file: " + apk_path);
    }
    log("Installing local APK: " + file_name, "info");

    auto r = installResolvingConflict(serial, apk_path, file_name, std::nullopt, confirm);
    if (r.is_err()) {
        log("Failed install: " + r.error().message, "error");
        return r.error();
    }
    if (!parser::isSuccess(r.value())) {
        log("Failed install: " + parser::trim(r.value()), "error");
        return Error(ErrorKind::InstallFailure, "install of " + file_name + " failed",
                     parser::trim(r.value()), 0);
    }
    log("Successfully installed local APK", "info");
    return Ok();
}

// =============================================================================
// Uninstall
// =============================================================================

UninstallTally Installer::uninstallBatch(const std::string& serial,
                                         const std::vector<std::string>& packages) {
    UninstallTally tally;
    for (const auto& pkg : packages) {
        log("Uninstalling " + pkg + "...", "info");
        if (parser::isSuccess(transport::rawOutput(adb_.uninstall(serial, pkg, false)))) {
            ++tally.success;
            log("Successfully uninstalled " + pkg, "status");
            continue;
        }

        log("Standard uninstall failed, trying user 0 override...", "info");
        std::string out = transport::rawOutput(adb_.uninstall(serial, pkg, true));
        if (parser::isSuccess(out)) {
            ++tally.success;
            log("Successfully uninstalled " + pkg + " (user 0)", "status");
        } else {
            ++tally.fail;
            log("Failed to uninstall " + pkg + ": " + parser::trim(out), "error");
        }
    }
    return tally;
}

std::vector<std::string> Installer::filterPelotonPackages(const std::vector<std::string>& all) {
    std::vector<std::string> picked;
    for (const auto& pkg : all) {
        std::string l = lower(pkg);
        if (l.find("peloton") == std::string::npos) continue;
        if (l.find("affernet") != std::string::npos ||
            l.find("input") != std::string::npos ||
            l.find("sensor") != std::string::npos) {
            continue;
        }
        picked.push_back(pkg);
    }
    std::sort(picked.begin(), picked.end());
    return picked;
}

Result<std::vector<std::string>> Installer::findPelotonPackages(const std::string& serial) {
    log("Scanning for Peloton packages...", "info");
    auto all = devices_.listPackages(serial);
    if (all.is_err()) {
        log("Scan failed: " + all.error().message, "error");
        return all.error();
    }
    return Ok(filterPelotonPackages(all.value()));
}

} // namespace pelo
