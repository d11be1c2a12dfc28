#include "update_checker.hpp"
#include "installer.hpp"
#include "pelo_log.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <nlohmann/json.hpp>

namespace pelo {

UpdateChecker::UpdateChecker(HttpClient& http, std::string releases_url, std::string current_version)
    : http_(http), releases_url_(std::move(releases_url)), current_(std::move(current_version)) {}

std::vector<int> UpdateChecker::parseVersion(const std::string& text) {
    std::vector<int> parts;
    size_t i = 0;
    if (i < text.size() && (text[i] == 'v' || text[i] == 'V')) ++i;
    while (i < text.size() && std::isdigit((unsigned char)text[i])) {
        // Oversized components clamp to INT_MAX
        int value = 0;
        while (i < text.size() && std::isdigit((unsigned char)text[i])) {
            int digit = text[i] - '0';
            if (value > (std::numeric_limits<int>::max() - digit) / 10) {
                value = std::numeric_limits<int>::max();
            } else {
                value = value * 10 + digit;
            }
            ++i;
        }
        parts.push_back(value);
        if (i < text.size() && text[i] == '.') ++i;
        else break;
    }
    return parts;
}

int UpdateChecker::compareVersions(const std::string& a, const std::string& b) {
    auto va = parseVersion(a);
    auto vb = parseVersion(b);
    size_t n = std::max(va.size(), vb.size());
    for (size_t i = 0; i < n; ++i) {
        int x = i < va.size() ? va[i] : 0;
        int y = i < vb.size() ? vb[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}

Result<UpdateInfo> UpdateChecker::check() {
    if (releases_url_.empty()) {
        return Err<UpdateInfo>(ErrorKind::ConfigError, "no update.releases_url configured");
    }
    HttpHeaders headers = {
        {"User-Agent", Installer::GITHUB_API_USER_AGENT},
        {"Accept", Installer::GITHUB_API_ACCEPT},
    };
    auto r = http_.get(releases_url_, headers);
    if (r.is_err()) return r.error();
    if (r.value().status != 200) {
        return Err<UpdateInfo>(ErrorKind::DownloadFailure,
                               "release lookup returned HTTP " + std::to_string(r.value().status),
                               r.value().status);
    }

    nlohmann::json doc = nlohmann::json::parse(r.value().body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("tag_name") ||
        !doc["tag_name"].is_string()) {
        return Err<UpdateInfo>(ErrorKind::DownloadFailure, "release has no tag_name");
    }

    UpdateInfo info;
    info.current = current_;
    info.latest = doc["tag_name"].get<std::string>();
    if (!info.latest.empty() && (info.latest[0] == 'v' || info.latest[0] == 'V')) {
        info.latest.erase(0, 1);
    }
    info.available = compareVersions(info.latest, current_) > 0;
    PLOG_INFO("update", "current=%s latest=%s", current_.c_str(), info.latest.c_str());
    return Ok(info);
}

} // namespace pelo
