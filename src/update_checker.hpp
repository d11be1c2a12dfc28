#pragma once
#include <string>
#include <vector>

#include "http_client.hpp"
#include "result.hpp"

namespace pelo {

constexpr const char* PELO_VERSION = "1.0.0";

struct UpdateInfo {
    std::string current;
    std::string latest;      // release tag with any leading 'v' removed
    bool available = false;  // latest > current
};

/**
 * Latest-release check against a GitHub releases API URL.
 */
class UpdateChecker {
public:
    UpdateChecker(HttpClient& http, std::string releases_url,
                  std::string current_version = PELO_VERSION);

    Result<UpdateInfo> check();

    // "v1.2.10" -> {1, 2, 10}; non-numeric parts end the version
    static std::vector<int> parseVersion(const std::string& text);
    // <0, 0, >0 like strcmp; missing components count as 0
    static int compareVersions(const std::string& a, const std::string& b);

private:
    HttpClient& http_;
    std::string releases_url_;
    std::string current_;
};

} // namespace pelo
