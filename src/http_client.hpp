// =============================================================================
// PeloBridge - HTTP GET / download
// =============================================================================
// Windows: WinHTTP, retried through curl.exe when the TLS handshake fails.
// Elsewhere: libcurl.
// Redirects are followed up to a fixed hop count, after which the request
// fails. Only 200 counts as success for downloads.
// =============================================================================
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config_loader.hpp"
#include "log_ring.hpp"
#include "result.hpp"
#include "transport/process_runner.hpp"

namespace pelo {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int status = 0;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers) = 0;
    // Stream the body to path; non-200 or transport error -> DownloadFailure
    virtual Result<void> download(const std::string& url, const HttpHeaders& headers,
                                  const std::string& path) = 0;
};

#ifndef _WIN32
class LibCurlHttpClient : public HttpClient {
public:
    explicit LibCurlHttpClient(int max_redirects);

    Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers) override;
    Result<void> download(const std::string& url, const HttpHeaders& headers,
                          const std::string& path) override;

private:
    int max_redirects_;
};
#endif

// curl.exe fallback behind WinHttpClient
class CurlCliHttpClient : public HttpClient {
public:
    CurlCliHttpClient(std::string program, int max_redirects,
                      transport::CommandRunner runner = transport::runProcess);

    Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers) override;
    Result<void> download(const std::string& url, const HttpHeaders& headers,
                          const std::string& path) override;

    // curl argument list (exposed for tests)
    std::vector<std::string> buildArgs(const std::string& url, const HttpHeaders& headers,
                                       const std::string& output_path) const;

private:
    std::string program_;
    int max_redirects_;
    transport::CommandRunner runner_;
};

#ifdef _WIN32
class WinHttpClient : public HttpClient {
public:
    WinHttpClient(int max_redirects, LogSink sink);

    Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers) override;
    Result<void> download(const std::string& url, const HttpHeaders& headers,
                          const std::string& path) override;

private:
    // TLS failures are retried with curl.exe
    CurlCliHttpClient fallback_;
    int max_redirects_;
    LogSink sink_;
};
#endif

std::unique_ptr<HttpClient> makeHttpClient(const config::InstallConfig& cfg, LogSink sink);

// Browser-like headers some APK hosts require
HttpHeaders downloadHeaders(const std::string& url);

} // namespace pelo
