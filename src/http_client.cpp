#include "http_client.hpp"
#include "pelo_log.hpp"

#include <filesystem>
#include <fstream>

#ifdef _WIN32
#include <windows.h>
#include <winhttp.h>
#else
#include <curl/curl.h>
#include <mutex>
#endif

namespace pelo {

namespace {

constexpr auto GET_TIMEOUT = std::chrono::seconds(60);
constexpr auto DOWNLOAD_TIMEOUT = std::chrono::minutes(10);
// curl exit code for --max-redirs exceeded
constexpr int CURL_TOO_MANY_REDIRECTS = 47;
constexpr int CURL_HTTP_ERROR = 22;

// Status line appended by -w; separated so it cannot merge with the body
const char* const STATUS_MARKER = "\n@@PELO_HTTP_STATUS@@";

void ensureParentDir(const std::string& path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
}

} // namespace

HttpHeaders downloadHeaders(const std::string& url) {
    HttpHeaders headers = {
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/122.0.0.0 Safari/537.36"},
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.9"},
    };
    if (url.find("teslacoilapps.com") != std::string::npos) {
        headers.push_back({"Referer", "https://teslacoilapps.com/"});
    }
    return headers;
}

// =============================================================================
// curl CLI (Windows TLS fallback)
// =============================================================================

CurlCliHttpClient::CurlCliHttpClient(std::string program, int max_redirects,
                                     transport::CommandRunner runner)
    : program_(std::move(program)), max_redirects_(max_redirects), runner_(std::move(runner)) {}

std::vector<std::string> CurlCliHttpClient::buildArgs(const std::string& url,
                                                      const HttpHeaders& headers,
                                                      const std::string& output_path) const {
    std::vector<std::string> args = {
        "--location", "--silent", "--show-error",
        "--max-redirs", std::to_string(max_redirects_),
    };
    if (!output_path.empty()) args.push_back("--fail");
    for (const auto& h : headers) {
        args.push_back("-H");
        args.push_back(h.first + ": " + h.second);
    }
    if (!output_path.empty()) {
        args.push_back("-o");
        args.push_back(output_path);
    } else {
        args.push_back("-w");
        args.push_back(std::string(STATUS_MARKER) + "%{http_code}");
    }
    args.push_back(url);
    return args;
}

Result<HttpResponse> CurlCliHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    auto run = runner_(program_, buildArgs(url, headers, ""),
                       std::chrono::duration_cast<std::chrono::milliseconds>(GET_TIMEOUT));
    if (run.is_err()) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "curl: " + run.error().message);
    }
    const auto& pr = run.value();
    if (pr.exit_status == CURL_TOO_MANY_REDIRECTS) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure,
                                 "redirect limit (" + std::to_string(max_redirects_) + ") exceeded");
    }
    if (pr.timed_out || pr.exit_status != 0) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure,
                                 "curl failed (" + std::to_string(pr.exit_status) + "): " + pr.err,
                                 pr.exit_status);
    }

    HttpResponse response;
    auto marker = pr.out.rfind(STATUS_MARKER);
    if (marker == std::string::npos) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "curl: missing status line");
    }
    response.body = pr.out.substr(0, marker);
    try {
        response.status = std::stoi(pr.out.substr(marker + std::string(STATUS_MARKER).size()));
    } catch (const std::exception&) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "curl: unreadable status line");
    }
    return Ok(std::move(response));
}

Result<void> CurlCliHttpClient::download(const std::string& url, const HttpHeaders& headers,
                                         const std::string& path) {
    ensureParentDir(path);
    auto run = runner_(program_, buildArgs(url, headers, path),
                       std::chrono::duration_cast<std::chrono::milliseconds>(DOWNLOAD_TIMEOUT));
    if (run.is_err()) {
        return Error(ErrorKind::DownloadFailure, "curl: " + run.error().message);
    }
    const auto& pr = run.value();
    if (pr.exit_status == CURL_TOO_MANY_REDIRECTS) {
        return Error(ErrorKind::DownloadFailure,
                     "redirect limit (" + std::to_string(max_redirects_) + ") exceeded");
    }
    if (pr.exit_status == CURL_HTTP_ERROR) {
        return Error(ErrorKind::DownloadFailure, "server returned an error status: " + pr.err, 22);
    }
    if (pr.timed_out || pr.exit_status != 0) {
        return Error(ErrorKind::DownloadFailure,
                     "curl failed (" + std::to_string(pr.exit_status) + "): " + pr.err,
                     pr.exit_status);
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorKind::DownloadFailure, "download produced no file");
    }
    return Ok();
}

// =============================================================================
// WinHTTP
// =============================================================================

#ifdef _WIN32

namespace {

struct WinHttpHandleDeleter {
    void operator()(HINTERNET h) { if (h) WinHttpCloseHandle(h); }
};
using WinHttpHandle = std::unique_ptr<void, WinHttpHandleDeleter>;

std::wstring widen(const std::string& s) {
    if (s.empty()) return {};
    int n = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), nullptr, 0);
    std::wstring w(n, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), &w[0], n);
    return w;
}

bool isTlsError(DWORD err) {
    return err == ERROR_WINHTTP_SECURE_FAILURE ||
           err == ERROR_WINHTTP_SECURE_CHANNEL_ERROR ||
           err == ERROR_WINHTTP_SECURE_INVALID_CA ||
           err == ERROR_WINHTTP_SECURE_CERT_DATE_INVALID ||
           err == ERROR_WINHTTP_SECURE_CERT_CN_INVALID;
}

// Body goes to `file` when given, else into response.body.
// On failure the WinHTTP error is in Error::code.
Result<HttpResponse> winHttpGet(const std::string& url, const HttpHeaders& headers,
                                int max_redirects, std::ofstream* file) {
    std::wstring wurl = widen(url);
    URL_COMPONENTS parts = {};
    parts.dwStructSize = sizeof(parts);
    wchar_t host[256] = {};
    wchar_t path[2048] = {};
    parts.lpszHostName = host;
    parts.dwHostNameLength = 256;
    parts.lpszUrlPath = path;
    parts.dwUrlPathLength = 2048;
    if (!WinHttpCrackUrl(wurl.c_str(), 0, 0, &parts)) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "invalid URL: " + url, (int)GetLastError());
    }
    std::wstring object = path;
    if (parts.dwExtraInfoLength > 0 && parts.lpszExtraInfo) {
        object.append(parts.lpszExtraInfo, parts.dwExtraInfoLength);
    }

    WinHttpHandle hSession(WinHttpOpen(L"PeloBridge/1.0", WINHTTP_ACCESS_TYPE_DEFAULT_PROXY,
                                       WINHTTP_NO_PROXY_NAME, WINHTTP_NO_PROXY_BYPASS, 0));
    if (!hSession) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "WinHttpOpen failed", (int)GetLastError());
    }
    WinHttpHandle hConnect(WinHttpConnect(hSession.get(), host, parts.nPort, 0));
    if (!hConnect) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "WinHttpConnect failed", (int)GetLastError());
    }
    DWORD flags = parts.nScheme == INTERNET_SCHEME_HTTPS ? WINHTTP_FLAG_SECURE : 0;
    WinHttpHandle hRequest(WinHttpOpenRequest(hConnect.get(), L"GET", object.c_str(), nullptr,
                                              WINHTTP_NO_REFERER, WINHTTP_DEFAULT_ACCEPT_TYPES, flags));
    if (!hRequest) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "WinHttpOpenRequest failed", (int)GetLastError());
    }

    DWORD redirects = (DWORD)max_redirects;
    WinHttpSetOption(hRequest.get(), WINHTTP_OPTION_MAX_HTTP_AUTOMATIC_REDIRECTS,
                     &redirects, sizeof(redirects));

    std::wstring header_block;
    for (const auto& h : headers) header_block += widen(h.first + ": " + h.second) + L"\r\n";

    if (!WinHttpSendRequest(hRequest.get(), header_block.c_str(), (DWORD)-1,
                            WINHTTP_NO_REQUEST_DATA, 0, 0, 0) ||
        !WinHttpReceiveResponse(hRequest.get(), nullptr)) {
        DWORD err = GetLastError();
        if (err == ERROR_WINHTTP_REDIRECT_FAILED) {
            return Err<HttpResponse>(ErrorKind::DownloadFailure,
                                     "redirect limit (" + std::to_string(max_redirects) + ") exceeded",
                                     (int)err);
        }
        return Err<HttpResponse>(ErrorKind::DownloadFailure,
                                 "request failed (WinHTTP " + std::to_string(err) + ")", (int)err);
    }

    HttpResponse response;
    DWORD status = 0, size = sizeof(status);
    WinHttpQueryHeaders(hRequest.get(), WINHTTP_QUERY_STATUS_CODE | WINHTTP_QUERY_FLAG_NUMBER,
                        WINHTTP_HEADER_NAME_BY_INDEX, &status, &size, WINHTTP_NO_HEADER_INDEX);
    response.status = (int)status;
    if (file && status != 200) return Ok(std::move(response));

    std::vector<char> buffer;
    DWORD available = 0;
    while (WinHttpQueryDataAvailable(hRequest.get(), &available) && available > 0) {
        buffer.resize(available);
        DWORD read = 0;
        if (!WinHttpReadData(hRequest.get(), buffer.data(), available, &read) || read == 0) break;
        if (file) file->write(buffer.data(), read);
        else response.body.append(buffer.data(), read);
    }
    return Ok(std::move(response));
}

} // namespace

WinHttpClient::WinHttpClient(int max_redirects, LogSink sink)
    : fallback_("curl.exe", max_redirects), max_redirects_(max_redirects), sink_(std::move(sink)) {}

Result<HttpResponse> WinHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    auto r = winHttpGet(url, headers, max_redirects_, nullptr);
    if (r.is_err() && isTlsError((DWORD)r.error().code)) {
        if (sink_) sink_("TLS handshake failed. Retrying request with Windows curl...", "info");
        return fallback_.get(url, headers);
    }
    return r;
}

Result<void> WinHttpClient::download(const std::string& url, const HttpHeaders& headers,
                                     const std::string& path) {
    ensureParentDir(path);
    Result<HttpResponse> r = Err<HttpResponse>(ErrorKind::DownloadFailure, "not started");
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) return Error(ErrorKind::DownloadFailure, "cannot write " + path);
        r = winHttpGet(url, headers, max_redirects_, &file);
    }
    if (r.is_err()) {
        if (isTlsError((DWORD)r.error().code)) {
            if (sink_) sink_("TLS handshake failed. Retrying download with Windows curl...", "info");
            return fallback_.download(url, headers, path);
        }
        return r.error();
    }
    if (r.value().status != 200) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return Error(ErrorKind::DownloadFailure,
                     "Failed to download (Status: " + std::to_string(r.value().status) + ")",
                     r.value().status);
    }
    return Ok();
}

#endif

// =============================================================================
// libcurl
// =============================================================================

#ifndef _WIN32

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const { if (c) curl_easy_cleanup(c); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t appendToString(char* data, size_t size, size_t count, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * count);
    return size * count;
}

size_t appendToFile(char* data, size_t size, size_t count, void* userdata) {
    auto* file = static_cast<std::ofstream*>(userdata);
    file->write(data, (std::streamsize)(size * count));
    return *file ? size * count : 0;   // short count aborts the transfer
}

// One GET. The body goes through write_cb into sink; status comes back in
// the response, transport-level failures as DownloadFailure with the CURLcode.
Result<HttpResponse> curlPerform(const std::string& url, const HttpHeaders& headers,
                                 int max_redirects, std::chrono::milliseconds timeout,
                                 curl_write_callback write_cb, void* sink) {
    CurlEasy curl(curl_easy_init());
    if (!curl) return Err<HttpResponse>(ErrorKind::DownloadFailure, "curl_easy_init failed");

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(raw_list, (h.first + ": " + h.second).c_str());
        if (!next) {
            CurlSlist cleanup(raw_list);
            return Err<HttpResponse>(ErrorKind::DownloadFailure, "out of memory building headers");
        }
        raw_list = next;
    }
    CurlSlist header_list(raw_list);

    char error_buffer[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, (long)max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, sink);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_TOO_MANY_REDIRECTS) {
        return Err<HttpResponse>(ErrorKind::DownloadFailure,
                                 "redirect limit (" + std::to_string(max_redirects) + ") exceeded",
                                 (int)rc);
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(rc);
        PLOG_WARN("http", "GET %s: %s", url.c_str(), detail.c_str());
        return Err<HttpResponse>(ErrorKind::DownloadFailure, "request failed: " + detail, (int)rc);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    HttpResponse response;
    response.status = (int)status;
    return Ok(std::move(response));
}

} // namespace

LibCurlHttpClient::LibCurlHttpClient(int max_redirects) : max_redirects_(max_redirects) {
    static std::once_flag init_once;
    std::call_once(init_once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) PLOG_ERROR("http", "curl_global_init: %s", curl_easy_strerror(rc));
    });
}

Result<HttpResponse> LibCurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    std::string body;
    auto r = curlPerform(url, headers, max_redirects_,
                         std::chrono::duration_cast<std::chrono::milliseconds>(GET_TIMEOUT),
                         appendToString, &body);
    if (r.is_err()) return r;
    HttpResponse response = std::move(r).value();
    response.body = std::move(body);
    return Ok(std::move(response));
}

Result<void> LibCurlHttpClient::download(const std::string& url, const HttpHeaders& headers,
                                         const std::string& path) {
    ensureParentDir(path);
    Result<HttpResponse> r = Err<HttpResponse>(ErrorKind::DownloadFailure, "not started");
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) return Error(ErrorKind::DownloadFailure, "cannot write " + path);
        r = curlPerform(url, headers, max_redirects_,
                        std::chrono::duration_cast<std::chrono::milliseconds>(DOWNLOAD_TIMEOUT),
                        appendToFile, &file);
    }
    std::error_code ec;
    if (r.is_err()) {
        std::filesystem::remove(path, ec);
        return r.error();
    }
    if (r.value().status != 200) {
        std::filesystem::remove(path, ec);
        return Error(ErrorKind::DownloadFailure,
                     "Failed to download (Status: " + std::to_string(r.value().status) + ")",
                     r.value().status);
    }
    return Ok();
}

#endif

std::unique_ptr<HttpClient> makeHttpClient(const config::InstallConfig& cfg, LogSink sink) {
#ifdef _WIN32
    return std::make_unique<WinHttpClient>(cfg.max_redirects, std::move(sink));
#else
    (void)sink;
    return std::make_unique<LibCurlHttpClient>(cfg.max_redirects);
#endif
}

} // namespace pelo
