#include "media_capture.hpp"
#include "pelo_log.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace pelo {

namespace {
// screenrecord needs a moment after SIGINT to write the moov atom
constexpr std::chrono::milliseconds RECORD_FINALIZE_DELAY{1000};
constexpr std::chrono::milliseconds RECORD_EXIT_TIMEOUT{3000};
}

MediaCapture::MediaCapture(transport::AdbTransport& adb, std::string save_location, LogSink log,
                           Sleeper sleeper)
    : adb_(adb),
      save_location_(save_location.empty() ? defaultSaveLocation() : std::move(save_location)),
      log_(std::move(log)),
      sleep_(std::move(sleeper)) {
    if (!sleep_) sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

MediaCapture::~MediaCapture() {
    stopPreview();
    std::lock_guard<std::mutex> lock(record_mutex_);
    if (recorder_ && recorder_->running()) {
        PLOG_WARN("media", "Recording still running at shutdown, interrupting");
        recorder_->interrupt();
    }
}

void MediaCapture::log(const std::string& message, const std::string& category) const {
    if (log_) log_(message, category);
}

std::string MediaCapture::timestampedName(const std::string& prefix, const std::string& ext,
                                          std::time_t when) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &when);
#else
    localtime_r(&when, &tm_buf);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);
    return prefix + "_" + stamp + ext;
}

std::string MediaCapture::defaultSaveLocation() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
    return (base / "PeloBridge").string();
}

Result<std::string> MediaCapture::prepareTarget(const std::string& prefix, const std::string& ext) {
    std::error_code ec;
    fs::create_directories(save_location_, ec);
    if (ec) {
        return Err<std::string>(ErrorKind::Generic,
                                "cannot create " + save_location_ + ": " + ec.message());
    }
    return Ok((fs::path(save_location_) / timestampedName(prefix, ext, std::time(nullptr))).string());
}

// =============================================================================
// Screenshots
// =============================================================================

Result<std::string> MediaCapture::takeScreenshot(const std::string& serial) {
    auto target = prepareTarget("screenshot", ".png");
    if (target.is_err()) return target;

    log("Taking screenshot...", "info");
    auto cap = adb_.shell(serial, std::string("screencap -p ") + REMOTE_SCREENSHOT);
    if (cap.is_err()) {
        log("Screenshot failed: " + cap.error().message, "error");
        return cap.error();
    }

    auto pulled = adb_.pull(serial, REMOTE_SCREENSHOT, target.value());
    auto removed = adb_.shell(serial, std::string("rm -f ") + REMOTE_SCREENSHOT);
    if (removed.is_err()) {
        PLOG_WARN("media", "Could not remove %s: %s", REMOTE_SCREENSHOT, removed.error().message.c_str());
    }
    if (pulled.is_err()) {
        log("Screenshot pull failed: " + pulled.error().message, "error");
        return pulled.error();
    }

    log("Screenshot saved to " + target.value(), "info");
    return target;
}

Result<std::vector<uint8_t>> MediaCapture::screenshotBytes(const std::string& serial) {
    return adb_.screencapBytes(serial);
}

// =============================================================================
// Live preview
// =============================================================================

Result<void> MediaCapture::startPreview(const std::string& serial, FrameCallback on_frame) {
    if (preview_running_.load()) {
        return Error(ErrorKind::Busy, "preview already running");
    }
    // Previous loop ended on its own (frame error)
    if (preview_thread_.joinable()) preview_thread_.join();
    preview_running_ = true;

    preview_thread_ = std::thread([this, serial, on_frame = std::move(on_frame)]() {
        PLOG_INFO("media", "Preview started for %s", serial.c_str());
        while (preview_running_.load()) {
            auto frame = adb_.screencapBytes(serial);
            if (frame.is_err()) {
                PLOG_WARN("media", "Preview frame failed: %s", frame.error().message.c_str());
                log("Preview stopped: " + frame.error().message, "error");
                break;
            }
            if (!preview_running_.load()) break;
            if (on_frame) on_frame(frame.value());
        }
        preview_running_ = false;
        PLOG_INFO("media", "Preview stopped for %s", serial.c_str());
    });
    return Ok();
}

void MediaCapture::stopPreview() {
    preview_running_ = false;
    if (preview_thread_.joinable()) preview_thread_.join();
}

// =============================================================================
// Recording
// =============================================================================

bool MediaCapture::isRecording() const {
    std::lock_guard<std::mutex> lock(record_mutex_);
    return recorder_ != nullptr;
}

Result<void> MediaCapture::startRecording(const std::string& serial) {
    std::lock_guard<std::mutex> lock(record_mutex_);
    if (recorder_) return Error(ErrorKind::Busy, "already recording " + record_serial_);

    auto child = adb_.startLongRunning(serial, std::string("screenrecord ") + REMOTE_RECORDING);
    if (child.is_err()) {
        log("Failed to start recording: " + child.error().message, "error");
        return child.error();
    }
    recorder_ = std::move(child).value();
    record_serial_ = serial;
    log("Recording started", "info");
    return Ok();
}

Result<std::string> MediaCapture::stopRecording() {
    std::unique_ptr<transport::ChildProcess> recorder;
    std::string serial;
    {
        std::lock_guard<std::mutex> lock(record_mutex_);
        if (!recorder_) return Err<std::string>(ErrorKind::Generic, "not recording");
        recorder = std::move(recorder_);
        serial = std::move(record_serial_);
    }

    log("Stopping recording...", "info");
    if (!recorder->interrupt()) {
        PLOG_WARN("media", "screenrecord already gone before interrupt");
    }
    auto exited = recorder->wait(RECORD_EXIT_TIMEOUT);
    if (exited.is_err()) {
        PLOG_WARN("media", "screenrecord did not exit: %s", exited.error().message.c_str());
    }
    sleep_(RECORD_FINALIZE_DELAY);

    auto target = prepareTarget("recording", ".mp4");
    if (target.is_err()) return target;

    auto pulled = adb_.pull(serial, REMOTE_RECORDING, target.value());
    auto removed = adb_.shell(serial, std::string("rm -f ") + REMOTE_RECORDING);
    if (removed.is_err()) {
        PLOG_WARN("media", "Could not remove %s: %s", REMOTE_RECORDING, removed.error().message.c_str());
    }
    if (pulled.is_err()) {
        log("Recording pull failed: " + pulled.error().message, "error");
        return pulled.error();
    }
    log("Recording saved to " + target.value(), "info");
    return target;
}

} // namespace pelo
