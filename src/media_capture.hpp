#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "log_ring.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"

namespace pelo {

/**
 * Screenshots, live preview and screen recording.
 * Files land in the save location as screenshot_YYYYMMDD_HHMMSS.png and
 * recording_YYYYMMDD_HHMMSS.mp4.
 */
class MediaCapture {
public:
    using FrameCallback = std::function<void(const std::vector<uint8_t>& png)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr const char* REMOTE_SCREENSHOT = "/sdcard/screenshot.png";
    static constexpr const char* REMOTE_RECORDING = "/sdcard/screenrecord.mp4";

    MediaCapture(transport::AdbTransport& adb, std::string save_location, LogSink log = nullptr,
                 Sleeper sleeper = nullptr);
    ~MediaCapture();

    MediaCapture(const MediaCapture&) = delete;
    MediaCapture& operator=(const MediaCapture&) = delete;

    // screencap on the device, pull, remove the remote copy; local path
    Result<std::string> takeScreenshot(const std::string& serial);
    // PNG straight from the device (nothing written anywhere)
    Result<std::vector<uint8_t>> screenshotBytes(const std::string& serial);

    // Background loop; next frame is requested only after the previous one
    // was delivered
    Result<void> startPreview(const std::string& serial, FrameCallback on_frame);
    void stopPreview();
    bool previewRunning() const { return preview_running_.load(); }

    Result<void> startRecording(const std::string& serial);
    // Interrupt screenrecord, let it finalize, pull, remove remote file
    Result<std::string> stopRecording();
    bool isRecording() const;

    const std::string& saveLocation() const { return save_location_; }

    // "<prefix>_YYYYMMDD_HHMMSS<ext>" in local time
    static std::string timestampedName(const std::string& prefix, const std::string& ext,
                                       std::time_t when);
    // ~/PeloBridge, or ./PeloBridge without a home directory
    static std::string defaultSaveLocation();

private:
    Result<std::string> prepareTarget(const std::string& prefix, const std::string& ext);
    void log(const std::string& message, const std::string& category) const;

    transport::AdbTransport& adb_;
    std::string save_location_;
    LogSink log_;
    Sleeper sleep_;

    std::atomic<bool> preview_running_{false};
    std::thread preview_thread_;

    mutable std::mutex record_mutex_;
    std::unique_ptr<transport::ChildProcess> recorder_;
    std::string record_serial_;
};

} // namespace pelo
