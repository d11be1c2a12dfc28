#include "cli_transport.hpp"
#include "../adb_output_parser.hpp"
#include "../pelo_log.hpp"

namespace pelo::transport {

namespace {
// APK transfer + dexopt can be slow over WiFi
constexpr int INSTALL_TIMEOUT_FACTOR = 4;
}

CliTransport::CliTransport(std::string adb_path,
                           std::chrono::milliseconds command_timeout,
                           std::chrono::milliseconds pair_timeout,
                           CommandRunner runner,
                           ChildSpawner spawner)
    : adb_path_(std::move(adb_path)),
      command_timeout_(command_timeout),
      pair_timeout_(pair_timeout),
      runner_(std::move(runner)),
      spawner_(std::move(spawner)) {}

Result<ProcessResult> CliTransport::exec(const std::vector<std::string>& args,
                                         std::chrono::milliseconds timeout,
                                         bool echo_output) {
    std::string line = renderCommandLine(adb_path_, args);
    emit("$ " + line, "command");
    PLOG_DEBUG("adb", "exec: %s", line.c_str());

    auto result = runner_(adb_path_, args, timeout);
    if (result.is_err()) {
        emit(result.error().message, "error");
        PLOG_ERROR("adb", "%s: %s", line.c_str(), result.error().message.c_str());
        return result.error();
    }

    const ProcessResult& pr = result.value();
    if (echo_output) {
        std::string out = parser::trim(pr.out);
        std::string err = parser::trim(pr.err);
        if (!out.empty()) emit(out, "stdout");
        if (!err.empty()) emit(err, "stderr");
    }

    if (pr.timed_out) {
        std::string msg = "adb timed out after " + std::to_string(timeout.count()) + "ms";
        emit(msg, "error");
        return Error(ErrorKind::TransportFailure, msg, pr.combined(), -1);
    }
    if (pr.exit_status != 0) {
        std::string msg = "adb exited with status " + std::to_string(pr.exit_status);
        PLOG_WARN("adb", "%s: %s", line.c_str(), msg.c_str());
        return Error(ErrorKind::TransportFailure, msg, pr.combined(), pr.exit_status);
    }
    return result;
}

Result<std::string> CliTransport::execText(const std::vector<std::string>& args,
                                           std::chrono::milliseconds timeout) {
    auto r = exec(args, timeout);
    if (r.is_err()) return r.error();
    return Ok(r.value().combined());
}

Result<std::vector<DeviceEntry>> CliTransport::enumerate() {
    auto r = exec({"devices"}, command_timeout_);
    if (r.is_err()) return r.error();
    return Ok(parser::parseDeviceList(r.value().out));
}

Result<std::string> CliTransport::getProperty(const std::string& serial, const std::string& key) {
    auto r = exec({"-s", serial, "shell", "getprop", key}, command_timeout_);
    if (r.is_err()) return r.error();
    return Ok(parser::trim(r.value().out));
}

Result<std::string> CliTransport::shell(const std::string& serial, const std::string& command) {
    return execText({"-s", serial, "shell", command}, command_timeout_);
}

Result<std::string> CliTransport::install(const std::string& serial, const std::string& apk_path) {
    return execText({"-s", serial, "install", "-r", "-d", "-g", "-t", apk_path},
                    command_timeout_ * INSTALL_TIMEOUT_FACTOR);
}

Result<std::string> CliTransport::uninstall(const std::string& serial, const std::string& package,
                                            bool as_primary_user) {
    if (as_primary_user) {
        return execText({"-s", serial, "shell", "pm", "uninstall", "--user", "0", package},
                        command_timeout_);
    }
    return execText({"-s", serial, "uninstall", package}, command_timeout_);
}

Result<std::string> CliTransport::pull(const std::string& serial, const std::string& remote_path,
                                       const std::string& local_path) {
    return execText({"-s", serial, "pull", remote_path, local_path}, command_timeout_);
}

Result<std::string> CliTransport::push(const std::string& serial, const std::string& local_path,
                                       const std::string& remote_path) {
    return execText({"-s", serial, "push", local_path, remote_path}, command_timeout_);
}

Result<std::string> CliTransport::setNetworkMode(const std::string& serial, int port) {
    return execText({"-s", serial, "tcpip", std::to_string(port)}, command_timeout_);
}

Result<std::string> CliTransport::pair(const std::string& ip, int port, const std::string& code) {
    return execText({"pair", ip + ":" + std::to_string(port), code}, pair_timeout_);
}

Result<std::string> CliTransport::pairService(const std::string& service_name,
                                              const std::string& code) {
    return execText({"pair", "--mdns-service=" + service_name, code}, pair_timeout_);
}

Result<std::string> CliTransport::connect(const std::string& ip, int port) {
    return execText({"connect", ip + ":" + std::to_string(port)}, command_timeout_);
}

Result<std::string> CliTransport::listServices() {
    return execText({"mdns", "services"}, command_timeout_);
}

Result<std::vector<uint8_t>> CliTransport::screencapBytes(const std::string& serial) {
    auto r = exec({"-s", serial, "exec-out", "screencap", "-p"}, command_timeout_, false);
    if (r.is_err()) return r.error();
    const std::string& png = r.value().out;
    return Ok(std::vector<uint8_t>(png.begin(), png.end()));
}

Result<std::unique_ptr<ChildProcess>> CliTransport::startLongRunning(const std::string& serial,
                                                                     const std::string& command) {
    std::vector<std::string> args = {"-s", serial, "shell", command};
    emit("$ " + renderCommandLine(adb_path_, args), "command");
    return spawner_(adb_path_, args);
}

} // namespace pelo::transport
