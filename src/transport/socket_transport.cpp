#include "socket_transport.hpp"
#include "adb_protocol.hpp"
#include "../adb_output_parser.hpp"
#include "../pelo_log.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>

namespace pelo::transport {

namespace {

constexpr size_t MAX_STREAM_BYTES = 64 * 1024 * 1024;
constexpr uint32_t PUSH_FILE_MODE = 0100644;
const char* const REMOTE_STAGING_DIR = "/data/local/tmp/";

// Shell stream kept open until the remote command is told to stop.
// Closing the stream makes adbd deliver SIGHUP, which screenrecord treats
// like Ctrl-C (finalizes the file).
class SocketChildProcess : public ChildProcess {
public:
    explicit SocketChildProcess(TcpSocket sock) : sock_(std::move(sock)) {}

    bool running() override { return sock_.isOpen(); }

    bool interrupt() override {
        if (!sock_.isOpen()) return false;
        sock_.close();
        return true;
    }

    Result<int> wait(std::chrono::milliseconds timeout) override {
        if (sock_.isOpen()) {
            sock_.setReadTimeout(timeout);
            auto rest = sock_.readToEnd(MAX_STREAM_BYTES);
            sock_.close();
            if (rest.is_err()) return rest.error();
        }
        return Ok(0);
    }

private:
    TcpSocket sock_;
};

} // namespace

SocketTransport::SocketTransport(std::string host, uint16_t port,
                                 std::chrono::milliseconds command_timeout,
                                 std::chrono::milliseconds pair_timeout)
    : host_(std::move(host)),
      port_(port),
      command_timeout_(command_timeout),
      pair_timeout_(pair_timeout) {}

// =============================================================================
// Framing helpers
// =============================================================================

Result<void> SocketTransport::readStatus(TcpSocket& sock) {
    auto status = sock.readExact(4);
    if (status.is_err()) return status.error();

    switch (protocol::decodeStatus(status.value())) {
        case protocol::Status::Okay:
            return Ok();
        case protocol::Status::Fail: {
            auto msg = readProtocolString(sock);
            std::string text = msg.is_ok() ? msg.value() : "unknown failure";
            return Error(ErrorKind::TransportFailure, text, text, 1);
        }
        case protocol::Status::Invalid:
            break;
    }
    return Error(ErrorKind::TransportFailure, "protocol fault (status " + status.value() + ")");
}

Result<std::string> SocketTransport::readProtocolString(TcpSocket& sock) {
    auto len_hex = sock.readExact(4);
    if (len_hex.is_err()) return len_hex.error();
    auto len = protocol::decodeHexLength(len_hex.value());
    if (!len) {
        return Err<std::string>(ErrorKind::TransportFailure, "protocol fault (bad length)");
    }
    if (*len == 0) return Ok(std::string());
    return sock.readExact(*len);
}

Result<TcpSocket> SocketTransport::openService(const std::string& service,
                                               std::chrono::milliseconds timeout) {
    auto request = protocol::encodeRequest(service);
    if (!request) {
        return Err<TcpSocket>(ErrorKind::TransportFailure, "service request too long");
    }

    TcpSocket sock;
    auto connected = sock.connect(host_, port_, std::chrono::milliseconds(2000));
    if (connected.is_err()) {
        return Err<TcpSocket>(ErrorKind::TransportFailure,
                              "adb server unreachable: " + connected.error().message);
    }
    sock.setReadTimeout(timeout);

    auto sent = sock.sendAll(*request);
    if (sent.is_err()) return sent.error();
    auto status = readStatus(sock);
    if (status.is_err()) return status.error();
    return Ok(std::move(sock));
}

Result<TcpSocket> SocketTransport::openDeviceService(const std::string& serial,
                                                     const std::string& service,
                                                     std::chrono::milliseconds timeout) {
    auto opened = openService(protocol::transportService(serial), timeout);
    if (opened.is_err()) return opened.error();
    TcpSocket sock = std::move(opened).value();

    auto request = protocol::encodeRequest(service);
    if (!request) {
        return Err<TcpSocket>(ErrorKind::TransportFailure, "service request too long");
    }
    auto sent = sock.sendAll(*request);
    if (sent.is_err()) return sent.error();
    auto status = readStatus(sock);
    if (status.is_err()) return status.error();
    return Ok(std::move(sock));
}

Result<std::string> SocketTransport::hostQuery(const std::string& service,
                                               std::chrono::milliseconds timeout) {
    emit("$ adb-server " + service, "command");
    auto opened = openService(service, timeout);
    if (opened.is_err()) {
        emit(opened.error().message, "stderr");
        return opened.error();
    }
    TcpSocket sock = std::move(opened).value();
    auto text = readProtocolString(sock);
    if (text.is_ok()) {
        std::string shown = parser::trim(text.value());
        if (!shown.empty()) emit(shown, "stdout");
    }
    return text;
}

Result<std::string> SocketTransport::deviceStream(const std::string& serial,
                                                  const std::string& service,
                                                  std::chrono::milliseconds timeout) {
    emit("$ adb-server [" + serial + "] " + service, "command");
    auto opened = openDeviceService(serial, service, timeout);
    if (opened.is_err()) {
        emit(opened.error().message, "stderr");
        return opened.error();
    }
    TcpSocket sock = std::move(opened).value();
    return sock.readToEnd(MAX_STREAM_BYTES);
}

Result<int> SocketTransport::serverVersion() {
    auto opened = openService("host:version", std::chrono::milliseconds(2000));
    if (opened.is_err()) return opened.error();
    TcpSocket sock = std::move(opened).value();
    auto text = readProtocolString(sock);
    if (text.is_err()) return text.error();
    auto version = protocol::decodeHexLength(text.value());
    if (!version) return Err<int>(ErrorKind::TransportFailure, "bad version reply");
    return Ok((int)*version);
}

// =============================================================================
// Operations
// =============================================================================

Result<std::vector<DeviceEntry>> SocketTransport::enumerate() {
    auto text = hostQuery("host:devices", command_timeout_);
    if (text.is_err()) return text.error();
    return Ok(parser::parseDeviceList(text.value()));
}

Result<std::string> SocketTransport::getProperty(const std::string& serial, const std::string& key) {
    auto text = shell(serial, "getprop " + protocol::shellQuote(key));
    if (text.is_err()) return text;
    return Ok(parser::trim(text.value()));
}

Result<std::string> SocketTransport::shell(const std::string& serial, const std::string& command) {
    auto text = deviceStream(serial, protocol::shellService(command), command_timeout_);
    if (text.is_ok()) {
        std::string shown = parser::trim(text.value());
        if (!shown.empty()) emit(shown, "stdout");
    }
    return text;
}

Result<std::string> SocketTransport::install(const std::string& serial, const std::string& apk_path) {
    std::string remote = REMOTE_STAGING_DIR + std::filesystem::path(apk_path).filename().string();
    auto pushed = push(serial, apk_path, remote);
    if (pushed.is_err()) return pushed;

    auto output = shell(serial, "pm install -r -d -g -t " + protocol::shellQuote(remote));
    auto cleanup = shell(serial, "rm -f " + protocol::shellQuote(remote));
    if (cleanup.is_err()) {
        PLOG_WARN("adbsock", "failed to remove %s: %s", remote.c_str(),
                  cleanup.error().message.c_str());
    }
    return output;
}

Result<std::string> SocketTransport::uninstall(const std::string& serial, const std::string& package,
                                               bool as_primary_user) {
    std::string cmd = as_primary_user ? "pm uninstall --user 0 " : "pm uninstall ";
    return shell(serial, cmd + protocol::shellQuote(package));
}

Result<std::string> SocketTransport::pull(const std::string& serial, const std::string& remote_path,
                                          const std::string& local_path) {
    emit("$ adb-server [" + serial + "] pull " + remote_path + " " + local_path, "command");
    auto opened = openDeviceService(serial, "sync:", command_timeout_);
    if (opened.is_err()) return opened.error();
    TcpSocket sock = std::move(opened).value();

    auto sent = sock.sendAll(protocol::encodeSyncRequest("RECV", remote_path));
    if (sent.is_err()) return sent.error();

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<std::string>(ErrorKind::TransportFailure, "cannot open " + local_path);
    }

    size_t total = 0;
    while (true) {
        auto header = sock.readExact(8);
        if (header.is_err()) return header.error();
        std::string id = header.value().substr(0, 4);
        uint32_t len = protocol::decodeLittleEndian32(
            reinterpret_cast<const unsigned char*>(header.value().data() + 4));

        if (id == "DONE") break;
        if (id == "FAIL") {
            auto msg = sock.readExact(len);
            std::string text = msg.is_ok() ? msg.value() : "pull failed";
            emit(text, "stderr");
            out.close();
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
            return Error(ErrorKind::TransportFailure, text, text, 1);
        }
        if (id != "DATA" || len > protocol::SYNC_DATA_MAX) {
            return Err<std::string>(ErrorKind::TransportFailure, "protocol fault (sync " + id + ")");
        }
        auto chunk = sock.readExact(len);
        if (chunk.is_err()) return chunk.error();
        out.write(chunk.value().data(), (std::streamsize)chunk.value().size());
        total += len;
    }
    if (sock.sendAll(protocol::encodeSyncHeader("QUIT", 0)).is_err()) {
        PLOG_DEBUG("adbsock", "sync QUIT not delivered");
    }

    std::string summary = remote_path + ": 1 file pulled (" + std::to_string(total) + " bytes)";
    emit(summary, "stdout");
    return Ok(summary);
}

Result<std::string> SocketTransport::push(const std::string& serial, const std::string& local_path,
                                          const std::string& remote_path) {
    emit("$ adb-server [" + serial + "] push " + local_path + " " + remote_path, "command");
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return Err<std::string>(ErrorKind::TransportFailure, "cannot open " + local_path);
    }

    auto opened = openDeviceService(serial, "sync:", command_timeout_);
    if (opened.is_err()) return opened.error();
    TcpSocket sock = std::move(opened).value();

    std::string target = remote_path + "," + std::to_string(PUSH_FILE_MODE);
    auto sent = sock.sendAll(protocol::encodeSyncRequest("SEND", target));
    if (sent.is_err()) return sent.error();

    std::string buf(protocol::SYNC_DATA_MAX, '\0');
    size_t total = 0;
    while (in) {
        in.read(&buf[0], (std::streamsize)buf.size());
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        auto data = sock.sendAll(protocol::encodeSyncHeader("DATA", (uint32_t)n) +
                                 buf.substr(0, (size_t)n));
        if (data.is_err()) return data.error();
        total += (size_t)n;
    }
    auto done = sock.sendAll(protocol::encodeSyncHeader("DONE", (uint32_t)std::time(nullptr)));
    if (done.is_err()) return done.error();

    auto reply = sock.readExact(8);
    if (reply.is_err()) return reply.error();
    std::string id = reply.value().substr(0, 4);
    if (id == "FAIL") {
        uint32_t len = protocol::decodeLittleEndian32(
            reinterpret_cast<const unsigned char*>(reply.value().data() + 4));
        auto msg = sock.readExact(len);
        std::string text = msg.is_ok() ? msg.value() : "push failed";
        emit(text, "stderr");
        return Error(ErrorKind::TransportFailure, text, text, 1);
    }
    if (id != "OKAY") {
        return Err<std::string>(ErrorKind::TransportFailure, "protocol fault (sync " + id + ")");
    }
    if (sock.sendAll(protocol::encodeSyncHeader("QUIT", 0)).is_err()) {
        PLOG_DEBUG("adbsock", "sync QUIT not delivered");
    }

    std::string summary = local_path + ": 1 file pushed (" + std::to_string(total) + " bytes)";
    emit(summary, "stdout");
    return Ok(summary);
}

Result<std::string> SocketTransport::setNetworkMode(const std::string& serial, int port) {
    return deviceStream(serial, "tcpip:" + std::to_string(port), command_timeout_);
}

Result<std::string> SocketTransport::pair(const std::string& ip, int port, const std::string& code) {
    return hostQuery(protocol::pairService(ip, port, code), pair_timeout_);
}

Result<std::string> SocketTransport::pairService(const std::string& service_name,
                                                 const std::string& code) {
    // The server pairs by address only; resolve the name from its own listing
    auto listing = listServices();
    if (listing.is_err()) return listing.error();
    for (const auto& record : parser::parseMdnsServices(listing.value())) {
        if (record.service_name == service_name && !record.ip.empty()) {
            return pair(record.ip, record.port, code);
        }
    }
    return Err<std::string>(ErrorKind::TransportFailure,
                            "mDNS service not advertised: " + service_name);
}

Result<std::string> SocketTransport::connect(const std::string& ip, int port) {
    return hostQuery(protocol::connectService(ip, port), command_timeout_);
}

Result<std::string> SocketTransport::listServices() {
    return hostQuery("host:mdns:services", command_timeout_);
}

Result<std::vector<uint8_t>> SocketTransport::screencapBytes(const std::string& serial) {
    auto data = deviceStream(serial, protocol::execService("screencap -p"), command_timeout_);
    if (data.is_err()) return data.error();
    const std::string& png = data.value();
    return Ok(std::vector<uint8_t>(png.begin(), png.end()));
}

Result<std::unique_ptr<ChildProcess>> SocketTransport::startLongRunning(const std::string& serial,
                                                                        const std::string& command) {
    emit("$ adb-server [" + serial + "] shell:" + command, "command");
    auto opened = openDeviceService(serial, protocol::shellService(command),
                                    std::chrono::milliseconds(0));
    if (opened.is_err()) return opened.error();
    return Ok(std::unique_ptr<ChildProcess>(new SocketChildProcess(std::move(opened).value())));
}

} // namespace pelo::transport
