#include "transport_factory.hpp"
#include "cli_transport.hpp"
#include "socket_transport.hpp"
#include "../pelo_log.hpp"

#include <filesystem>

namespace pelo::transport {

namespace {

std::unique_ptr<AdbTransport> makeSocket(const config::AdbConfig& cfg) {
    return std::make_unique<SocketTransport>(cfg.server_host, (uint16_t)cfg.server_port,
                                             std::chrono::milliseconds(cfg.command_timeout_ms),
                                             std::chrono::milliseconds(cfg.pair_timeout_ms));
}

std::unique_ptr<AdbTransport> makeCli(const config::AdbConfig& cfg, const std::string& path) {
    return std::make_unique<CliTransport>(path,
                                          std::chrono::milliseconds(cfg.command_timeout_ms),
                                          std::chrono::milliseconds(cfg.pair_timeout_ms));
}

} // namespace

std::unique_ptr<AdbTransport> makeTransport(const config::AdbConfig& cfg, LogSink sink) {
    std::unique_ptr<AdbTransport> transport;

    if (cfg.prefer_socket) {
        PLOG_INFO("transport", "Using adb server socket %s:%d (configured)",
                  cfg.server_host.c_str(), cfg.server_port);
        transport = makeSocket(cfg);
    } else {
        std::string adb = cfg.path;
        std::error_code ec;
        if (!adb.empty() && !std::filesystem::exists(adb, ec)) {
            PLOG_WARN("transport", "Configured adb path %s not found", adb.c_str());
            adb.clear();
        }
        if (adb.empty()) adb = findOnPath("adb");

        if (!adb.empty()) {
            PLOG_INFO("transport", "Using adb executable %s", adb.c_str());
            transport = makeCli(cfg, adb);
        } else {
            SocketTransport probe(cfg.server_host, (uint16_t)cfg.server_port,
                                  std::chrono::milliseconds(2000), std::chrono::milliseconds(2000));
            auto version = probe.serverVersion();
            if (version.is_ok()) {
                PLOG_INFO("transport", "adb not on PATH, server v%d answering on %s:%d",
                          version.value(), cfg.server_host.c_str(), cfg.server_port);
                transport = makeSocket(cfg);
            } else {
                PLOG_WARN("transport", "No adb executable or server found (%s)",
                          version.error().message.c_str());
                transport = makeCli(cfg, "adb");
            }
        }
    }

    transport->setLogSink(std::move(sink));
    return transport;
}

} // namespace pelo::transport
