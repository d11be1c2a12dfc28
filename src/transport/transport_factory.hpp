#pragma once

#include <memory>

#include "../config_loader.hpp"
#include "adb_transport.hpp"

namespace pelo::transport {

/**
 * Pick the transport once at startup:
 *   1. adb.prefer_socket            -> SocketTransport
 *   2. adb.path set / adb on PATH   -> CliTransport
 *   3. adb server answers on port   -> SocketTransport
 *   4. otherwise                    -> CliTransport("adb") (fails per call)
 */
std::unique_ptr<AdbTransport> makeTransport(const config::AdbConfig& cfg, LogSink sink);

} // namespace pelo::transport
