// =============================================================================
// PeloBridge - adb server smart-socket framing
// =============================================================================
// Host side of the adb server protocol (tcp:127.0.0.1:5037):
//   request  = 4 hex digit length + service string ("000Chost:version")
//   response = "OKAY" | "FAIL" + 4 hex length + message
// Sync mode (after "sync:"): 8-byte packets, 4-char id + little-endian u32.
// Pure functions only; socket I/O lives in SocketTransport.
// =============================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pelo::transport::protocol {

constexpr size_t MAX_PAYLOAD = 0xFFFF;
constexpr size_t SYNC_DATA_MAX = 64 * 1024;

// "host:devices" -> "000Chost:devices"; nullopt if the service is too long
std::optional<std::string> encodeRequest(const std::string& service);

// "001a" -> 26; nullopt on non-hex input
std::optional<size_t> decodeHexLength(const std::string& four);

enum class Status { Okay, Fail, Invalid };
Status decodeStatus(const std::string& four);

// Sync packet header: id ("SEND", "RECV", "DATA", "DONE", "QUIT") + u32 LE
std::string encodeSyncHeader(const char id[4], uint32_t value);
// Sync request with a path payload ("RECV" + len + path)
std::string encodeSyncRequest(const char id[4], const std::string& path);
uint32_t decodeLittleEndian32(const unsigned char* bytes);

// Service strings
std::string transportService(const std::string& serial);   // host:transport:<serial>
std::string shellService(const std::string& command);      // shell:<command>
std::string execService(const std::string& command);       // exec:<command>
std::string pairService(const std::string& ip, int port, const std::string& code);
std::string connectService(const std::string& ip, int port);

// Shell-quote one argument for a device-side sh
std::string shellQuote(const std::string& arg);

} // namespace pelo::transport::protocol
