#include "adb_protocol.hpp"

#include <cstdio>
#include <cstring>

namespace pelo::transport::protocol {

std::optional<std::string> encodeRequest(const std::string& service) {
    if (service.empty() || service.size() > MAX_PAYLOAD) return std::nullopt;
    char len[5];
    snprintf(len, sizeof(len), "%04x", (unsigned)service.size());
    return std::string(len, 4) + service;
}

std::optional<size_t> decodeHexLength(const std::string& four) {
    if (four.size() != 4) return std::nullopt;
    size_t value = 0;
    for (char c : four) {
        value <<= 4;
        if (c >= '0' && c <= '9') value |= (size_t)(c - '0');
        else if (c >= 'a' && c <= 'f') value |= (size_t)(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= (size_t)(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

Status decodeStatus(const std::string& four) {
    if (four == "OKAY") return Status::Okay;
    if (four == "FAIL") return Status::Fail;
    return Status::Invalid;
}

std::string encodeSyncHeader(const char id[4], uint32_t value) {
    std::string packet(id, 4);
    packet.push_back((char)(value & 0xFF));
    packet.push_back((char)((value >> 8) & 0xFF));
    packet.push_back((char)((value >> 16) & 0xFF));
    packet.push_back((char)((value >> 24) & 0xFF));
    return packet;
}

std::string encodeSyncRequest(const char id[4], const std::string& path) {
    return encodeSyncHeader(id, (uint32_t)path.size()) + path;
}

uint32_t decodeLittleEndian32(const unsigned char* bytes) {
    return (uint32_t)bytes[0] | ((uint32_t)bytes[1] << 8) |
           ((uint32_t)bytes[2] << 16) | ((uint32_t)bytes[3] << 24);
}

std::string transportService(const std::string& serial) {
    return "host:transport:" + serial;
}

std::string shellService(const std::string& command) {
    return "shell:" + command;
}

std::string execService(const std::string& command) {
    return "exec:" + command;
}

std::string pairService(const std::string& ip, int port, const std::string& code) {
    return "host:pair:" + code + ":" + ip + ":" + std::to_string(port);
}

std::string connectService(const std::string& ip, int port) {
    return "host:connect:" + ip + ":" + std::to_string(port);
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
}

} // namespace pelo::transport::protocol
