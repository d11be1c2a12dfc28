// =============================================================================
// PeloBridge - Blocking TCP socket with connect/read timeouts
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include "../result.hpp"

namespace pelo::transport {

#ifdef _WIN32
using socket_t = SOCKET;
constexpr socket_t PELO_INVALID_SOCKET = INVALID_SOCKET;
#else
using socket_t = int;
constexpr socket_t PELO_INVALID_SOCKET = -1;
#endif

// WSAStartup once per process (no-op elsewhere)
bool initSockets();
void closeSocket(socket_t s);
bool setNonBlocking(socket_t s, bool enabled);
int lastSocketError();
// Non-blocking connect still in progress
bool connectInProgress(int err);

class TcpSocket {
public:
    TcpSocket() = default;
    ~TcpSocket() { close(); }

    TcpSocket(TcpSocket&& o) noexcept : sock_(o.sock_) { o.sock_ = PELO_INVALID_SOCKET; }
    TcpSocket& operator=(TcpSocket&& o) noexcept {
        if (this != &o) {
            close();
            sock_ = o.sock_;
            o.sock_ = PELO_INVALID_SOCKET;
        }
        return *this;
    }
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    Result<void> connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
    bool isOpen() const { return sock_ != PELO_INVALID_SOCKET; }
    void close();

    // Receive timeout for subsequent reads (0 = block forever)
    void setReadTimeout(std::chrono::milliseconds timeout);

    Result<void> sendAll(const std::string& data);
    Result<std::string> readExact(size_t n);
    // Read until the peer closes the stream
    Result<std::string> readToEnd(size_t limit);

private:
    socket_t sock_ = PELO_INVALID_SOCKET;
};

} // namespace pelo::transport
