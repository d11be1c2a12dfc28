#include "tcp_socket.hpp"
#include "../pelo_log.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>

namespace pelo::transport {

bool initSockets() {
#ifdef _WIN32
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        WSADATA wsa;
        ok = WSAStartup(MAKEWORD(2, 2), &wsa) == 0;
        if (!ok) PLOG_ERROR("socket", "WSAStartup failed");
    });
    return ok;
#else
    return true;
#endif
}

void closeSocket(socket_t s) {
    if (s == PELO_INVALID_SOCKET) return;
#ifdef _WIN32
    closesocket(s);
#else
    ::close(s);
#endif
}

bool setNonBlocking(socket_t s, bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    return ioctlsocket(s, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(s, F_SETFL, flags) == 0;
#endif
}

int lastSocketError() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool connectInProgress(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
    return err == EINPROGRESS || err == EWOULDBLOCK;
#endif
}

void TcpSocket::close() {
    closeSocket(sock_);
    sock_ = PELO_INVALID_SOCKET;
}

Result<void> TcpSocket::connect(const std::string& host, uint16_t port,
                                std::chrono::milliseconds timeout) {
    close();
    if (!initSockets()) {
        return Error(ErrorKind::TransportFailure, "socket subsystem unavailable");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return Error(ErrorKind::TransportFailure, "invalid IPv4 address: " + host);
    }

    socket_t s = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (s == PELO_INVALID_SOCKET) {
        return Error(ErrorKind::TransportFailure, "socket() failed", lastSocketError());
    }
    setNonBlocking(s, true);

    int rc = ::connect(s, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc != 0) {
        int err = lastSocketError();
        if (!connectInProgress(err)) {
            closeSocket(s);
            return Error(ErrorKind::TransportFailure,
                         "connect to " + host + ":" + std::to_string(port) + " failed", err);
        }
#ifdef _WIN32
        WSAPOLLFD pfd{s, POLLOUT, 0};
        rc = WSAPoll(&pfd, 1, (INT)timeout.count());
#else
        pollfd pfd{s, POLLOUT, 0};
        rc = ::poll(&pfd, 1, (int)timeout.count());
#endif
        if (rc <= 0) {
            closeSocket(s);
            return Error(ErrorKind::ConnectionTimeout,
                         "connect to " + host + ":" + std::to_string(port) + " timed out");
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(s, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len);
        if (so_error != 0) {
            closeSocket(s);
            return Error(ErrorKind::TransportFailure,
                         "connect to " + host + ":" + std::to_string(port) + " refused", so_error);
        }
    }
    setNonBlocking(s, false);
    sock_ = s;
    return Ok();
}

void TcpSocket::setReadTimeout(std::chrono::milliseconds timeout) {
    if (!isOpen()) return;
#ifdef _WIN32
    DWORD tv = (DWORD)timeout.count();
    setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv));
#else
    struct timeval tv;
    tv.tv_sec = (long)(timeout.count() / 1000);
    tv.tv_usec = (long)((timeout.count() % 1000) * 1000);
    if (setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        PLOG_WARN("socket", "SO_RCVTIMEO failed (err=%d)", lastSocketError());
    }
#endif
}

Result<void> TcpSocket::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        int n = (int)::send(sock_, data.data() + sent, (int)(data.size() - sent), 0);
        if (n <= 0) {
            return Error(ErrorKind::TransportFailure, "send failed", lastSocketError());
        }
        sent += (size_t)n;
    }
    return Ok();
}

Result<std::string> TcpSocket::readExact(size_t n) {
    std::string buf(n, '\0');
    size_t got = 0;
    while (got < n) {
        int r = (int)::recv(sock_, &buf[got], (int)(n - got), 0);
        if (r == 0) {
            return Err<std::string>(ErrorKind::TransportFailure, "connection closed by peer");
        }
        if (r < 0) {
            return Err<std::string>(ErrorKind::TransportFailure, "recv failed", lastSocketError());
        }
        got += (size_t)r;
    }
    return Ok(std::move(buf));
}

Result<std::string> TcpSocket::readToEnd(size_t limit) {
    std::string data;
    char buf[16384];
    while (true) {
        int r = (int)::recv(sock_, buf, sizeof(buf), 0);
        if (r == 0) break;
        if (r < 0) {
            return Err<std::string>(ErrorKind::TransportFailure, "recv failed", lastSocketError());
        }
        if (data.size() < limit) data.append(buf, (size_t)r);
    }
    return Ok(std::move(data));
}

} // namespace pelo::transport
