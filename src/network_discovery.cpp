#include "network_discovery.hpp"
#include "pelo_log.hpp"
#include "transport/tcp_socket.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <map>

#ifndef _WIN32
#include <ifaddrs.h>
#include <net/if.h>
#endif

namespace pelo {

using transport::closeSocket;
using transport::connectInProgress;
using transport::lastSocketError;
using transport::setNonBlocking;
using transport::socket_t;
using transport::PELO_INVALID_SOCKET;

NetworkDiscovery::NetworkDiscovery(transport::AdbTransport& adb, Prober prober, LogSink log)
    : adb_(adb), prober_(std::move(prober)), log_(std::move(log)) {}

// =============================================================================
// Scan
// =============================================================================

std::vector<parser::ServiceRecord> NetworkDiscovery::discoverServices() {
    auto listing = adb_.listServices();
    if (listing.is_err()) {
        PLOG_WARN("discovery", "mDNS listing failed: %s", listing.error().message.c_str());
        if (log_) log_("mDNS discovery failed: " + listing.error().message, "error");
        return {};
    }
    size_t skipped = 0;
    auto records = parser::parseMdnsServices(listing.value(), &skipped);
    if (skipped > 0) {
        PLOG_WARN("discovery", "%zu mDNS line(s) could not be parsed", skipped);
    }
    PLOG_INFO("discovery", "mDNS: %zu record(s)", records.size());
    return records;
}

std::vector<WirelessCandidate> NetworkDiscovery::scan(std::optional<int> port) {
    const int probe_port = port.value_or(DEFAULT_PROBE_PORT);
    if (log_) log_("Scanning for wireless devices...", "info");

    auto mdns_task = std::async(std::launch::async, [this] { return discoverServices(); });

    std::future<Result<std::vector<std::string>>> probe_task;
    if (prober_) {
        probe_task = std::async(std::launch::async, [this, probe_port] { return prober_(probe_port); });
    }

    auto records = mdns_task.get();

    std::vector<std::string> hits;
    if (probe_task.valid()) {
        auto probed = probe_task.get();
        // Probe results only count when mDNS came up empty or a port was asked for
        if (records.empty() || port) {
            if (probed.is_ok()) {
                hits = std::move(probed).value();
            } else {
                PLOG_WARN("discovery", "Subnet probe failed: %s", probed.error().message.c_str());
                if (log_) log_("Subnet scan failed: " + probed.error().message, "error");
            }
        }
    }

    auto candidates = mergeCandidates(records, hits, probe_port);
    if (log_) log_("Found " + std::to_string(candidates.size()) + " wireless device(s)", "info");
    return candidates;
}

std::vector<WirelessCandidate> NetworkDiscovery::mergeCandidates(
        const std::vector<parser::ServiceRecord>& records,
        const std::vector<std::string>& probe_hits,
        int probe_port) {
    struct Slot {
        WirelessCandidate c;
        std::optional<std::string> pairing_name;
        std::optional<std::string> connect_name;
        bool probed = false;
    };
    std::vector<Slot> slots;
    std::map<std::string, size_t> by_ip;

    auto slotFor = [&](const std::string& ip) -> Slot& {
        auto it = by_ip.find(ip);
        if (it != by_ip.end()) return slots[it->second];
        by_ip[ip] = slots.size();
        slots.push_back(Slot{});
        slots.back().c.ip = ip;
        return slots.back();
    };

    for (const auto& r : records) {
        if (r.ip.empty()) continue;
        Slot& s = slotFor(r.ip);
        switch (r.role) {
            case parser::ServiceRole::Pairing:
                s.c.pairing_port = r.port;
                s.c.pairing_service = r.service_name;
                if (!s.pairing_name && !r.name.empty()) s.pairing_name = r.name;
                break;
            case parser::ServiceRole::Connect:
                s.c.connect_port = r.port;
                if (!s.connect_name && !r.name.empty()) s.connect_name = r.name;
                break;
            case parser::ServiceRole::Unlabeled:
                if (!s.c.connect_port) s.c.connect_port = r.port;
                if (!s.connect_name && !r.name.empty()) s.connect_name = r.name;
                break;
        }
    }

    for (const auto& ip : probe_hits) {
        Slot& s = slotFor(ip);
        s.probed = true;
        if (!s.c.connect_port) s.c.connect_port = probe_port;
    }

    std::vector<WirelessCandidate> out;
    out.reserve(slots.size());
    for (auto& s : slots) {
        if (s.pairing_name) s.c.name = *s.pairing_name;
        else if (s.connect_name) s.c.name = *s.connect_name;
        else if (s.probed) s.c.name = "Scanned Device (" + s.c.ip + ")";
        else s.c.name = "Unknown";
        out.push_back(std::move(s.c));
    }
    return out;
}

// =============================================================================
// Subnet probe
// =============================================================================

Result<std::string> localIPv4Address() {
#ifdef _WIN32
    if (!transport::initSockets()) {
        return Err<std::string>(ErrorKind::ScanFailure, "socket subsystem unavailable");
    }
    char host[256] = {};
    if (gethostname(host, sizeof(host)) != 0) {
        return Err<std::string>(ErrorKind::ScanFailure, "gethostname failed", lastSocketError());
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    addrinfo* list = nullptr;
    if (getaddrinfo(host, nullptr, &hints, &list) != 0 || !list) {
        return Err<std::string>(ErrorKind::ScanFailure, "cannot resolve local host name");
    }
    std::string found;
    for (addrinfo* ai = list; ai; ai = ai->ai_next) {
        auto* sin = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
        if ((ntohl(sin->sin_addr.s_addr) >> 24) == 127) continue;
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        found = buf;
        break;
    }
    freeaddrinfo(list);
#else
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return Err<std::string>(ErrorKind::ScanFailure, "getifaddrs failed", errno);
    }
    std::string found;
    for (ifaddrs* ifa = list; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        found = buf;
        break;
    }
    freeifaddrs(list);
#endif
    if (found.empty()) {
        return Err<std::string>(ErrorKind::ScanFailure, "no non-loopback IPv4 interface");
    }
    return Ok(found);
}

std::optional<std::string> subnetPrefix24(const std::string& ip) {
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) return std::nullopt;
    auto last_dot = ip.rfind('.');
    return ip.substr(0, last_dot + 1);
}

namespace {

struct ProbeTarget {
    std::string ip;
    int port;
};

// Non-blocking connect to every target at once, multiplexed with poll().
// Indices of the targets that accepted within timeout; with stop_at_first
// the scan ends as soon as one does.
Result<std::vector<size_t>> probeTargets(const std::vector<ProbeTarget>& targets,
                                         std::chrono::milliseconds timeout, bool stop_at_first) {
    if (!transport::initSockets()) {
        return Err<std::vector<size_t>>(ErrorKind::ScanFailure, "socket subsystem unavailable");
    }

    struct Pending {
        socket_t sock;
        size_t index;
    };
    std::vector<Pending> pending;
    std::vector<size_t> hits;
    auto closePending = [&pending] {
        for (const auto& p : pending) closeSocket(p.sock);
    };

    for (size_t i = 0; i < targets.size(); ++i) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(targets[i].port));
        if (inet_pton(AF_INET, targets[i].ip.c_str(), &addr.sin_addr) != 1) {
            closePending();
            return Err<std::vector<size_t>>(ErrorKind::ScanFailure, "invalid address: " + targets[i].ip);
        }

        socket_t s = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (s == PELO_INVALID_SOCKET) {
            PLOG_WARN("discovery", "socket() failed at %s:%d (err=%d)", targets[i].ip.c_str(),
                      targets[i].port, lastSocketError());
            break;
        }
        setNonBlocking(s, true);
        int rc = ::connect(s, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
        if (rc == 0) {
            hits.push_back(i);
            closeSocket(s);
            if (stop_at_first) {
                closePending();
                return Ok(std::move(hits));
            }
        } else if (connectInProgress(lastSocketError())) {
            pending.push_back({s, i});
        } else {
            closeSocket(s);
        }
    }

#ifdef _WIN32
    std::vector<WSAPOLLFD> fds;
#else
    std::vector<pollfd> fds;
#endif
    fds.reserve(pending.size());
    for (const auto& p : pending) fds.push_back({p.sock, POLLOUT, 0});

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!fds.empty() && !(stop_at_first && !hits.empty())) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;
#ifdef _WIN32
        int rc = WSAPoll(fds.data(), (ULONG)fds.size(), (INT)left.count());
#else
        int rc = ::poll(fds.data(), fds.size(), (int)left.count());
#endif
        if (rc <= 0) break;

        // Settled sockets are dropped from both lists
        size_t keep = 0;
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                fds[keep] = fds[i];
                pending[keep] = pending[i];
                ++keep;
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fds[i].fd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len);
            if (so_error == 0 && (fds[i].revents & POLLOUT)) hits.push_back(pending[i].index);
            closeSocket(fds[i].fd);
        }
        fds.resize(keep);
        pending.resize(keep);
    }
    for (const auto& f : fds) closeSocket(f.fd);

    std::sort(hits.begin(), hits.end());
    return Ok(std::move(hits));
}

} // namespace

Result<std::vector<std::string>> probeSubnet(const std::string& prefix, int port,
                                             std::chrono::milliseconds timeout) {
    std::vector<ProbeTarget> targets;
    targets.reserve(254);
    for (int host = 1; host <= 254; ++host) {
        targets.push_back({prefix + std::to_string(host), port});
    }
    auto probed = probeTargets(targets, timeout, false);
    if (probed.is_err()) {
        if (probed.error().message.rfind("invalid address", 0) == 0) {
            return Err<std::vector<std::string>>(ErrorKind::ScanFailure, "invalid subnet prefix: " + prefix);
        }
        return probed.error();
    }

    std::vector<std::string> hits;
    for (size_t index : probed.value()) hits.push_back(targets[index].ip);
    PLOG_INFO("discovery", "Probe %s0/24:%d -> %zu host(s)", prefix.c_str(), port, hits.size());
    return Ok(std::move(hits));
}

Result<std::optional<int>> findOpenPort(const std::string& ip, int first_port, int last_port,
                                        std::optional<int> skip_port,
                                        std::chrono::milliseconds timeout) {
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return Err<std::optional<int>>(ErrorKind::ScanFailure, "not an IPv4 address: " + ip);
    }

    std::vector<ProbeTarget> batch;
    batch.reserve(PORT_SCAN_BATCH);
    int port = first_port;
    while (port <= last_port || !batch.empty()) {
        if (port <= last_port) {
            if (!(skip_port && port == *skip_port)) batch.push_back({ip, port});
            ++port;
            if (batch.size() < PORT_SCAN_BATCH && port <= last_port) continue;
        }
        if (batch.empty()) continue;

        auto probed = probeTargets(batch, timeout, true);
        if (probed.is_err()) return probed.error();
        if (!probed.value().empty()) {
            int found = batch[probed.value().front()].port;
            PLOG_INFO("discovery", "Open port on %s: %d", ip.c_str(), found);
            return Ok(std::optional<int>(found));
        }
        batch.clear();
    }
    PLOG_INFO("discovery", "No open port on %s in %d-%d", ip.c_str(), first_port, last_port);
    return Ok(std::optional<int>());
}

NetworkDiscovery::Prober makeSubnetProber(std::chrono::milliseconds timeout) {
    return [timeout](int port) -> Result<std::vector<std::string>> {
        auto local = localIPv4Address();
        if (local.is_err()) return local.error();
        auto prefix = subnetPrefix24(local.value());
        if (!prefix) {
            return Err<std::vector<std::string>>(ErrorKind::ScanFailure,
                                                 "not an IPv4 address: " + local.value());
        }
        return probeSubnet(*prefix, port, timeout);
    };
}

} // namespace pelo
