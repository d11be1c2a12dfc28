// =============================================================================
// PeloBridge - Wireless device discovery
// =============================================================================
// Two strategies, run concurrently and merged per IP:
//   1. adb mDNS service listing (pairing + connect advertisements)
//   2. /24 subnet probe: non-blocking connect to every host on one port,
//      multiplexed with poll()
// The same probe finds the connect port of a paired device (findOpenPort).
// =============================================================================
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "adb_output_parser.hpp"
#include "log_ring.hpp"
#include "result.hpp"
#include "transport/adb_transport.hpp"

namespace pelo {

struct WirelessCandidate {
    std::string name;
    std::string ip;
    std::optional<int> pairing_port;
    std::optional<int> connect_port;
    std::optional<std::string> pairing_service;   // full mDNS service name
};

class NetworkDiscovery {
public:
    // port -> IPs that accepted a TCP connection
    using Prober = std::function<Result<std::vector<std::string>>(int port)>;

    static constexpr int DEFAULT_PROBE_PORT = 5555;

    NetworkDiscovery(transport::AdbTransport& adb, Prober prober, LogSink log = nullptr);

    // port: explicit probe target; forces the subnet probe even when mDNS
    // found something. Never fails: a broken strategy contributes nothing.
    std::vector<WirelessCandidate> scan(std::optional<int> port = std::nullopt);

    static std::vector<WirelessCandidate> mergeCandidates(
        const std::vector<parser::ServiceRecord>& records,
        const std::vector<std::string>& probe_hits,
        int probe_port);

private:
    std::vector<parser::ServiceRecord> discoverServices();

    transport::AdbTransport& adb_;
    Prober prober_;
    LogSink log_;
};

// First non-loopback IPv4 address of this host
Result<std::string> localIPv4Address();

// "192.168.1.23" -> "192.168.1."; nullopt for anything that is not a quad
std::optional<std::string> subnetPrefix24(const std::string& ip);

// Connect to <prefix>1..254:port at once; hosts accepting within timeout
Result<std::vector<std::string>> probeSubnet(const std::string& prefix, int port,
                                             std::chrono::milliseconds timeout);

// Adb wireless debugging picks its connect port from this range
constexpr int CONNECT_PORT_FIRST = 30000;
constexpr int CONNECT_PORT_LAST = 50000;
// Sockets in flight at once during a port scan
constexpr size_t PORT_SCAN_BATCH = 256;

// First port of ip in [first_port, last_port] found accepting a TCP
// connection. Ports are probed in ascending batches of PORT_SCAN_BATCH,
// each batch given timeout. nullopt when none did.
Result<std::optional<int>> findOpenPort(const std::string& ip, int first_port, int last_port,
                                        std::optional<int> skip_port,
                                        std::chrono::milliseconds timeout);

// Default Prober: local address -> /24 -> probeSubnet
NetworkDiscovery::Prober makeSubnetProber(std::chrono::milliseconds timeout);

} // namespace pelo
