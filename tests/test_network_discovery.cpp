// =============================================================================
// Unit tests for NetworkDiscovery (src/network_discovery.hpp)
// Tests: per-IP merge, naming, subnet sweep gating, subnet helpers
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif
#include "network_discovery.hpp"
#include "fake_transport.hpp"

using namespace pelo;
using pelo::fakes::FakeTransport;
using parser::ServiceRecord;
using parser::ServiceRole;

namespace {

ServiceRecord record(const std::string& name, const std::string& ip, int port, ServiceRole role) {
    ServiceRecord r;
    r.name = name;
    r.ip = ip;
    r.port = port;
    r.role = role;
    r.service_name = name + "._adb-tls-pairing._tcp.local.";
    return r;
}

const char* MDNS_LISTING =
    "List of discovered mdns services\n"
    "adb-R52N30-Xyz\t_adb-tls-pairing._tcp.\t10.0.0.5:40000\n"
    "adb-R52N30-Xyz\t_adb-tls-connect._tcp.\t10.0.0.5:5555\n";

} // namespace

// ---------------------------------------------------------------------------
// mergeCandidates
// ---------------------------------------------------------------------------
TEST(NetworkDiscoveryTest, MergesPairingAndConnectForSameIp) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("adb-R52N30-Xyz", "10.0.0.5", 40000, ServiceRole::Pairing),
         record("adb-R52N30-Xyz", "10.0.0.5", 5555, ServiceRole::Connect)},
        {}, 5555);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].ip, "10.0.0.5");
    EXPECT_EQ(out[0].name, "adb-R52N30-Xyz");
    EXPECT_EQ(out[0].pairing_port.value(), 40000);
    EXPECT_EQ(out[0].connect_port.value(), 5555);
    EXPECT_EQ(out[0].pairing_service.value(), "adb-R52N30-Xyz._adb-tls-pairing._tcp.local.");
}

TEST(NetworkDiscoveryTest, KeepsFirstSeenOrder) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("b", "10.0.0.9", 5555, ServiceRole::Connect),
         record("a", "10.0.0.3", 5555, ServiceRole::Connect),
         record("b-pair", "10.0.0.9", 41000, ServiceRole::Pairing)},
        {"10.0.0.20"}, 5555);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].ip, "10.0.0.9");
    EXPECT_EQ(out[1].ip, "10.0.0.3");
    EXPECT_EQ(out[2].ip, "10.0.0.20");
}

TEST(NetworkDiscoveryTest, PairingNameWinsOverConnectName) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("connect-name", "10.0.0.5", 5555, ServiceRole::Connect),
         record("pair-name", "10.0.0.5", 40000, ServiceRole::Pairing)},
        {}, 5555);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "pair-name");
}

TEST(NetworkDiscoveryTest, SweepOnlyHitsGetScannedName) {
    auto out = NetworkDiscovery::mergeCandidates({}, {"192.168.1.40"}, 5556);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Scanned Device (192.168.1.40)");
    EXPECT_EQ(out[0].connect_port.value(), 5556);
    EXPECT_FALSE(out[0].pairing_port.has_value());
}

TEST(NetworkDiscoveryTest, SweepDoesNotOverrideAdvertisedConnectPort) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("dev", "10.0.0.5", 37001, ServiceRole::Connect)}, {"10.0.0.5"}, 5555);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].connect_port.value(), 37001);
    EXPECT_EQ(out[0].name, "dev");
}

TEST(NetworkDiscoveryTest, UnlabeledFillsOnlyMissingConnectPort) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("dev", "10.0.0.5", 5555, ServiceRole::Connect),
         record("other", "10.0.0.5", 9999, ServiceRole::Unlabeled)},
        {}, 5555);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].connect_port.value(), 5555);
}

TEST(NetworkDiscoveryTest, NamelessRecordIsUnknown) {
    auto out = NetworkDiscovery::mergeCandidates(
        {record("", "10.0.0.5", 40000, ServiceRole::Pairing)}, {}, 5555);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Unknown");
}

// ---------------------------------------------------------------------------
// scan
// ---------------------------------------------------------------------------
TEST(NetworkDiscoveryTest, ScanUsesMdnsAndIgnoresSweepWhenMdnsFound) {
    FakeTransport adb;
    adb.on("mdns services", MDNS_LISTING);
    std::atomic<int> sweeps{0};
    NetworkDiscovery discovery(adb, [&](int) -> Result<std::vector<std::string>> {
        sweeps++;
        return Ok(std::vector<std::string>{"10.0.0.77"});
    });

    auto out = discovery.scan();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].ip, "10.0.0.5");
    EXPECT_EQ(sweeps.load(), 1);
}

TEST(NetworkDiscoveryTest, ScanFallsBackToSweepWhenMdnsEmpty) {
    FakeTransport adb;
    int swept_port = 0;
    NetworkDiscovery discovery(adb, [&](int port) -> Result<std::vector<std::string>> {
        swept_port = port;
        return Ok(std::vector<std::string>{"10.0.0.77"});
    });

    auto out = discovery.scan();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(swept_port, NetworkDiscovery::DEFAULT_PROBE_PORT);
    EXPECT_EQ(out[0].name, "Scanned Device (10.0.0.77)");
}

TEST(NetworkDiscoveryTest, ExplicitPortIncludesSweepHits) {
    FakeTransport adb;
    adb.on("mdns services", MDNS_LISTING);
    NetworkDiscovery discovery(adb, [](int) -> Result<std::vector<std::string>> {
        return Ok(std::vector<std::string>{"10.0.0.77"});
    });

    auto out = discovery.scan(5556);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].ip, "10.0.0.77");
    EXPECT_EQ(out[1].connect_port.value(), 5556);
}

TEST(NetworkDiscoveryTest, BrokenStrategiesYieldEmptyList) {
    FakeTransport adb;
    adb.fail("mdns services");
    std::vector<std::string> errors;
    NetworkDiscovery discovery(
        adb,
        [](int) -> Result<std::vector<std::string>> {
            return Err<std::vector<std::string>>(ErrorKind::ScanFailure, "no interface");
        },
        [&](const std::string& m, const std::string& c) {
            if (c == "error") errors.push_back(m);
        });

    EXPECT_TRUE(discovery.scan().empty());
    EXPECT_EQ(errors.size(), 2u);
}

// ---------------------------------------------------------------------------
// Subnet helpers
// ---------------------------------------------------------------------------
TEST(NetworkDiscoveryTest, SubnetPrefix) {
    EXPECT_EQ(subnetPrefix24("192.168.1.23").value(), "192.168.1.");
    EXPECT_EQ(subnetPrefix24("10.0.0.5").value(), "10.0.0.");
    EXPECT_FALSE(subnetPrefix24("not-an-ip").has_value());
    EXPECT_FALSE(subnetPrefix24("300.1.1.1").has_value());
}

#ifndef _WIN32
// ---------------------------------------------------------------------------
// Connect-port scan against a real loopback listener
// ---------------------------------------------------------------------------
class FindOpenPortTest : public ::testing::Test {
protected:
    int fd = -1;
    int port = 0;

    void SetUp() override {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(fd, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(::listen(fd, 16), 0);
        socklen_t len = sizeof(addr);
        ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
        port = ntohs(addr.sin_port);
    }

    void TearDown() override {
        if (fd >= 0) ::close(fd);
    }
};

TEST_F(FindOpenPortTest, FindsListeningPort) {
    auto r = findOpenPort("127.0.0.1", port, port, std::nullopt, std::chrono::milliseconds(500));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), std::optional<int>(port));
}

TEST_F(FindOpenPortTest, SkippedPortIsNotReported) {
    auto r = findOpenPort("127.0.0.1", port, port, port, std::chrono::milliseconds(500));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().has_value());
}

TEST_F(FindOpenPortTest, ClosedPortIsNotReported) {
    ::close(fd);
    fd = -1;
    auto r = findOpenPort("127.0.0.1", port, port, std::nullopt, std::chrono::milliseconds(500));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value().has_value());
}

TEST(FindOpenPort, InvalidAddressIsScanFailure) {
    auto r = findOpenPort("10.0.0", CONNECT_PORT_FIRST, CONNECT_PORT_FIRST + 10, std::nullopt,
                          std::chrono::milliseconds(100));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ScanFailure);
}
#endif
