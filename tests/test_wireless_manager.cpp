// =============================================================================
// Unit tests for WirelessManager (src/wireless_manager.hpp)
// Tests: pair/connect ordering, USB handoff, developer toggles
// =============================================================================
#include <gtest/gtest.h>
#include "wireless_manager.hpp"
#include "fake_transport.hpp"

using namespace pelo;
using pelo::fakes::FakeTransport;

class WirelessManagerTest : public ::testing::Test {
protected:
    FakeTransport adb;
    AdbDeviceManager devices{adb};
    int refreshes = 0;
    std::vector<std::chrono::milliseconds> sleeps;
    std::unique_ptr<WirelessManager> wm;

    void SetUp() override {
        wm = std::make_unique<WirelessManager>(
            adb, devices, 5555, std::chrono::milliseconds(2000),
            [this]() { refreshes++; }, nullptr,
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

// ---------------------------------------------------------------------------
// Pair / connect
// ---------------------------------------------------------------------------
TEST_F(WirelessManagerTest, PairThenConnectThenRefresh) {
    adb.on("pair 10.0.0.5:40000 123456", "Successfully paired to 10.0.0.5:40000 [guid=adb-R52N30]");
    adb.on("connect 10.0.0.5:5555", "connected to 10.0.0.5:5555");

    auto r = wm->pairAndConnect("10.0.0.5", 40000, "123456", 5555);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(adb.calls.size(), 2u);
    EXPECT_EQ(adb.calls[0], "pair 10.0.0.5:40000 123456");
    EXPECT_EQ(adb.calls[1], "connect 10.0.0.5:5555");
    EXPECT_EQ(refreshes, 1);
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(2000));
}

TEST_F(WirelessManagerTest, PairFailureSkipsConnect) {
    adb.on("pair 10.0.0.5:40000 000000", "Failed: Wrong password or connection was dropped.");

    auto r = wm->pairAndConnect("10.0.0.5", 40000, "000000", 5555);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::PairingFailure);
    EXPECT_EQ(adb.count("connect"), 0u);
    EXPECT_EQ(refreshes, 0);
}

TEST_F(WirelessManagerTest, PairTransportErrorIsPairingFailure) {
    adb.fail("pair 10.0.0.5:40000 123456", "error: protocol fault");
    auto r = wm->pairAndConnect("10.0.0.5", 40000, "123456", 5555);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::PairingFailure);
    EXPECT_EQ(r.error().output, "error: protocol fault");
}

TEST_F(WirelessManagerTest, ConnectWithoutCodeSkipsPairing) {
    adb.on("connect 10.0.0.5:5555", "already connected to 10.0.0.5:5555");
    ASSERT_TRUE(wm->pairAndConnect("10.0.0.5", 40000, "", 5555).is_ok());
    EXPECT_EQ(adb.count("pair"), 0u);
}

TEST_F(WirelessManagerTest, ConnectFailureIsConnectionTimeout) {
    adb.on("connect 10.0.0.5:5555", "failed to connect to '10.0.0.5:5555': Connection refused");
    auto r = wm->pairAndConnect("10.0.0.5", std::nullopt, "", 5555);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConnectionTimeout);
    EXPECT_EQ(refreshes, 0);
}

// ---------------------------------------------------------------------------
// Handoff
// ---------------------------------------------------------------------------
TEST_F(WirelessManagerTest, HandoffSwitchesToTcpAndConnects) {
    adb.on("shell R52N30 ip addr show wlan0", "    inet 10.0.0.5/24 brd 10.0.0.255 scope global wlan0\n");
    adb.on("connect 10.0.0.5:5555", "connected to 10.0.0.5:5555");

    auto r = wm->handoffToWireless(Device::fromSerial("R52N30"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "10.0.0.5:5555");
    EXPECT_EQ(adb.calls.front(), "tcpip R52N30 5555");
    EXPECT_TRUE(adb.called("connect 10.0.0.5:5555"));
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(refreshes, 1);
}

TEST_F(WirelessManagerTest, HandoffWithoutWlanAddress) {
    auto r = wm->handoffToWireless(Device::fromSerial("R52N30"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NoNetworkAddress);
    EXPECT_EQ(adb.count("connect"), 0u);
    EXPECT_EQ(refreshes, 0);
}

TEST_F(WirelessManagerTest, HandoffRejectsWirelessDevice) {
    auto r = wm->handoffToWireless(Device::fromSerial("10.0.0.5:5555"));
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(adb.calls.empty());
}

TEST_F(WirelessManagerTest, HandoffTcpipFailure) {
    adb.fail("tcpip R52N30 5555", "error: device offline");
    auto r = wm->handoffToWireless(Device::fromSerial("R52N30"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::TransportFailure);
    EXPECT_EQ(adb.calls.size(), 1u);
}

// ---------------------------------------------------------------------------
// Developer toggles
// ---------------------------------------------------------------------------
TEST_F(WirelessManagerTest, TogglesAppendQuickSettingsTile) {
    adb.on("shell R52N30 settings get secure sysui_qs_tiles", "wifi,bt\n");

    auto results = wm->applyDeveloperToggles("R52N30");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].first, WirelessManager::TOGGLE_WIRELESS_DEBUGGING);
    EXPECT_TRUE(results[0].second);
    EXPECT_EQ(results[1].first, WirelessManager::TOGGLE_STAY_AWAKE);
    EXPECT_TRUE(results[1].second);

    EXPECT_TRUE(adb.called("shell R52N30 settings put global adb_wifi_enabled 1"));
    EXPECT_TRUE(adb.called(std::string("shell R52N30 settings put secure sysui_qs_tiles 'wifi,bt,") +
                           WirelessManager::WIRELESS_DEBUG_TILE + "'"));
    EXPECT_TRUE(adb.called("shell R52N30 settings put global stay_on_while_plugged_in 7"));
}

TEST_F(WirelessManagerTest, TileAlreadyPresentIsNotRewritten) {
    adb.on("shell R52N30 settings get secure sysui_qs_tiles",
           std::string("wifi,") + WirelessManager::WIRELESS_DEBUG_TILE);
    auto results = wm->applyDeveloperToggles("R52N30");
    EXPECT_TRUE(results[0].second);
    EXPECT_EQ(adb.count("shell R52N30 settings put secure sysui_qs_tiles"), 0u);
}

TEST_F(WirelessManagerTest, NullTileListBecomesJustTheTile) {
    adb.on("shell R52N30 settings get secure sysui_qs_tiles", "null");
    wm->applyDeveloperToggles("R52N30");
    EXPECT_TRUE(adb.called(std::string("shell R52N30 settings put secure sysui_qs_tiles '") +
                           WirelessManager::WIRELESS_DEBUG_TILE + "'"));
}

TEST_F(WirelessManagerTest, TogglesAreIndependent) {
    adb.fail("shell R52N30 settings put global adb_wifi_enabled 1");
    auto results = wm->applyDeveloperToggles("R52N30");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].second);
    EXPECT_TRUE(results[1].second);
}

// ---------------------------------------------------------------------------
// Discovered device: pair, then wait for the connect service
// ---------------------------------------------------------------------------
class ConnectCandidateTest : public WirelessManagerTest {
protected:
    std::vector<std::pair<std::string, std::optional<int>>> scans;

    void SetUp() override {
        WirelessManagerTest::SetUp();
        WirelessManager::ConnectWait wait;
        wait.deadline = std::chrono::milliseconds(20000);
        wait.mdns_refresh = std::chrono::milliseconds(10000);
        wait.retry_delay = std::chrono::milliseconds(5000);
        wait.missing_info_delay = std::chrono::milliseconds(3000);
        wm->setConnectWait(wait);
    }

    void scanFinds(std::optional<int> port) {
        wm->setPortScanner([this, port](const std::string& ip, std::optional<int> skip)
                               -> Result<std::optional<int>> {
            scans.emplace_back(ip, skip);
            return Ok(port);
        });
    }

    static WirelessCandidate candidate() {
        WirelessCandidate c;
        c.name = "adb-R52N30-Xyz";
        c.ip = "10.0.0.5";
        c.pairing_port = 40000;
        c.pairing_service = "adb-R52N30-Xyz._adb-tls-pairing._tcp.local.";
        return c;
    }
};

TEST_F(ConnectCandidateTest, PairsByAddressThenUsesAdvertisedPort) {
    auto c = candidate();
    c.connect_port = 37555;
    adb.on("pair 10.0.0.5:40000 123456", "Successfully paired to 10.0.0.5:40000 [guid=adb-R52N30]");
    adb.on("connect 10.0.0.5:37555", "connected to 10.0.0.5:37555");

    auto r = wm->connectCandidate(c, "123456");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "10.0.0.5:37555");
    EXPECT_EQ(adb.calls, (std::vector<std::string>{"pair 10.0.0.5:40000 123456",
                                                   "connect 10.0.0.5:37555"}));
    EXPECT_EQ(refreshes, 1);
}

TEST_F(ConnectCandidateTest, PairsByServiceNameWithoutPairingPort) {
    auto c = candidate();
    c.pairing_port.reset();
    c.connect_port = 37555;
    adb.on("pair-service adb-R52N30-Xyz._adb-tls-pairing._tcp.local. 123456",
           "Successfully paired to 10.0.0.5:40000 [guid=adb-R52N30]");
    adb.on("connect 10.0.0.5:37555", "connected to 10.0.0.5:37555");

    ASSERT_TRUE(wm->connectCandidate(c, "123456").is_ok());
    EXPECT_EQ(adb.count("pair "), 0u);
    EXPECT_EQ(adb.count("pair-service"), 1u);
}

TEST_F(ConnectCandidateTest, PairingFailureSkipsConnectLoop) {
    adb.on("pair 10.0.0.5:40000 000000", "Failed: Wrong password or connection was dropped.");
    auto r = wm->connectCandidate(candidate(), "000000");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::PairingFailure);
    EXPECT_EQ(adb.count("connect"), 0u);
    EXPECT_EQ(adb.count("mdns"), 0u);
}

TEST_F(ConnectCandidateTest, NoPairingEndpointIsPairingFailure) {
    WirelessCandidate c;
    c.ip = "10.0.0.9";
    auto r = wm->connectCandidate(c, "123456");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::PairingFailure);
    EXPECT_TRUE(adb.calls.empty());
}

TEST_F(ConnectCandidateTest, RetriesRefusedConnectUntilAccepted) {
    auto c = candidate();
    c.connect_port = 37555;
    adb.on("connect 10.0.0.5:37555", "failed to connect to '10.0.0.5:37555': Connection refused");
    adb.on("connect 10.0.0.5:37555", "failed to connect to '10.0.0.5:37555': Connection refused");
    adb.on("connect 10.0.0.5:37555", "connected to 10.0.0.5:37555");

    ASSERT_TRUE(wm->connectCandidate(c, "").is_ok());
    EXPECT_EQ(adb.count("connect"), 3u);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{
                          std::chrono::milliseconds(5000), std::chrono::milliseconds(5000),
                          std::chrono::milliseconds(2000)}));
}

TEST_F(ConnectCandidateTest, GivesUpAtDeadline) {
    auto c = candidate();
    c.connect_port = 37555;
    adb.default_reply = Ok(std::string("failed to connect to '10.0.0.5:37555': Connection refused"));

    auto r = wm->connectCandidate(c, "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConnectionTimeout);
    EXPECT_EQ(r.error().output, "failed to connect to '10.0.0.5:37555': Connection refused");
    // 20 s budget at one attempt per 5 s
    EXPECT_EQ(adb.count("connect"), 4u);
    EXPECT_EQ(refreshes, 0);
}

TEST_F(ConnectCandidateTest, RefreshesMdnsUntilConnectServiceAppears) {
    adb.on("mdns services", "List of discovered mdns services\n"
                            "adb-R52N30-Xyz\t_adb-tls-pairing._tcp.\t10.0.0.5:40000\n");
    adb.on("mdns services", "List of discovered mdns services\n"
                            "adb-R52N30-Xyz\t_adb-tls-connect._tcp.\t10.0.0.5:37001\n");
    adb.on("connect 10.0.0.5:37001", "connected to 10.0.0.5:37001");

    auto r = wm->connectCandidate(candidate(), "");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "10.0.0.5:37001");
    // Listings at 0 s and 12 s; 3 s waits in between
    EXPECT_EQ(adb.count("mdns services"), 2u);
    EXPECT_EQ(sleeps.size(), 5u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(3000));
}

TEST_F(ConnectCandidateTest, ScansPortRangeWhenMdnsIsSilent) {
    scanFinds(41234);
    adb.on("connect 10.0.0.5:41234", "connected to 10.0.0.5:41234");

    auto r = wm->connectCandidate(candidate(), "");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "10.0.0.5:41234");
    ASSERT_EQ(scans.size(), 1u);
    EXPECT_EQ(scans[0].first, "10.0.0.5");
    EXPECT_EQ(scans[0].second, std::optional<int>(40000));
    EXPECT_EQ(adb.count("mdns services"), 1u);
}

TEST_F(ConnectCandidateTest, PortScanRunsOnceWhenNothingAnswers) {
    scanFinds(std::nullopt);

    auto r = wm->connectCandidate(candidate(), "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::ConnectionTimeout);
    EXPECT_EQ(scans.size(), 1u);
    EXPECT_EQ(adb.count("connect"), 0u);
}
