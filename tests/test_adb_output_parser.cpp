// =============================================================================
// Unit tests for adb output classification (src/adb_output_parser.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_output_parser.hpp"

using namespace pelo::parser;

// ---------------------------------------------------------------------------
// General helpers
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, TrimAndSplit) {
    EXPECT_EQ(trim("  abc \r\n"), "abc");
    EXPECT_EQ(trim("\t\n"), "");

    auto words = splitWhitespace("R52N30\tdevice  usb:1-1");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[1], "device");

    auto lines = splitLines("a\r\nb\nc");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(trim(lines[0]), "a");
    EXPECT_EQ(lines[2], "c");
}

// ---------------------------------------------------------------------------
// Device list
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, ParseDeviceListWithHeader) {
    const char* text =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "R52N30ABCDE\tdevice\n"
        "10.0.0.5:5555\toffline\n"
        "emulator-5554\tunauthorized\n"
        "\n";
    auto devices = parseDeviceList(text);
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].serial, "R52N30ABCDE");
    EXPECT_EQ(devices[0].status, "device");
    EXPECT_EQ(devices[1].serial, "10.0.0.5:5555");
    EXPECT_EQ(devices[1].status, "offline");
    EXPECT_EQ(devices[2].status, "unauthorized");
}

TEST(AdbOutputParserTest, ParseDeviceListWithoutHeader) {
    auto devices = parseDeviceList("R52N30ABCDE\tdevice\n");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].serial, "R52N30ABCDE");
}

TEST(AdbOutputParserTest, ParseDeviceListEmpty) {
    EXPECT_TRUE(parseDeviceList("List of devices attached\n\n").empty());
    EXPECT_TRUE(parseDeviceList("").empty());
}

// ---------------------------------------------------------------------------
// Install classification
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, ClassifyInstall) {
    EXPECT_EQ(classifyInstall("Performing Streamed Install\nSuccess\n"), InstallStatus::Success);
    EXPECT_EQ(classifyInstall("adb: failed to install app.apk: Failure "
                              "[INSTALL_FAILED_UPDATE_INCOMPATIBLE: Package com.onepeloton.app "
                              "signatures do not match previously installed version; ignoring!]"),
              InstallStatus::UpdateIncompatible);
    EXPECT_EQ(classifyInstall("Failure [INSTALL_FAILED_INSUFFICIENT_STORAGE]"), InstallStatus::Failure);
    EXPECT_EQ(classifyInstall(""), InstallStatus::Failure);
}

TEST(AdbOutputParserTest, ExtractConflictingPackage) {
    auto pkg = extractConflictingPackage(
        "Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE: Package com.spotify.music "
        "signatures do not match the previously installed version; ignoring!]");
    ASSERT_TRUE(pkg.has_value());
    EXPECT_EQ(*pkg, "com.spotify.music");

    EXPECT_FALSE(extractConflictingPackage("Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE]").has_value());
}

TEST(AdbOutputParserTest, ParsePackageList) {
    auto pkgs = parsePackageList("package:com.onepeloton.callisto\r\n"
                                 "package:com.android.settings\n"
                                 "\n"
                                 "junk line\n");
    ASSERT_EQ(pkgs.size(), 2u);
    EXPECT_EQ(pkgs[0], "com.onepeloton.callisto");
    EXPECT_EQ(pkgs[1], "com.android.settings");
}

// ---------------------------------------------------------------------------
// mDNS services
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, RoleForServiceType) {
    EXPECT_EQ(roleForServiceType("_adb-tls-pairing._tcp"), ServiceRole::Pairing);
    EXPECT_EQ(roleForServiceType("_adb-tls-connect._tcp"), ServiceRole::Connect);
    EXPECT_EQ(roleForServiceType("_adb._tcp"), ServiceRole::Connect);
    EXPECT_EQ(roleForServiceType("_http._tcp"), ServiceRole::Unlabeled);
    EXPECT_STREQ(serviceRoleName(ServiceRole::Pairing), "pairing");
}

TEST(AdbOutputParserTest, ParseMdnsServices) {
    const char* text =
        "List of discovered mdns services\n"
        "adb-R52N30-Xyz\t_adb-tls-pairing._tcp.\t10.0.0.5:40000\n"
        "adb-R52N30-Xyz\t_adb-tls-connect._tcp.\t10.0.0.5:5555\n"
        "garbage\n";
    size_t skipped = 0;
    auto records = parseMdnsServices(text, &skipped);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(skipped, 1u);

    EXPECT_EQ(records[0].name, "adb-R52N30-Xyz");
    EXPECT_EQ(records[0].service_type, "_adb-tls-pairing._tcp");
    EXPECT_EQ(records[0].ip, "10.0.0.5");
    EXPECT_EQ(records[0].port, 40000);
    EXPECT_EQ(records[0].role, ServiceRole::Pairing);
    EXPECT_EQ(records[0].service_name, "adb-R52N30-Xyz._adb-tls-pairing._tcp.local.");

    EXPECT_EQ(records[1].role, ServiceRole::Connect);
    EXPECT_EQ(records[1].port, 5555);
}

TEST(AdbOutputParserTest, ParseMdnsServicesHostPortForms) {
    auto v6 = parseMdnsServices("dev\t_adb-tls-connect._tcp\t[fe80::1]:37000\n");
    ASSERT_EQ(v6.size(), 1u);
    EXPECT_EQ(v6[0].ip, "fe80::1");
    EXPECT_EQ(v6[0].port, 37000);

    auto split = parseMdnsServices("dev _adb._tcp local 10.0.0.9 5555\n");
    ASSERT_EQ(split.size(), 1u);
    EXPECT_EQ(split[0].ip, "10.0.0.9");
    EXPECT_EQ(split[0].port, 5555);
}

TEST(AdbOutputParserTest, ParseMdnsServicesRejectsBadPort) {
    size_t skipped = 0;
    auto records = parseMdnsServices("dev\t_adb._tcp\t10.0.0.5:70000\n", &skipped);
    EXPECT_TRUE(records.empty());
    EXPECT_EQ(skipped, 1u);
}

// ---------------------------------------------------------------------------
// Connect / pair / wlan
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, ConnectSuccess) {
    EXPECT_TRUE(isConnectSuccess("connected to 10.0.0.5:5555"));
    EXPECT_TRUE(isConnectSuccess("already connected to 10.0.0.5:5555"));
    EXPECT_FALSE(isConnectSuccess("failed to connect to '10.0.0.5:5555': Connection refused"));
    EXPECT_FALSE(isConnectSuccess("cannot connect to 10.0.0.5:5555: No route to host"));
    EXPECT_FALSE(isConnectSuccess(""));
}

TEST(AdbOutputParserTest, PairSuccess) {
    EXPECT_TRUE(isPairSuccess("Successfully paired to 10.0.0.5:40000 [guid=adb-R52N30-Xyz]"));
    EXPECT_FALSE(isPairSuccess("Failed: Wrong password or connection was dropped."));
    EXPECT_FALSE(isPairSuccess("error: protocol fault"));
}

TEST(AdbOutputParserTest, ParseWlanAddress) {
    const char* ip_addr =
        "3: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500\n"
        "    link/ether 02:00:00:00:00:00 brd ff:ff:ff:ff:ff:ff\n"
        "    inet 192.168.1.42/24 brd 192.168.1.255 scope global wlan0\n";
    EXPECT_EQ(parseWlanAddress(ip_addr).value(), "192.168.1.42");
    EXPECT_EQ(parseWlanAddress("192.168.1.43\n").value(), "192.168.1.43");
    EXPECT_FALSE(parseWlanAddress("Device \"wlan0\" does not exist.").has_value());
    EXPECT_FALSE(parseWlanAddress("").has_value());
}

// ---------------------------------------------------------------------------
// Device settings
// ---------------------------------------------------------------------------
TEST(AdbOutputParserTest, ParseRotationAndToggle) {
    EXPECT_EQ(parseRotation("1\n").value(), 1);
    EXPECT_EQ(parseRotation("3").value(), 3);
    EXPECT_FALSE(parseRotation("4").has_value());
    EXPECT_FALSE(parseRotation("null").has_value());

    EXPECT_EQ(parseToggle("1").value(), true);
    EXPECT_EQ(parseToggle("0\n").value(), false);
    EXPECT_FALSE(parseToggle("null").has_value());
}

TEST(AdbOutputParserTest, ParseLaunchersDedupes) {
    const char* text =
        "priority=0 preferredOrder=0 match=0x108000 specificIndex=-1 isDefault=true\n"
        "com.onepeloton.callisto/.MainActivity\n"
        "com.android.launcher3/.Launcher\n"
        "com.onepeloton.callisto/.AltActivity\n";
    auto launchers = parseLaunchers(text);
    ASSERT_EQ(launchers.size(), 2u);
    EXPECT_EQ(launchers[0], "com.onepeloton.callisto");
    EXPECT_EQ(launchers[1], "com.android.launcher3");
}
