// =============================================================================
// PeloBridge - AdbDeviceManager Unit Tests
// =============================================================================
// Device-level queries against a scripted transport; no adb execution.

#include <gtest/gtest.h>
#include "adb_device_manager.hpp"
#include "fake_transport.hpp"

using namespace pelo;
using pelo::fakes::FakeTransport;

// =============================================================================
// Device serial classification
// =============================================================================

TEST(DeviceTest, UsbSerial) {
    Device d = Device::fromSerial("R52N30ABCDE");
    EXPECT_EQ(d.transport, DeviceTransport::Usb);
    EXPECT_FALSE(d.ip.has_value());
    EXPECT_FALSE(d.port.has_value());
}

TEST(DeviceTest, WifiSerialSplitsIpAndPort) {
    Device d = Device::fromSerial("10.0.0.5:5555");
    EXPECT_TRUE(d.isWifi());
    EXPECT_EQ(d.ip.value(), "10.0.0.5");
    EXPECT_EQ(d.port.value(), "5555");
}

TEST(DeviceTest, DisplayName) {
    Device usb = Device::fromSerial("R52N30ABCDE");
    usb.name = "Peloton RB-X";
    EXPECT_EQ(usb.displayName(), "Peloton RB-X • USB");

    Device wifi = Device::fromSerial("10.0.0.5:5555");
    wifi.name = "Peloton RB-X";
    EXPECT_EQ(wifi.displayName(), "Peloton RB-X • WiFi (10.0.0.5:5555)");
}

// =============================================================================
// Enumeration
// =============================================================================

TEST(AdbDeviceManagerTest, ListDevicesFillsNameAndAbi) {
    FakeTransport adb;
    adb.addDevice("R52N30ABCDE", "RB-X", "arm64-v8a");
    AdbDeviceManager mgr(adb);

    auto r = mgr.listDevices();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 1u);
    const Device& d = r.value()[0];
    EXPECT_EQ(d.serial, "R52N30ABCDE");
    EXPECT_EQ(d.name.value(), "Peloton RB-X");
    EXPECT_EQ(d.abi.value(), "arm64-v8a");
}

TEST(AdbDeviceManagerTest, ListDevicesSkipsNonReadyStates) {
    FakeTransport adb;
    adb.addDevice("R52N30ABCDE", "RB-X", "arm64-v8a", "unauthorized");
    adb.addDevice("10.0.0.5:5555", "RB-X", "arm64-v8a", "offline");
    adb.addDevice("emulator-5554", "SDK", "armeabi-v7a");
    AdbDeviceManager mgr(adb);

    auto r = mgr.listDevices();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].serial, "emulator-5554");
}

TEST(AdbDeviceManagerTest, MissingPropertiesLeaveFieldsUnset) {
    FakeTransport adb;
    adb.devices.push_back({"R52N30ABCDE", "device"});
    AdbDeviceManager mgr(adb);

    auto r = mgr.listDevices();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_FALSE(r.value()[0].name.has_value());
    EXPECT_FALSE(r.value()[0].abi.has_value());
}

TEST(AdbDeviceManagerTest, EnumerateErrorPropagates) {
    FakeTransport adb;
    adb.enumerate_error = Error(ErrorKind::TransportFailure, "adb not found");
    AdbDeviceManager mgr(adb);

    auto r = mgr.listDevices();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::TransportFailure);
}

// =============================================================================
// Packages / WLAN address
// =============================================================================

TEST(AdbDeviceManagerTest, ListPackages) {
    FakeTransport adb;
    adb.on("shell R52N30 pm list packages",
           "package:com.onepeloton.callisto\npackage:com.android.settings\n");
    AdbDeviceManager mgr(adb);

    auto r = mgr.listPackages("R52N30");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0], "com.onepeloton.callisto");
}

TEST(AdbDeviceManagerTest, WlanAddressFromIpAddr) {
    FakeTransport adb;
    adb.on("shell R52N30 ip addr show wlan0",
           "    inet 192.168.1.42/24 brd 192.168.1.255 scope global wlan0\n");
    AdbDeviceManager mgr(adb);

    auto r = mgr.getWlanAddress("R52N30");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "192.168.1.42");
}

TEST(AdbDeviceManagerTest, WlanAddressFallsBackToDhcpProperty) {
    FakeTransport adb;
    adb.on("shell R52N30 ip addr show wlan0", "Device \"wlan0\" does not exist.");
    adb.setProp("R52N30", "dhcp.wlan0.ipaddress", "192.168.1.43");
    AdbDeviceManager mgr(adb);

    auto r = mgr.getWlanAddress("R52N30");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "192.168.1.43");
}

TEST(AdbDeviceManagerTest, NoWlanAddress) {
    FakeTransport adb;
    AdbDeviceManager mgr(adb);

    auto r = mgr.getWlanAddress("R52N30");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NoNetworkAddress);
}

// =============================================================================
// Settings
// =============================================================================

TEST(AdbDeviceManagerTest, SetRotationDisablesAutoRotateFirst) {
    FakeTransport adb;
    AdbDeviceManager mgr(adb);

    ASSERT_TRUE(mgr.setRotation("R52N30", 1).is_ok());
    ASSERT_EQ(adb.calls.size(), 2u);
    EXPECT_EQ(adb.calls[0], "shell R52N30 settings put system accelerometer_rotation 0");
    EXPECT_EQ(adb.calls[1], "shell R52N30 settings put system user_rotation 1");
}

TEST(AdbDeviceManagerTest, SetRotationRejectsOutOfRange) {
    FakeTransport adb;
    AdbDeviceManager mgr(adb);

    EXPECT_TRUE(mgr.setRotation("R52N30", 4).is_err());
    EXPECT_TRUE(adb.calls.empty());
}

TEST(AdbDeviceManagerTest, SettingsPutWithOutputIsFailure) {
    FakeTransport adb;
    adb.on("shell R52N30 settings put system accelerometer_rotation 1",
           "Permission denial: writing to settings requires android.permission.WRITE_SETTINGS");
    AdbDeviceManager mgr(adb);

    auto r = mgr.setAutoRotate("R52N30", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::TransportFailure);
}

TEST(AdbDeviceManagerTest, GetRotationAndAutoRotate) {
    FakeTransport adb;
    adb.on("shell R52N30 settings get system user_rotation", "2\n");
    adb.on("shell R52N30 settings get system accelerometer_rotation", "1\n");
    AdbDeviceManager mgr(adb);

    EXPECT_EQ(mgr.getRotation("R52N30").value(), 2);
    EXPECT_TRUE(mgr.getAutoRotate("R52N30").value());
}

TEST(AdbDeviceManagerTest, UnsetRotationReadsAsNatural) {
    FakeTransport adb;
    adb.on("shell R52N30 settings get system user_rotation", "null\n");
    AdbDeviceManager mgr(adb);

    EXPECT_EQ(mgr.getRotation("R52N30").value(), 0);
}

TEST(AdbDeviceManagerTest, InstalledLaunchers) {
    FakeTransport adb;
    adb.default_reply = Ok(std::string("com.onepeloton.callisto/.HomeActivity\n"
                                       "com.android.launcher3/.Launcher\n"));
    AdbDeviceManager mgr(adb);

    auto r = mgr.getInstalledLaunchers("R52N30");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), (std::vector<std::string>{"com.onepeloton.callisto",
                                                   "com.android.launcher3"}));
}

TEST(AdbDeviceManagerTest, OpenAppSettingsReportsActivityError) {
    FakeTransport adb;
    adb.default_reply = Ok(std::string("Error: Activity not started, unable to resolve Intent"));
    AdbDeviceManager mgr(adb);

    EXPECT_TRUE(mgr.openAppSettings("R52N30", "com.example").is_err());
}
