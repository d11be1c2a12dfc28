// =============================================================================
// Unit tests for Installer (src/installer.hpp)
// Tests: conflict resolution, batch reports, uninstall escalation, GitHub
// release resolution, package filtering
// =============================================================================
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "installer.hpp"
#include "fake_transport.hpp"

using namespace pelo;
using pelo::fakes::FakeHttpClient;
using pelo::fakes::FakeTransport;

namespace fs = std::filesystem;

namespace {

const char* CONFLICT =
    "adb: failed to install app.apk: Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE: "
    "Package com.spotify.music signatures do not match newer version; ignoring!]";

CatalogEntry entry(const std::string& name, const std::string& url,
                   std::optional<std::string> package = std::nullopt) {
    CatalogEntry e;
    e.name = name;
    e.url = url;
    e.package = std::move(package);
    return e;
}

} // namespace

class InstallerTest : public ::testing::Test {
protected:
    FakeTransport adb;
    AdbDeviceManager devices{adb};
    FakeHttpClient http;
    fs::path temp = fs::temp_directory_path() / "pelobridge_installer_test";
    std::unique_ptr<Installer> installer;
    int confirmations = 0;
    ConfirmReinstall yes = [this](const std::string&) { confirmations++; return true; };
    ConfirmReinstall no = [this](const std::string&) { confirmations++; return false; };

    void SetUp() override {
        fs::create_directories(temp);
        installer = std::make_unique<Installer>(adb, devices, http, temp.string());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp, ec);
    }
};

// ---------------------------------------------------------------------------
// Conflict resolution
// ---------------------------------------------------------------------------
TEST_F(InstallerTest, CleanInstallSucceeds) {
    adb.on("install R52N30", "Performing Streamed Install\nSuccess\n");
    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk",
                                                     std::string("com.spotify.music")), yes);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(confirmations, 0);
    EXPECT_EQ(adb.count("uninstall"), 0u);
}

TEST_F(InstallerTest, ConflictUninstallsOnceAndRetriesOnce) {
    adb.fail("install R52N30", CONFLICT);
    adb.on("uninstall R52N30 com.spotify.music", "Success");
    adb.on("install R52N30", "Success");

    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), yes);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(confirmations, 1);
    EXPECT_EQ(adb.count("install R52N30"), 2u);
    EXPECT_EQ(adb.count("uninstall R52N30 com.spotify.music"), 1u);
}

TEST_F(InstallerTest, RepeatedConflictIsNotRetriedAgain) {
    adb.fail("install R52N30", CONFLICT);
    adb.fail("install R52N30", CONFLICT);
    adb.fail("install R52N30", CONFLICT);

    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), yes);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InstallFailure);
    EXPECT_EQ(adb.count("install R52N30"), 2u);
    EXPECT_EQ(adb.count("uninstall"), 1u);
    EXPECT_EQ(confirmations, 1);
}

TEST_F(InstallerTest, DeclinedReinstallLeavesDeviceAlone) {
    adb.fail("install R52N30", CONFLICT);

    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), no);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InstallConflict);
    EXPECT_NE(r.error().output.find("INSTALL_FAILED_UPDATE_INCOMPATIBLE"), std::string::npos);
    EXPECT_EQ(confirmations, 1);
    EXPECT_EQ(adb.count("uninstall"), 0u);
    EXPECT_EQ(adb.count("install R52N30"), 1u);
}

TEST_F(InstallerTest, ConflictWithUnknownPackageIsInstallConflict) {
    adb.fail("install R52N30", "Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE]");

    auto r = installer->installEntry("R52N30", entry("Nova Launcher", "https://example.com/n.apk"), yes);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InstallConflict);
    EXPECT_EQ(r.error().output, "Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE]");
    EXPECT_EQ(confirmations, 0);
    EXPECT_EQ(adb.count("uninstall"), 0u);
}

TEST_F(InstallerTest, AdbThatCannotRunIsTransportFailure) {
    adb.fail("install R52N30");

    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), yes);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::TransportFailure);
    EXPECT_EQ(adb.count("install R52N30"), 1u);
    EXPECT_EQ(confirmations, 0);
}

TEST_F(InstallerTest, FailedUninstallStillRetriesOnce) {
    adb.fail("install R52N30", CONFLICT);
    adb.on("uninstall R52N30 com.spotify.music", "Failure [DELETE_FAILED_INTERNAL_ERROR]");
    adb.on("install R52N30", "Success");

    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), yes);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(adb.count("install R52N30"), 2u);
}

TEST_F(InstallerTest, PackageHintUsedWhenOutputNamesNone) {
    adb.fail("install R52N30", "Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE]");
    adb.on("install R52N30", "Success");

    auto r = installer->installEntry(
        "R52N30", entry("Netflix", "https://example.com/n.apk", std::string("com.netflix.mediaclient")), yes);
    EXPECT_TRUE(r.is_ok());
    EXPECT_TRUE(adb.called("uninstall R52N30 com.netflix.mediaclient"));
}

TEST_F(InstallerTest, TempFileExistsDuringInstallAndIsRemovedAfter) {
    adb.on("install R52N30", "Success");
    ASSERT_TRUE(installer->installEntry("R52N30", entry("Nova Launcher", "https://example.com/n"), yes).is_ok());

    ASSERT_EQ(adb.installed_paths.size(), 1u);
    EXPECT_EQ(fs::path(adb.installed_paths[0]).filename().string(), "Nova_Launcher.apk");
    EXPECT_TRUE(adb.install_saw_file[0]);
    EXPECT_FALSE(fs::exists(adb.installed_paths[0]));
}

TEST_F(InstallerTest, DownloadFailureSkipsInstall) {
    http.fail_downloads = true;
    auto r = installer->installEntry("R52N30", entry("Spotify", "https://example.com/s.apk"), yes);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::DownloadFailure);
    EXPECT_EQ(adb.count("install"), 0u);
}

// ---------------------------------------------------------------------------
// Batches
// ---------------------------------------------------------------------------
TEST_F(InstallerTest, BatchContinuesPastFailures) {
    adb.on("install R52N30", "Failure [INSTALL_FAILED_INSUFFICIENT_STORAGE]");
    adb.on("install R52N30", "Success");

    auto report = installer->installEntries(
        "R52N30",
        {entry("A", "https://example.com/a.apk"), entry("B", "https://example.com/b.apk")}, yes);
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_FALSE(report.outcomes[0].success);
    EXPECT_EQ(report.outcomes[0].error, ErrorKind::InstallFailure);
    EXPECT_TRUE(report.outcomes[1].success);
    EXPECT_EQ(report.succeeded(), 1u);
    EXPECT_EQ(report.failed(), 1u);
}

TEST_F(InstallerTest, LocalApkMissingFile) {
    auto r = installer->installLocalApk("R52N30", (temp / "nope.apk").string(), yes);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InstallFailure);
    EXPECT_TRUE(adb.calls.empty());
}

TEST_F(InstallerTest, LocalApkUnstatablePathIsReportedNotThrown) {
    // Component longer than NAME_MAX makes stat() fail with ENAMETOOLONG
    auto apk = temp / (std::string(300, 'a') + ".apk");
    Result<void> r = Ok();
    EXPECT_NO_THROW(r = installer->installLocalApk("R52N30", apk.string(), yes));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InstallFailure);
    EXPECT_TRUE(adb.calls.empty());
}

TEST_F(InstallerTest, LocalApkInstall) {
    auto apk = temp / "custom.apk";
    std::ofstream(apk.string()) << "PK";
    adb.on("install R52N30", "Success");

    EXPECT_TRUE(installer->installLocalApk("R52N30", apk.string(), yes).is_ok());
    EXPECT_TRUE(fs::exists(apk));
}

// ---------------------------------------------------------------------------
// Uninstall
// ---------------------------------------------------------------------------
TEST_F(InstallerTest, UninstallBatchEscalatesToUserZero) {
    adb.on("uninstall R52N30 com.a", "Success");
    adb.fail("uninstall R52N30 com.b", "Failure [DELETE_FAILED_INTERNAL_ERROR]");
    adb.on("uninstall-user0 R52N30 com.b", "Success");

    auto tally = installer->uninstallBatch("R52N30", {"com.a", "com.b"});
    EXPECT_EQ(tally.success, 2);
    EXPECT_EQ(tally.fail, 0);
    EXPECT_EQ(adb.count("uninstall-user0"), 1u);
}

TEST_F(InstallerTest, UninstallBatchCountsFailures) {
    adb.default_reply = Ok(std::string("Failure [not installed for 0]"));
    auto tally = installer->uninstallBatch("R52N30", {"com.a"});
    EXPECT_EQ(tally.success, 0);
    EXPECT_EQ(tally.fail, 1);
}

TEST(InstallerStaticTest, FilterPelotonPackages) {
    auto picked = Installer::filterPelotonPackages({
        "com.onepeloton.callisto", "com.android.settings", "com.onepeloton.affernetservice",
        "com.onepeloton.inputservice", "com.onepeloton.SensorData", "com.Peloton.Aaa"});
    EXPECT_EQ(picked, (std::vector<std::string>{"com.Peloton.Aaa", "com.onepeloton.callisto"}));
}

TEST_F(InstallerTest, FindPelotonPackages) {
    adb.on("shell R52N30 pm list packages",
           "package:com.onepeloton.callisto\npackage:com.android.settings\n");
    auto r = installer->findPelotonPackages("R52N30");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), (std::vector<std::string>{"com.onepeloton.callisto"}));
}

// ---------------------------------------------------------------------------
// URL resolution
// ---------------------------------------------------------------------------
TEST(InstallerStaticTest, GithubApiUrl) {
    EXPECT_EQ(Installer::githubApiUrl("https://github.com/owner/repo/releases/latest").value(),
              "https://api.github.com/repos/owner/repo/releases/latest");
    EXPECT_EQ(Installer::githubApiUrl("https://github.com/owner/repo/releases/tag/v2.1").value(),
              "https://api.github.com/repos/owner/repo/releases/tags/v2.1");
    EXPECT_FALSE(Installer::githubApiUrl("https://github.com/owner/repo").has_value());
    EXPECT_FALSE(Installer::githubApiUrl("https://example.com/owner/repo/releases/latest").has_value());
}

TEST(InstallerStaticTest, PickReleaseAsset) {
    const char* body = R"({"assets": [
        {"name": "notes.txt",     "browser_download_url": "https://dl/notes.txt"},
        {"name": "app-arm64.APK", "browser_download_url": "https://dl/app-arm64.apk"},
        {"name": "com.example",   "browser_download_url": "https://dl/exact"}
    ]})";
    EXPECT_EQ(Installer::pickReleaseAsset(body, std::string("com.example")).value(), "https://dl/exact");
    EXPECT_EQ(Installer::pickReleaseAsset(body, std::nullopt).value(), "https://dl/app-arm64.apk");
    EXPECT_EQ(Installer::pickReleaseAsset(R"({"assets": [{"name": "a.zip", "browser_download_url": "https://dl/a.zip"}]})",
                                          std::nullopt).value(),
              "https://dl/a.zip");
    EXPECT_FALSE(Installer::pickReleaseAsset(R"({"assets": []})", std::nullopt).has_value());
    EXPECT_FALSE(Installer::pickReleaseAsset("not json", std::nullopt).has_value());
}

TEST_F(InstallerTest, ResolveGithubLatestRelease) {
    http.page("https://api.github.com/repos/o/r/releases/latest", 200,
              R"({"assets": [{"name": "r.apk", "browser_download_url": "https://dl/r.apk"}]})");

    EXPECT_EQ(installer->resolveDownloadUrl("https://github.com/o/r/releases/latest", std::nullopt),
              "https://dl/r.apk");
    ASSERT_EQ(http.last_headers.size(), 2u);
    EXPECT_EQ(http.last_headers[0].second, Installer::GITHUB_API_USER_AGENT);
    EXPECT_EQ(http.last_headers[1].second, Installer::GITHUB_API_ACCEPT);
}

TEST_F(InstallerTest, ResolveFallsBackToOriginalUrl) {
    EXPECT_EQ(installer->resolveDownloadUrl("https://github.com/o/r/releases/latest", std::nullopt),
              "https://github.com/o/r/releases/latest");

    http.page("https://api.github.com/repos/o/r/releases/latest", 403, "rate limited");
    EXPECT_EQ(installer->resolveDownloadUrl("https://github.com/o/r/releases/latest", std::nullopt),
              "https://github.com/o/r/releases/latest");

    EXPECT_EQ(installer->resolveDownloadUrl("https://example.com/a.apk", std::nullopt),
              "https://example.com/a.apk");
    EXPECT_EQ(http.requested.size(), 2u);
}

TEST(InstallerStaticTest, TempFileName) {
    EXPECT_EQ(Installer::tempFileName(entry("Spotify", "u", std::string("com.spotify.music"))),
              "com.spotify.music.apk");
    EXPECT_EQ(Installer::tempFileName(entry("Nova Launcher", "u")), "Nova_Launcher.apk");
    EXPECT_EQ(Installer::tempFileName(entry("x", "u", std::string("pkg.APK"))), "pkg.APK");
}
