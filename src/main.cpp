// =============================================================================
// PeloBridge - Command-line front end
// =============================================================================
// pelobridge [--config path] [--device serial] [--yes] [--verbose] <command> [args]
// =============================================================================

#include "bridge_controller.hpp"
#include "config_loader.hpp"
#include "pelo_log.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace pelo;

namespace {

struct CliOptions {
    std::string config_path = "config.json";
    std::optional<std::string> device;
    bool assume_yes = false;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

void printUsage() {
    std::printf(
        "Usage: pelobridge [--config path] [--device serial] [--yes] [--verbose] <command>\n"
        "\n"
        "Devices:\n"
        "  devices                      list connected devices\n"
        "  watch                        follow device changes until Enter\n"
        "Apps:\n"
        "  apps                         catalog for the active device\n"
        "  install <name>... | --all    download and install catalog apps\n"
        "  install-apk <file.apk>       install a local APK\n"
        "  packages                     list installed Peloton packages\n"
        "  uninstall <pkg>... | --peloton\n"
        "Wireless:\n"
        "  scan [--port N]              discover wireless debugging endpoints\n"
        "  connect <ip> [--port N] [--pair-port N --code C]\n"
        "  pair <code> [--ip IP] [--port N]  pair a discovered device and connect\n"
        "  handoff                      move the active USB device to WiFi\n"
        "  toggles                      enable wireless debugging + stay awake\n"
        "Media:\n"
        "  screenshot                   save a screenshot\n"
        "  record                       record the screen until Enter\n"
        "Tools:\n"
        "  rotation [0-3]               show or set the display rotation\n"
        "  autorotate [on|off]          show or set auto-rotate\n"
        "  launchers                    installed home-screen apps\n"
        "  app-settings <pkg>           open the app info screen on the device\n"
        "  guide usb|wireless           print a setup guide\n"
        "  update                       check for a newer PeloBridge\n");
}

std::optional<CliOptions> parseArgs(int argc, char** argv) {
    CliOptions opt;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) opt.config_path = argv[++i];
        else if (a == "--device" && i + 1 < argc) opt.device = argv[++i];
        else if (a == "--yes" || a == "-y") opt.assume_yes = true;
        else if (a == "--verbose" || a == "-v") opt.verbose = true;
        else if (a == "--help" || a == "-h") return std::nullopt;
        else break;
    }
    if (i >= argc) return std::nullopt;
    opt.command = argv[i++];
    for (; i < argc; ++i) opt.args.push_back(argv[i]);
    return opt;
}

std::optional<int> parseInt(const std::string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "--name value" from args; value removed from args
std::optional<std::string> takeOption(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            std::string v = args[i + 1];
            args.erase(args.begin() + (long)i, args.begin() + (long)i + 2);
            return v;
        }
    }
    return std::nullopt;
}

bool takeFlag(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == name) {
            args.erase(args.begin() + (long)i);
            return true;
        }
    }
    return false;
}

void waitForEnter(const char* prompt) {
    std::printf("%s", prompt);
    std::fflush(stdout);
    std::string line;
    std::getline(std::cin, line);
}

int fail(const Error& e) {
    std::fprintf(stderr, "error: %s (%s)\n", e.message.c_str(), errorKindName(e.kind));
    return 1;
}

// =============================================================================
// Commands
// =============================================================================

int cmdDevices(BridgeController& app) {
    auto active = app.registry().activeDevice();
    for (const auto& d : app.registry().devices()) {
        bool is_active = active && active->serial == d.serial;
        std::printf("%s %-24s %-5s %-14s %s\n", is_active ? "*" : " ", d.serial.c_str(),
                    transportName(d.transport), d.abi.value_or("?").c_str(),
                    d.name.value_or("").c_str());
    }
    std::printf("%s\n", app.registry().status().c_str());
    return app.registry().devices().empty() ? 1 : 0;
}

int cmdApps(BridgeController& app) {
    auto entries = app.registry().catalog();
    if (entries.empty()) {
        std::printf("No apps available for this device\n");
        return 1;
    }
    for (const auto& e : entries) {
        std::printf("%-28s %s\n", e.name.c_str(), e.description.c_str());
    }
    return 0;
}

int cmdInstall(BridgeController& app, std::vector<std::string> args, const ConfirmReinstall& confirm) {
    if (takeFlag(args, "--all")) {
        app.registry().setAllSelected(true);
    } else if (args.empty()) {
        std::fprintf(stderr, "install: name the apps to install, or --all\n");
        return 2;
    }
    for (const auto& name : args) {
        if (!app.registry().setEntrySelected(name, true)) {
            std::fprintf(stderr, "install: '%s' is not in the catalog for this device\n", name.c_str());
            return 2;
        }
    }
    auto report = app.installSelected(confirm);
    if (report.is_err()) return fail(report.error());
    for (const auto& o : report.value().outcomes) {
        std::printf("%-28s %s\n", o.name.c_str(),
                    o.success ? "installed" : (std::string(errorKindName(o.error)) + ": " + o.message).c_str());
    }
    return report.value().failed() == 0 ? 0 : 1;
}

int cmdUninstall(BridgeController& app, std::vector<std::string> args) {
    if (takeFlag(args, "--peloton")) {
        auto found = app.scanPelotonPackages();
        if (found.is_err()) return fail(found.error());
        args.insert(args.end(), found.value().begin(), found.value().end());
    }
    if (args.empty()) {
        std::printf("Nothing to uninstall\n");
        return 0;
    }
    auto tally = app.uninstallPackages(args);
    if (tally.is_err()) return fail(tally.error());
    std::printf("%d succeeded, %d failed\n", tally.value().success, tally.value().fail);
    return tally.value().fail == 0 ? 0 : 1;
}

int cmdScan(BridgeController& app, std::vector<std::string> args) {
    std::optional<int> port;
    if (auto p = takeOption(args, "--port")) {
        port = parseInt(*p);
        if (!port) {
            std::fprintf(stderr, "scan: bad port '%s'\n", p->c_str());
            return 2;
        }
    }
    auto found = app.scanWireless(port);
    if (found.is_err()) return fail(found.error());
    for (const auto& c : found.value()) {
        std::printf("%-16s pair=%-6s connect=%-6s %s\n", c.ip.c_str(),
                    c.pairing_port ? std::to_string(*c.pairing_port).c_str() : "-",
                    c.connect_port ? std::to_string(*c.connect_port).c_str() : "-",
                    c.name.c_str());
    }
    return found.value().empty() ? 1 : 0;
}

int cmdConnect(BridgeController& app, std::vector<std::string> args) {
    auto port_arg = takeOption(args, "--port");
    auto pair_arg = takeOption(args, "--pair-port");
    std::string code = takeOption(args, "--code").value_or("");
    if (args.size() != 1) {
        std::fprintf(stderr, "connect: expected one IP address\n");
        return 2;
    }
    std::optional<int> port = port_arg ? parseInt(*port_arg) : std::nullopt;
    std::optional<int> pair_port = pair_arg ? parseInt(*pair_arg) : std::nullopt;
    if ((port_arg && !port) || (pair_arg && !pair_port)) {
        std::fprintf(stderr, "connect: bad port\n");
        return 2;
    }
    auto r = app.pairAndConnect(args[0], pair_port, code, port);
    if (r.is_err()) return fail(r.error());
    std::printf("%s\n", app.registry().status().c_str());
    return 0;
}

int cmdPair(BridgeController& app, std::vector<std::string> args) {
    auto ip = takeOption(args, "--ip");
    auto port_arg = takeOption(args, "--port");
    if (args.size() != 1) {
        std::fprintf(stderr, "pair: expected the pairing code shown on the device\n");
        return 2;
    }
    std::optional<int> port = port_arg ? parseInt(*port_arg) : std::nullopt;
    if (port_arg && !port) {
        std::fprintf(stderr, "pair: bad port '%s'\n", port_arg->c_str());
        return 2;
    }
    auto r = app.pairDiscovered(args[0], ip, port);
    if (r.is_err()) return fail(r.error());
    std::printf("Connected to %s\n", r.value().c_str());
    return 0;
}

int cmdRotation(BridgeController& app, const std::vector<std::string>& args) {
    if (args.empty()) {
        auto r = app.getRotation();
        if (r.is_err()) return fail(r.error());
        std::printf("%d (%d°)\n", r.value(), r.value() * 90);
        return 0;
    }
    auto value = parseInt(args[0]);
    if (!value) {
        std::fprintf(stderr, "rotation: expected 0-3\n");
        return 2;
    }
    auto r = app.setRotation(*value);
    return r.is_err() ? fail(r.error()) : 0;
}

int cmdAutoRotate(BridgeController& app, const std::vector<std::string>& args) {
    if (args.empty()) {
        auto r = app.getAutoRotate();
        if (r.is_err()) return fail(r.error());
        std::printf("%s\n", r.value() ? "on" : "off");
        return 0;
    }
    if (args[0] != "on" && args[0] != "off") {
        std::fprintf(stderr, "autorotate: expected on or off\n");
        return 2;
    }
    auto r = app.setAutoRotate(args[0] == "on");
    return r.is_err() ? fail(r.error()) : 0;
}

int cmdGuide(BridgeController& app, const std::vector<std::string>& args) {
    std::string which = args.empty() ? "usb" : args[0];
    std::string file = which == "wireless" ? "wireless_adb_steps.json" : "usb_debug_steps.json";
    auto steps = app.loadGuide(file);
    if (steps.is_err()) return fail(steps.error());
    int n = 1;
    for (const auto& s : steps.value()) {
        std::printf("%d. %s\n   %s\n", n++, s.title.c_str(), s.description.c_str());
    }
    return 0;
}

int dispatch(BridgeController& app, const CliOptions& opt) {
    const std::string& cmd = opt.command;
    std::vector<std::string> args = opt.args;

    ConfirmReinstall confirm = [&opt](const std::string& name) {
        if (opt.assume_yes) return true;
        std::printf("The installed version of '%s' is not compatible with this update.\n"
                    "Uninstall the old version and install the new one? [y/N] ", name.c_str());
        std::fflush(stdout);
        std::string answer;
        std::getline(std::cin, answer);
        return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
    };

    if (cmd == "devices") return cmdDevices(app);
    if (cmd == "watch") {
        waitForEnter("Watching for device changes, press Enter to stop\n");
        return 0;
    }
    if (cmd == "apps") return cmdApps(app);
    if (cmd == "install") return cmdInstall(app, args, confirm);
    if (cmd == "install-apk") {
        if (args.size() != 1) { std::fprintf(stderr, "install-apk: expected one file\n"); return 2; }
        auto r = app.installLocalApk(args[0], confirm);
        return r.is_err() ? fail(r.error()) : 0;
    }
    if (cmd == "packages") {
        auto r = app.scanPelotonPackages();
        if (r.is_err()) return fail(r.error());
        for (const auto& p : r.value()) std::printf("%s\n", p.c_str());
        return 0;
    }
    if (cmd == "uninstall") return cmdUninstall(app, args);
    if (cmd == "scan") return cmdScan(app, args);
    if (cmd == "connect") return cmdConnect(app, args);
    if (cmd == "pair") return cmdPair(app, args);
    if (cmd == "handoff") {
        auto r = app.handoffToWireless();
        if (r.is_err()) return fail(r.error());
        std::printf("Connected to %s\n", r.value().c_str());
        return 0;
    }
    if (cmd == "toggles") {
        auto r = app.applyDeveloperToggles();
        if (r.is_err()) return fail(r.error());
        int failed = 0;
        for (const auto& t : r.value()) {
            std::printf("%-28s %s\n", t.first.c_str(), t.second ? "ok" : "failed");
            if (!t.second) ++failed;
        }
        return failed == 0 ? 0 : 1;
    }
    if (cmd == "screenshot") {
        auto r = app.takeScreenshot();
        if (r.is_err()) return fail(r.error());
        std::printf("%s\n", r.value().c_str());
        return 0;
    }
    if (cmd == "record") {
        auto started = app.startRecording();
        if (started.is_err()) return fail(started.error());
        waitForEnter("Recording, press Enter to stop\n");
        auto saved = app.stopRecording();
        if (saved.is_err()) return fail(saved.error());
        std::printf("%s\n", saved.value().c_str());
        return 0;
    }
    if (cmd == "rotation") return cmdRotation(app, args);
    if (cmd == "autorotate") return cmdAutoRotate(app, args);
    if (cmd == "launchers") {
        auto r = app.getInstalledLaunchers();
        if (r.is_err()) return fail(r.error());
        for (const auto& p : r.value()) std::printf("%s\n", p.c_str());
        return 0;
    }
    if (cmd == "app-settings") {
        if (args.size() != 1) { std::fprintf(stderr, "app-settings: expected a package\n"); return 2; }
        auto r = app.openAppSettings(args[0]);
        return r.is_err() ? fail(r.error()) : 0;
    }
    if (cmd == "guide") return cmdGuide(app, args);
    if (cmd == "update") {
        auto r = app.checkForUpdates();
        if (r.is_err()) return fail(r.error());
        std::printf("current %s, latest %s%s\n", r.value().current.c_str(), r.value().latest.c_str(),
                    r.value().available ? " (update available)" : "");
        return 0;
    }

    std::fprintf(stderr, "Unknown command: %s\n\n", cmd.c_str());
    printUsage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    auto opt = parseArgs(argc, argv);
    if (!opt) {
        printUsage();
        return 2;
    }

    config::AppConfig cfg = config::loadConfig(opt->config_path);
    pelo::log::setLogLevel(opt->verbose ? pelo::log::Level::Debug : pelo::log::parseLevel(cfg.log.level));
    pelo::log::setConsoleOutput(opt->verbose);
    if (!cfg.log.log_path.empty() && !pelo::log::openLogFile(cfg.log.log_path.c_str())) {
        std::fprintf(stderr, "warning: cannot open log file %s\n", cfg.log.log_path.c_str());
    }

    int rc = 0;
    {
        BridgeController app(cfg);

        // User-facing log lines; command echo only with --verbose
        auto sub = app.bus().subscribe<LogEvent>([&opt](const LogEvent& e) {
            if (!opt->verbose && (e.category == "command" || e.category == "stdout" ||
                                  e.category == "stderr")) {
                return;
            }
            std::fprintf(e.category == "error" ? stderr : stdout, "%s %s\n",
                         e.timestamp.c_str(), e.message.c_str());
        });

        app.start(opt->command == "watch" || opt->command == "record");
        if (opt->device && !app.selectDevice(*opt->device)) {
            std::fprintf(stderr, "error: device %s is not connected\n", opt->device->c_str());
            rc = 1;
        } else {
            rc = dispatch(app, *opt);
        }
        app.shutdown();
    }

    pelo::log::closeLogFile();
    return rc;
}
