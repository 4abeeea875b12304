#include "adb_client.hpp"
#include "formatting.hpp"
#include <regex>
#include <sstream>
#include <utility>
#include <fmt/format.h>

std::vector<DeviceEntry> parseDeviceList(const std::string& output) {
    std::vector<DeviceEntry> devices;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty() || line.starts_with("List of devices attached") || line.starts_with("*")) {
            continue;
        }
        std::istringstream fields(line);
        DeviceEntry entry;
        fields >> entry.serial >> entry.state;
        if (!entry.serial.empty()) {
            devices.push_back(entry);
        }
    }
    return devices;
}

std::expected<std::string, std::string> parseAdbVersion(const std::string& output) {
    static const std::regex versionPattern(R"(Version (\d+\.\d+\.\d+))");
    std::smatch match;
    if (!std::regex_search(output, match, versionPattern)) {
        return std::unexpected("adb did not report a version");
    }
    return match[1].str();
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

AdbClient::AdbClient(std::string adbPath, std::chrono::seconds timeout)
    : adbPath(std::move(adbPath)), timeout(timeout) {}

std::expected<CommandResult, std::string> AdbClient::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{adbPath};
    argv.insert(argv.end(), args.begin(), args.end());
    return runCommand(argv, timeout);
}

std::expected<std::string, std::string> AdbClient::checkVersion() const {
    auto result = run({"version"});
    if (!result) {
        return std::unexpected(fmt::format("Error checking ADB version: {}", result.error()));
    }
    if (result->exitCode != 0) {
        return std::unexpected(fmt::format("Error checking ADB version: adb exited with status {}", result->exitCode));
    }
    return parseAdbVersion(result->output);
}

std::expected<std::vector<DeviceEntry>, std::string> AdbClient::listDevices() const {
    auto result = run({"devices"});
    if (!result) {
        return std::unexpected(fmt::format("Error detecting Android device: {}", result.error()));
    }
    auto devices = parseDeviceList(result->output);
    if (!devices.empty()) {
        return devices;
    }

    fmt::print("No devices found. Restarting ADB server...\n");
    for (const char* command : {"kill-server", "start-server"}) {
        auto restart = run({command});
        if (!restart) {
            return std::unexpected(fmt::format("Failed to run adb {}: {}", command, restart.error()));
        }
    }

    result = run({"devices"});
    if (!result) {
        return std::unexpected(fmt::format("Error detecting Android device: {}", result.error()));
    }
    return parseDeviceList(result->output);
}

std::expected<void, std::string> AdbClient::checkDeviceState(const std::string& serial) const {
    auto result = run({"-s", serial, "get-state"});
    if (!result) {
        return std::unexpected(fmt::format("Error checking device compatibility: {}", result.error()));
    }
    if (toLower(result->output).find("device") == std::string::npos) {
        return std::unexpected(fmt::format("Device is not in proper state: {}", trim(result->output)));
    }
    return {};
}

std::string AdbClient::getProp(const std::string& serial, const std::string& property) const {
    auto result = run({"-s", serial, "shell", "getprop " + property});
    if (!result || result->exitCode != 0) {
        return "Unknown";
    }
    std::string value = trim(result->output);
    return value.empty() ? "Unknown" : value;
}

DeviceInfo AdbClient::deviceInfo(const std::string& serial) const {
    DeviceInfo info;
    info.manufacturer = getProp(serial, "ro.product.manufacturer");
    info.model = getProp(serial, "ro.product.model");
    info.androidVersion = getProp(serial, "ro.build.version.release");
    info.buildNumber = getProp(serial, "ro.build.display.id");
    info.serial = serial;
    return info;
}

std::expected<std::vector<std::string>, std::string> AdbClient::listFolders(const std::string& serial,
                                                                            const std::string& root,
                                                                            const std::string& restricted) const {
    auto result = run({"-s", serial, "shell", "ls -1 " + shellQuote(root)});
    if (!result) {
        return std::unexpected(fmt::format("Error listing folders: {}", result.error()));
    }
    std::vector<std::string> folders;
    std::istringstream lines(result->output);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty() || line.starts_with('.') || (!restricted.empty() && line.starts_with(restricted))) {
            continue;
        }
        folders.push_back(line);
    }
    return folders;
}

AdbPathProbe::AdbPathProbe(std::string adbPath, std::chrono::seconds timeout)
    : adbPath(std::move(adbPath)), timeout(timeout) {}

bool AdbPathProbe::exists(const std::string& deviceId, const std::string& path) {
    auto result = runCommand({adbPath, "-s", deviceId, "shell", "test -d " + shellQuote(path) + " && echo exists"},
                             timeout);
    return result && result->output.find("exists") != std::string::npos;
}

AdbPullProcess::AdbPullProcess(ChildProcess child, std::chrono::milliseconds terminateGrace)
    : child(std::move(child)), terminateGrace(terminateGrace) {}

bool AdbPullProcess::isRunning() {
    return child.isRunning();
}

void AdbPullProcess::terminate() {
    child.terminate(terminateGrace);
}

std::unique_ptr<LineSource> AdbPullProcess::takeDiagnostics() {
    int fd = child.takeStderr();
    if (fd < 0) {
        return nullptr;
    }
    return std::make_unique<FdLineSource>(fd);
}

std::optional<int> AdbPullProcess::exitCode() const {
    return child.exitCode();
}

AdbPullLauncher::AdbPullLauncher(std::string adbPath, std::chrono::milliseconds terminateGrace)
    : adbPath(std::move(adbPath)), terminateGrace(terminateGrace) {}

std::expected<std::unique_ptr<TransferProcess>, std::string> AdbPullLauncher::launch(const std::string& deviceId,
                                                                                     const std::string& sourcePath,
                                                                                     const std::filesystem::path& destinationPath) {
    SpawnOptions options;
    options.captureStderr = true;
    auto child = ChildProcess::spawn({adbPath, "-s", deviceId, "pull", sourcePath, destinationPath.string()}, options);
    if (!child) {
        return std::unexpected(child.error());
    }
    return std::make_unique<AdbPullProcess>(std::move(*child), terminateGrace);
}
