/**
 * @file adb_client.hpp
 * @brief Android Debug Bridge access for device discovery, probing and copying.
 *
 * Every call runs the adb executable named in the configuration; nothing is looked up
 * from process-wide state.
 *
 * @note Requires adb (Android platform-tools). USB debugging must be enabled on the device.
 */

#ifndef ADB_CLIENT_HPP
#define ADB_CLIENT_HPP

#include <string>
#include <vector>
#include <chrono>
#include <expected>
#include "subprocess.hpp"
#include "transfer_monitor.hpp"

/**
 * @brief One entry of "adb devices".
 */
struct DeviceEntry {
    std::string serial; ///< Device serial.
    std::string state;  ///< "device", "unauthorized", "offline", ...
};

/**
 * @brief Descriptive properties of a device; "Unknown" when a query fails.
 */
struct DeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string androidVersion;
    std::string buildNumber;
    std::string serial;
};

/**
 * @brief Parses the output of "adb devices".
 *
 * Skips the header, blank lines and daemon chatter ("* daemon ...").
 */
std::vector<DeviceEntry> parseDeviceList(const std::string& output);

/**
 * @brief Extracts "X.Y.Z" from the output of "adb version".
 *
 * @return std::expected<std::string, std::string> The version or an error when none is found.
 */
std::expected<std::string, std::string> parseAdbVersion(const std::string& output);

/**
 * @brief Quotes a string for the device shell.
 */
std::string shellQuote(const std::string& value);

/**
 * @brief Thin wrapper over the adb command line.
 */
class AdbClient {
public:
    /**
     * @brief Constructs a client.
     *
     * @param adbPath adb executable, looked up in PATH when not absolute.
     * @param timeout Deadline of each query.
     */
    AdbClient(std::string adbPath, std::chrono::seconds timeout);

    /**
     * @brief Checks that adb runs and reports a version.
     *
     * @return std::expected<std::string, std::string> Version string or an error message.
     */
    std::expected<std::string, std::string> checkVersion() const;

    /**
     * @brief Lists attached devices.
     *
     * When none are attached the adb server is restarted once and the list is queried again.
     *
     * @return std::expected<std::vector<DeviceEntry>, std::string> Devices (possibly empty) or an error message.
     */
    std::expected<std::vector<DeviceEntry>, std::string> listDevices() const;

    /**
     * @brief Confirms the device is in the "device" state.
     */
    std::expected<void, std::string> checkDeviceState(const std::string& serial) const;

    /**
     * @brief Reads a system property; "Unknown" on failure.
     */
    std::string getProp(const std::string& serial, const std::string& property) const;

    /**
     * @brief Collects manufacturer, model, Android version and build number.
     */
    DeviceInfo deviceInfo(const std::string& serial) const;

    /**
     * @brief Lists the folders of a device directory available for partial backups.
     *
     * Hidden entries and entries starting with the restricted folder name are left out.
     *
     * @param serial Device serial.
     * @param root Directory on the device, e.g. "/sdcard".
     * @param restricted Restricted folder name, e.g. "Android".
     * @return std::expected<std::vector<std::string>, std::string> Folder names or an error message.
     */
    std::expected<std::vector<std::string>, std::string> listFolders(const std::string& serial,
                                                                     const std::string& root,
                                                                     const std::string& restricted) const;

    const std::string& path() const { return adbPath; }

private:
    std::expected<CommandResult, std::string> run(const std::vector<std::string>& args) const;

    std::string adbPath;
    std::chrono::seconds timeout;
};

/**
 * @brief PathProbe running "test -d" on the device through adb shell.
 */
class AdbPathProbe : public PathProbe {
public:
    /**
     * @param adbPath adb executable.
     * @param timeout Probe deadline; a timeout counts as "does not exist".
     */
    AdbPathProbe(std::string adbPath, std::chrono::seconds timeout);

    bool exists(const std::string& deviceId, const std::string& path) override;

private:
    std::string adbPath;
    std::chrono::seconds timeout;
};

/**
 * @brief TransferProcess wrapping a running "adb pull".
 */
class AdbPullProcess : public TransferProcess {
public:
    AdbPullProcess(ChildProcess child, std::chrono::milliseconds terminateGrace);

    bool isRunning() override;
    void terminate() override;
    std::unique_ptr<LineSource> takeDiagnostics() override;
    std::optional<int> exitCode() const override;

private:
    ChildProcess child;
    std::chrono::milliseconds terminateGrace;
};

/**
 * @brief TransferLauncher starting "adb -s <serial> pull <source> <destination>".
 *
 * stderr is captured as the diagnostic stream; stdout is discarded.
 */
class AdbPullLauncher : public TransferLauncher {
public:
    AdbPullLauncher(std::string adbPath, std::chrono::milliseconds terminateGrace);

    std::expected<std::unique_ptr<TransferProcess>, std::string> launch(const std::string& deviceId,
                                                                        const std::string& sourcePath,
                                                                        const std::filesystem::path& destinationPath) override;

private:
    std::string adbPath;
    std::chrono::milliseconds terminateGrace;
};

#endif // ADB_CLIENT_HPP
