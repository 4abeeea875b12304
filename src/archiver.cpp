#include "archiver.hpp"
#include "formatting.hpp"
#include "progress_reporter.hpp"
#include "size_sampler.hpp"
#include "transfer_monitor.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <system_error>
#include <fmt/format.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDeviceStorageRoot = "/sdcard";
constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

bool interactive() {
    return ::isatty(STDIN_FILENO) != 0;
}

std::optional<std::string> prompt(const std::string& question) {
    fmt::print("{}", question);
    std::fflush(stdout);
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return std::nullopt;
    }
    return trim(answer);
}

std::optional<std::size_t> parseChoice(const std::optional<std::string>& answer, std::size_t count) {
    if (!answer || answer->empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        long value = std::stol(*answer, &consumed);
        if (consumed != answer->size() || value < 1 || static_cast<std::size_t>(value) > count) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value - 1);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

fs::path normalizeDirectory(const fs::path& path) {
    std::error_code ec;
    fs::path normalized = fs::weakly_canonical(path, ec);
    if (ec) {
        normalized = path.lexically_normal();
    }
    if (!normalized.has_filename() && normalized.has_parent_path() && normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

} // namespace

std::expected<ArchiveOptions, std::string> parseArguments(const std::vector<std::string>& args) {
    ArchiveOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(fmt::format("Missing value for {}", arg));
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config" || arg == "--device" || arg == "--dest" || arg == "--folder" || arg == "--estimate-gb") {
            auto v = value();
            if (!v) {
                return std::unexpected(v.error());
            }
            if (arg == "--config") {
                options.configFile = *v;
            } else if (arg == "--device") {
                options.deviceSerial = *v;
            } else if (arg == "--dest") {
                options.destination = *v;
            } else if (arg == "--folder") {
                options.folder = *v;
            } else {
                try {
                    std::size_t consumed = 0;
                    options.estimateGb = std::stod(*v, &consumed);
                    if (consumed != v->size()) {
                        return std::unexpected(fmt::format("Invalid size for --estimate-gb: {}", *v));
                    }
                    if (auto bytes = estimateToBytes(*options.estimateGb); !bytes) {
                        return std::unexpected(fmt::format("Invalid size for --estimate-gb: {} ({})", *v, bytes.error()));
                    }
                } catch (const std::exception&) {
                    return std::unexpected(fmt::format("Invalid size for --estimate-gb: {}", *v));
                }
            }
        } else if (arg == "--full") {
            options.fullBackup = true;
        } else if (arg == "--merge") {
            options.merge = true;
        } else if (arg == "--fresh") {
            options.fresh = true;
        } else if (arg == "--yes" || arg == "-y") {
            options.assumeYes = true;
        } else {
            return std::unexpected(fmt::format("Unknown argument: {}", arg));
        }
    }

    if (options.merge && options.fresh) {
        return std::unexpected("--merge and --fresh cannot be combined");
    }
    if (options.fullBackup && options.folder) {
        return std::unexpected("--full and --folder cannot be combined");
    }
    return options;
}

std::expected<std::uint64_t, std::string> estimateToBytes(double gb) {
    if (!std::isfinite(gb)) {
        return std::unexpected("size must be a finite number");
    }
    if (gb <= 0) {
        return std::unexpected("size must be positive");
    }
    double bytes = gb * kBytesPerGb;
    // 2^64 is exactly representable; anything at or above it does not fit.
    if (bytes >= 18446744073709551616.0) {
        return std::unexpected("size is too large");
    }
    auto result = static_cast<std::uint64_t>(bytes);
    if (result == 0) {
        return std::unexpected("size is smaller than one byte");
    }
    return result;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [--config <path>] [--device <serial>] [--dest <path>]\n"
        "       [--full | --folder <name>] [--estimate-gb <GB>] [--merge | --fresh] [--yes]\n",
        program);
}

bool isCriticalDirectory(const fs::path& path) {
    const char* homeEnv = std::getenv("HOME");
    fs::path home = homeEnv ? homeEnv : "";
    std::vector<fs::path> critical{"/"};
    if (!home.empty()) {
        critical.push_back(home);
        for (const char* sub : {"Documents", "Downloads", "Desktop", "Pictures"}) {
            critical.push_back(home / sub);
        }
    }

    fs::path target = normalizeDirectory(path);
    for (const auto& dir : critical) {
        if (normalizeDirectory(dir) == target) {
            return true;
        }
    }
    return false;
}

std::expected<PreparedDestination, std::string> prepareDestination(const fs::path& path,
                                                                   std::optional<ExistingDestination> existing) {
    fs::path target = path.lexically_normal();
    std::error_code ec;

    if (!fs::exists(target, ec)) {
        fs::create_directories(target, ec);
        if (ec) {
            return std::unexpected(fmt::format("Failed to create backup directory {}: {}", target.string(), ec.message()));
        }
        return PreparedDestination{target, true};
    }
    if (!fs::is_directory(target, ec)) {
        return std::unexpected(fmt::format("Backup location is not a directory: {}", target.string()));
    }
    bool empty = fs::is_empty(target, ec);
    if (ec) {
        return std::unexpected(fmt::format("Cannot read backup location {}: {}", target.string(), ec.message()));
    }
    if (empty) {
        return PreparedDestination{target, false};
    }
    if (!existing) {
        return std::unexpected(fmt::format("Backup location already contains files: {}", target.string()));
    }
    if (*existing == ExistingDestination::Merge) {
        return PreparedDestination{target, false};
    }

    fs::remove_all(target, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to delete existing backup: {}", ec.message()));
    }
    fs::create_directories(target, ec);
    if (ec) {
        return std::unexpected(fmt::format("Failed to create backup directory {}: {}", target.string(), ec.message()));
    }
    return PreparedDestination{target, true};
}

std::expected<std::uint64_t, std::string> availableSpace(const fs::path& path) {
    fs::path probe = path.lexically_normal();
    std::error_code ec;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        if (probe == probe.parent_path()) {
            break;
        }
        probe = probe.parent_path();
    }
    if (probe.empty()) {
        probe = ".";
    }

    struct statvfs stats {};
    if (::statvfs(probe.c_str(), &stats) != 0) {
        return std::unexpected(fmt::format("statvfs failed for {}", probe.string()));
    }
    return static_cast<std::uint64_t>(stats.f_bavail) * static_cast<std::uint64_t>(stats.f_frsize);
}

Archiver::Archiver(const std::string& configFile)
    : config(configFile), adb(config.adbPath, std::chrono::duration_cast<std::chrono::seconds>(config.commandTimeout)) {}

std::expected<std::string, std::string> Archiver::selectDevice(const ArchiveOptions& options) const {
    auto devices = adb.listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }
    if (devices->empty()) {
        return std::unexpected(
            "No Android device found. Please ensure:\n"
            "1. USB debugging is enabled in Developer Options\n"
            "2. Device is set to 'File Transfer' mode\n"
            "3. Appropriate USB drivers are installed");
    }

    if (options.deviceSerial) {
        for (const auto& device : *devices) {
            if (device.serial == *options.deviceSerial) {
                return device.serial;
            }
        }
        return std::unexpected(fmt::format("Device {} is not attached", *options.deviceSerial));
    }
    if (devices->size() == 1) {
        return devices->front().serial;
    }
    if (!interactive()) {
        return std::unexpected("Multiple devices detected; select one with --device <serial>");
    }

    fmt::print("Multiple devices detected. Please select a device:\n");
    for (std::size_t i = 0; i < devices->size(); ++i) {
        fmt::print("{}. {}\n", i + 1, (*devices)[i].serial);
    }
    auto choice = parseChoice(prompt("Enter device number: "), devices->size());
    if (!choice) {
        return std::unexpected("Invalid selection.");
    }
    return (*devices)[*choice].serial;
}

std::expected<std::pair<std::string, bool>, std::string> Archiver::selectSource(const std::string& serial,
                                                                                const ArchiveOptions& options) const {
    if (options.folder) {
        std::string folder = trim(*options.folder);
        while (folder.starts_with('/')) {
            folder.erase(0, 1);
        }
        if (folder.empty()) {
            return std::unexpected("Folder name must not be empty");
        }
        return std::make_pair(fmt::format("{}/{}", kDeviceStorageRoot, folder), false);
    }
    if (options.fullBackup || !interactive()) {
        return std::make_pair(std::string(kDeviceStorageRoot), true);
    }

    fmt::print("\nBackup Type:\n");
    fmt::print("1. Full backup (entire {}, excludes {} folder)\n", kDeviceStorageRoot, config.restrictedSubtree);
    fmt::print("2. Partial backup (select specific folder)\n\n");
    auto type = prompt("Select backup type (1-2): ");
    if (!type || *type != "2") {
        return std::make_pair(std::string(kDeviceStorageRoot), true);
    }

    auto folders = adb.listFolders(serial, kDeviceStorageRoot, config.restrictedSubtree);
    if (!folders) {
        return std::unexpected(folders.error());
    }
    if (folders->empty()) {
        return std::unexpected("No accessible folders found");
    }
    fmt::print("\nAvailable folders in {}:\n", kDeviceStorageRoot);
    for (std::size_t i = 0; i < folders->size(); ++i) {
        fmt::print("{}. {}\n", i + 1, (*folders)[i]);
    }
    auto choice = parseChoice(prompt("\nSelect folder number: "), folders->size());
    if (!choice) {
        return std::unexpected("Invalid selection");
    }
    return std::make_pair(fmt::format("{}/{}", kDeviceStorageRoot, (*folders)[*choice]), false);
}

std::expected<std::uint64_t, std::string> Archiver::resolveEstimate(const ArchiveOptions& options) const {
    if (options.estimateGb) {
        auto bytes = estimateToBytes(*options.estimateGb);
        if (!bytes) {
            return std::unexpected(fmt::format("Invalid estimated size: {}", bytes.error()));
        }
        return *bytes;
    }
    if (!interactive()) {
        return std::unexpected("Estimated backup size required; pass --estimate-gb <GB>");
    }

    fmt::print("\nEstimated Backup Size:\n");
    fmt::print("Please estimate the total size of your backup in GB\n");
    fmt::print("Example: For 32GB of data, enter '32'\n");
    while (true) {
        auto answer = prompt("\nEnter estimated size in GB: ");
        if (!answer) {
            return std::unexpected("No size entered");
        }
        try {
            std::size_t consumed = 0;
            double gb = std::stod(*answer, &consumed);
            if (consumed != answer->size()) {
                fmt::print("Please enter a valid number\n");
                continue;
            }
            auto bytes = estimateToBytes(gb);
            if (!bytes) {
                fmt::print("Invalid size: {}\n", bytes.error());
                continue;
            }
            return *bytes;
        } catch (const std::exception&) {
            fmt::print("Please enter a valid number\n");
        }
    }
}

std::expected<PreparedDestination, std::string> Archiver::resolveDestination(const ArchiveOptions& options) const {
    std::string location = options.destination.value_or(config.backupLocation);
    if (!options.destination && interactive()) {
        fmt::print("\nBackup Location:\nDefault: {}\n\n", config.backupLocation);
        auto answer = prompt("Press Enter to use default, or type a custom path: ");
        if (answer && !answer->empty()) {
            location = *answer;
        }
    }

    fs::path path = fs::path(expandEnvironment(location)).lexically_normal();
    fmt::print("Using: {}\n", path.string());
    if (isCriticalDirectory(path)) {
        return std::unexpected(fmt::format("Cannot use a critical system directory as backup location: {}", path.string()));
    }

    auto space = availableSpace(path);
    if (!space) {
        config.logMessage(fmt::format("Warning: Could not verify free space: {}", space.error()));
    } else if (static_cast<double>(*space) < config.minFreeSpaceGb * kBytesPerGb) {
        config.logMessage(fmt::format("Warning: Less than {:.0f}GB free space ({}) in backup location.",
                                      config.minFreeSpaceGb, formatSize(static_cast<double>(*space))));
        if (!options.assumeYes) {
            if (!interactive()) {
                return std::unexpected("Not enough free space; pass --yes to continue anyway");
            }
            auto confirm = prompt("Continue anyway? (y/n): ");
            if (!confirm || toLower(*confirm) != "y") {
                return std::unexpected("Backup cancelled: not enough free space");
            }
        }
    }

    std::optional<ExistingDestination> existing;
    if (options.merge) {
        existing = ExistingDestination::Merge;
    } else if (options.fresh) {
        existing = ExistingDestination::Fresh;
    } else {
        std::error_code ec;
        bool occupied = fs::is_directory(path, ec) && !fs::is_empty(path, ec);
        if (occupied) {
            if (!interactive()) {
                return std::unexpected("Backup location already contains files; rerun with --merge or --fresh");
            }
            fmt::print("\nWarning: Backup location already contains files.\n");
            fmt::print("Options:\n");
            fmt::print("1. Merge with existing backup (add new files)\n");
            fmt::print("2. Delete existing backup and start fresh\n");
            fmt::print("3. Cancel and choose different location\n\n");
            auto choice = prompt("Select option (1-3): ");
            if (choice && *choice == "1") {
                existing = ExistingDestination::Merge;
            } else if (choice && *choice == "2") {
                auto confirm = prompt("Delete all existing files? This cannot be undone! (yes/no): ");
                if (!confirm || toLower(*confirm) != "yes") {
                    return std::unexpected("Deletion cancelled.");
                }
                existing = ExistingDestination::Fresh;
            } else if (choice && *choice == "3") {
                return std::unexpected("Backup cancelled. Please restart and choose a different location.");
            } else {
                return std::unexpected("Invalid choice.");
            }
        }
    }

    auto prepared = prepareDestination(path, existing);
    if (prepared && existing == ExistingDestination::Merge) {
        fmt::print("Will merge with existing backup.\n");
    }
    return prepared;
}

void Archiver::printSummary(const TransferSession& session, const SessionOutcome& outcome) const {
    switch (outcome.state) {
        case MonitorState::Completed:
            if (!outcome.success) {
                fmt::print(stderr, "\nBackup failed - no files were transferred\n");
                return;
            }
            fmt::print("\nBackup completed successfully!\n");
            if (session.excludesRestrictedSubtree) {
                fmt::print("Note: Some protected files in the {} folder were skipped\n", config.restrictedSubtree);
            }
            fmt::print("Summary:\n");
            fmt::print(" - Total files backed up: {} files ({})\n", outcome.fileCount,
                       formatSize(static_cast<double>(outcome.bytesTransferred)));
            fmt::print(" - Elapsed time: {}\n", formatDuration(outcome.elapsedTime.count()));
            if (outcome.elapsedTime.count() > 0) {
                fmt::print(" - Average speed: {}/s\n",
                           formatSize(static_cast<double>(outcome.bytesTransferred) / outcome.elapsedTime.count()));
            }
            fmt::print(" - Backup location: {}\n", session.destinationPath.string());
            if (outcome.diagnosticsPresent) {
                fmt::print(" - Some files were skipped - see {} for details\n", config.diagnosticLogName);
            }
            return;
        case MonitorState::Interrupted:
            fmt::print("\nBackup interrupted by user.\n");
            fmt::print(" - Partial data at interruption: {} in {} files\n",
                       formatSize(static_cast<double>(outcome.bytesTransferred)), outcome.fileCount);
            return;
        case MonitorState::Verifying:
        case MonitorState::Running:
        case MonitorState::Aborted:
            fmt::print(stderr, "\nBackup aborted: {}\n", outcome.message);
            return;
    }
}

int Archiver::run(const ArchiveOptions& options, const std::function<bool()>& cancelRequested) {
    auto interrupted = [&]() {
        config.logMessage("Backup interrupted by user before the copy started.");
        return 130;
    };

    auto version = adb.checkVersion();
    if (cancelRequested()) {
        return interrupted();
    }
    if (!version) {
        config.logError(version.error());
        fmt::print(stderr, "ADB version check failed\n");
        return 1;
    }
    fmt::print("ADB Version: {}\n", *version);

    auto serial = selectDevice(options);
    if (cancelRequested()) {
        return interrupted();
    }
    if (!serial) {
        config.logError(serial.error());
        return 1;
    }

    DeviceInfo info = adb.deviceInfo(*serial);
    fmt::print("\nDevice Information:\n");
    fmt::print(" - Manufacturer: {}\n", info.manufacturer);
    fmt::print(" - Model: {}\n", info.model);
    fmt::print(" - Android Version: {}\n", info.androidVersion);
    fmt::print(" - Build Number: {}\n", info.buildNumber);
    fmt::print(" - Serial Number: {}\n", info.serial);

    auto state = adb.checkDeviceState(*serial);
    if (cancelRequested()) {
        return interrupted();
    }
    if (!state) {
        config.logError(state.error());
        config.logError("Device compatibility check failed");
        return 1;
    }

    // A signal during a prompt fails the read, so the flag is checked before the answer.
    auto source = selectSource(*serial, options);
    if (cancelRequested()) {
        return interrupted();
    }
    if (!source) {
        config.logError(source.error());
        return 1;
    }
    auto estimate = resolveEstimate(options);
    if (cancelRequested()) {
        return interrupted();
    }
    if (!estimate) {
        config.logError(estimate.error());
        return 1;
    }
    // Once prepared, the destination belongs to the monitor, which handles a pending cancellation.
    auto destination = resolveDestination(options);
    if (!destination && cancelRequested()) {
        return interrupted();
    }
    if (!destination) {
        config.logError(destination.error());
        return 1;
    }

    TransferSession session;
    session.deviceId = *serial;
    session.sourcePath = source->first;
    session.destinationPath = destination->path;
    session.startTime = std::chrono::system_clock::now();
    session.totalEstimatedBytes = *estimate;
    session.excludesRestrictedSubtree = source->second;
    session.directoryCreatedByMonitor = destination->createdByRun;

    SizeSampler sampler(config.diagnosticLogName);
    AdbPathProbe probe(config.adbPath, config.probeTimeout);
    AdbPullLauncher launcher(config.adbPath, config.terminateGrace);
    ConsoleProgressReporter reporter;
    SteadyMonitorClock clock;
    TransferMonitor monitor(config, launcher, probe, sampler, reporter, clock);

    fmt::print("{}\n\n", std::string(60, '-'));
    auto result = monitor.run(session, cancelRequested);
    if (!result) {
        fmt::print(stderr, "\nBackup aborted: {}\n", result.error());
        return 1;
    }

    config.logMessage(fmt::format("Session ended: {}", monitorStateName(result->state)));
    printSummary(session, *result);
    if (result->state == MonitorState::Interrupted) {
        return 130;
    }
    return result->success ? 0 : 1;
}
