#include "archiver_config.hpp"
#include "formatting.hpp"
#include <fstream>
#include <memory>
#include <stdexcept>
#include <filesystem>
#include <cstdlib>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    return home ? home : ".";
}

template <typename Duration>
Duration positiveDuration(const Json::Value& json, const char* key, Duration fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    auto count = json[key].asInt64();
    if (count <= 0) {
        throw std::runtime_error(fmt::format("Invalid configuration value for {}: must be positive", key));
    }
    return Duration(count);
}

} // namespace

std::string expandEnvironment(const std::string& value) {
    std::string input = value;
    if (input == "~" || input.starts_with("~/")) {
        input = homeDirectory() + input.substr(1);
    }

    std::string result;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '$' || i + 1 >= input.size()) {
            result += input[i];
            continue;
        }
        std::string name;
        std::size_t next = i + 1;
        if (input[next] == '{') {
            auto close = input.find('}', next);
            if (close == std::string::npos) {
                result += input[i];
                continue;
            }
            name = input.substr(next + 1, close - next - 1);
            i = close;
        } else {
            while (next < input.size() && (std::isalnum(static_cast<unsigned char>(input[next])) || input[next] == '_')) {
                name += input[next++];
            }
            if (name.empty()) {
                result += input[i];
                continue;
            }
            i = next - 1;
        }
        if (const char* env = std::getenv(name.c_str())) {
            result += env;
        }
    }
    return result;
}

ArchiverConfig::ArchiverConfig(const std::string& configFile) : configFile(configFile) {
    Json::Value configJson(Json::objectValue);
    bool existed = fs::exists(configFile);
    if (existed) {
        std::ifstream file(configFile);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
        }
        Json::CharReaderBuilder builder;
        std::string errors;
        if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
            throw std::runtime_error(fmt::format("Failed to parse config file: {} ({})", configFile, trim(errors)));
        }
        if (!configJson.isObject()) {
            throw std::runtime_error(fmt::format("Config file is not a JSON object: {}", configFile));
        }
    }

    backupLocation = expandEnvironment(configJson.get("backup_location", getDefaultBackupLocation()).asString());
    adbPath = expandEnvironment(configJson.get("adb_path", "adb").asString());
    logDir = expandEnvironment(configJson.get("log_dir", homeDirectory() + "/.device-archiver").asString());
    logFile = (fs::path(logDir) / "archiver.log").string();
    errorLogFile = (fs::path(logDir) / "errors.log").string();

    tickInterval = positiveDuration(configJson, "tick_interval_ms", tickInterval);
    probeTimeout = positiveDuration(configJson, "probe_timeout_seconds", probeTimeout);
    commandTimeout = positiveDuration(configJson, "command_timeout_seconds", commandTimeout);
    terminateGrace = positiveDuration(configJson, "terminate_grace_ms", terminateGrace);
    collectorGrace = positiveDuration(configJson, "collector_grace_ms", collectorGrace);

    int window = configJson.get("rate_window", 5).asInt();
    if (window < 1) {
        throw std::runtime_error("Invalid configuration value for rate_window: must be at least 1");
    }
    rateWindow = static_cast<std::size_t>(window);

    if (configJson.isMember("failure_markers")) {
        for (const auto& marker : configJson["failure_markers"]) {
            if (!marker.asString().empty()) {
                failureMarkers.push_back(toLower(marker.asString()));
            }
        }
    }
    if (failureMarkers.empty()) {
        failureMarkers = {"permission denied", "failed", "cannot"};
    }

    restrictedSubtree = configJson.get("restricted_subtree", "Android").asString();
    minFreeSpaceGb = configJson.get("min_free_space_gb", 10.0).asDouble();

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        fmt::print(stderr, "Warning: Cannot create log directory {}: {}\n", logDir, ec.message());
    }

    if (!existed) {
        std::ofstream out(configFile);
        if (!out.is_open()) {
            fmt::print(stderr, "Warning: Could not create config file: {}\n", configFile);
            return;
        }
        Json::StreamWriterBuilder writerBuilder;
        writerBuilder["indentation"] = "    ";
        std::unique_ptr<Json::StreamWriter> writer(writerBuilder.newStreamWriter());
        writer->write(toJson(), &out);
        out << '\n';
    }
}

Json::Value ArchiverConfig::toJson() const {
    Json::Value json(Json::objectValue);
    json["backup_location"] = backupLocation;
    json["adb_path"] = adbPath;
    json["log_dir"] = logDir;
    json["tick_interval_ms"] = static_cast<Json::Int64>(tickInterval.count());
    json["rate_window"] = static_cast<Json::UInt64>(rateWindow);
    json["probe_timeout_seconds"] = static_cast<Json::Int64>(probeTimeout.count());
    json["command_timeout_seconds"] = static_cast<Json::Int64>(commandTimeout.count());
    json["terminate_grace_ms"] = static_cast<Json::Int64>(terminateGrace.count());
    json["collector_grace_ms"] = static_cast<Json::Int64>(collectorGrace.count());
    Json::Value markers(Json::arrayValue);
    for (const auto& marker : failureMarkers) {
        markers.append(marker);
    }
    json["failure_markers"] = markers;
    json["restricted_subtree"] = restrictedSubtree;
    json["min_free_space_gb"] = minFreeSpaceGb;
    return json;
}

void ArchiverConfig::logMessage(const std::string& message) const {
    std::ofstream log(logFile, std::ios::app);
    std::string logEntry = fmt::format("[{}] {}", formatTimestamp(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"), message);

    fmt::print("{}\n", logEntry);

    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        fmt::print(stderr, "Error: Cannot write to log file: {}\n", logFile);
    }
}

void ArchiverConfig::logError(const std::string& message) const {
    std::ofstream log(errorLogFile, std::ios::app);
    std::string logEntry = fmt::format("[{}] ERROR: {}", formatTimestamp(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"), message);

    fmt::print(stderr, "{}\n", logEntry);

    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        fmt::print(stderr, "Error: Cannot write to error log file: {}\n", errorLogFile);
    }
}

std::string ArchiverConfig::getDefaultBackupLocation() {
    return (fs::path(homeDirectory()) / "Documents" / "AndroidBackup").string();
}
