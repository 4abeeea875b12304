#include "diagnostic_collector.hpp"
#include "formatting.hpp"
#include <fstream>
#include <utility>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::string DiagnosticRecord::format() const {
    return fmt::format("[{}] {}", formatTimestamp(timestamp, "%H:%M:%S"), message);
}

FailureFilter::FailureFilter(std::vector<std::string> markers) {
    for (auto& marker : markers) {
        if (!marker.empty()) {
            this->markers.push_back(toLower(std::move(marker)));
        }
    }
}

bool FailureFilter::matches(const std::string& line) const {
    std::string lowered = toLower(line);
    for (const auto& marker : markers) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

DiagnosticCollector::DiagnosticCollector(fs::path logPath, FailureFilter filter)
    : logPath(std::move(logPath)), filter(std::move(filter)), state(std::make_shared<SharedState>()) {}

DiagnosticCollector::~DiagnosticCollector() {
    if (worker.joinable()) {
        worker.detach();
    }
}

void DiagnosticCollector::start(std::unique_ptr<LineSource> source) {
    if (worker.joinable() || !source) {
        return;
    }
    worker = std::thread(&DiagnosticCollector::drain, std::move(source), logPath, filter, state);
}

bool DiagnosticCollector::finish(std::chrono::milliseconds timeout) {
    if (!worker.joinable()) {
        return true;
    }
    bool drained;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        drained = state->done.wait_for(lock, timeout, [this] { return state->finished; });
    }
    if (drained) {
        worker.join();
    } else {
        worker.detach();
    }
    return drained;
}

std::size_t DiagnosticCollector::recordCount() const {
    return state->records.load();
}

void DiagnosticCollector::drain(std::unique_ptr<LineSource> source,
                                fs::path logPath,
                                FailureFilter filter,
                                std::shared_ptr<SharedState> state) {
    try {
        std::ofstream log;
        std::string line;
        while (source->nextLine(line)) {
            std::string message = trim(line);
            if (message.empty() || !filter.matches(message)) {
                continue;
            }
            if (!log.is_open()) {
                log.open(logPath, std::ios::app);
            }
            if (log.is_open()) {
                DiagnosticRecord record{std::chrono::system_clock::now(), message};
                log << record.format() << '\n';
                log.flush();
                if (log) {
                    ++state->records;
                }
            }
        }
    } catch (const std::exception&) {
        // Diagnostics are best effort and must never reach the transfer.
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->finished = true;
    }
    state->done.notify_all();
}
