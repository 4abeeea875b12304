#include "progress_reporter.hpp"
#include "formatting.hpp"
#include <fmt/format.h>

std::string renderProgressLine(const ProgressReport& report) {
    return fmt::format("{} {}/{} ({} files) [{}/s] ETA: {}",
                       drawProgressBar(report.percent),
                       formatSize(static_cast<double>(report.currentBytes)),
                       formatSize(static_cast<double>(report.totalBytes)),
                       report.fileCount,
                       formatSize(report.bytesPerSecond),
                       formatDuration(report.etaSeconds));
}

ConsoleProgressReporter::ConsoleProgressReporter(std::FILE* out) : out(out) {}

void ConsoleProgressReporter::onProgress(const ProgressReport& report) {
    std::string line = renderProgressLine(report);
    std::size_t padding = lastWidth > line.size() ? lastWidth - line.size() : 0;
    fmt::print(out, "\r{}{}", line, std::string(padding, ' '));
    std::fflush(out);
    lastWidth = line.size();
    active = true;
}

void ConsoleProgressReporter::onFinish() {
    if (active) {
        fmt::print(out, "\n");
        std::fflush(out);
    }
    active = false;
    lastWidth = 0;
}
