#include "formatting.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cmath>

std::string formatSize(double bytes) {
    constexpr double kb = 1024.0;
    constexpr double mb = kb * 1024.0;
    constexpr double gb = mb * 1024.0;
    if (bytes < kb) {
        return fmt::format("{:.0f} B", bytes);
    } else if (bytes < mb) {
        return fmt::format("{:.2f} KB", bytes / kb);
    } else if (bytes < gb) {
        return fmt::format("{:.2f} MB", bytes / mb);
    }
    return fmt::format("{:.2f} GB", bytes / gb);
}

std::string formatDuration(double seconds) {
    if (!(seconds > 0) || std::isinf(seconds)) {
        seconds = 0;
    }
    auto total = static_cast<long long>(seconds);
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;
    return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, secs);
}

double progressPercent(std::uint64_t currentBytes, std::uint64_t totalBytes) {
    if (totalBytes == 0) {
        return currentBytes > 0 ? 100.0 : 0.0;
    }
    double percent = static_cast<double>(currentBytes) / static_cast<double>(totalBytes) * 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

std::string drawProgressBar(double percent, int width) {
    percent = std::clamp(percent, 0.0, 100.0);
    int filled = static_cast<int>(width * percent / 100.0);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return fmt::format("[{}] {:.1f}%", bar, percent);
}

std::string formatTimestamp(std::chrono::system_clock::time_point when, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&timeT, &local);
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &local);
    return buf;
}

std::string trim(const std::string& text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string text) {
    std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
