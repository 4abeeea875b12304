/**
 * @file formatting.hpp
 * @brief Text helpers shared by the progress line, the completion marker and the logs.
 */

#ifndef FORMATTING_HPP
#define FORMATTING_HPP

#include <string>
#include <cstdint>
#include <chrono>

/**
 * @brief Formats a byte count as a human-readable size.
 *
 * Uses binary units: "512 B", "1.50 KB", "12.00 MB", "3.25 GB".
 *
 * @param bytes Byte count. Negative and fractional values are accepted for rates.
 * @return std::string The formatted size.
 */
std::string formatSize(double bytes);

/**
 * @brief Formats a duration in seconds as HH:MM:SS.
 *
 * Negative inputs are clamped to zero. Hours are not wrapped at 24.
 *
 * @param seconds Duration in seconds.
 * @return std::string The formatted duration.
 */
std::string formatDuration(double seconds);

/**
 * @brief Computes the completion percentage of an estimated total.
 *
 * @param currentBytes Bytes observed so far.
 * @param totalBytes Operator-supplied estimate.
 * @return double Percentage clamped to [0, 100]. With a zero estimate: 100 once any byte was seen, else 0.
 */
double progressPercent(std::uint64_t currentBytes, std::uint64_t totalBytes);

/**
 * @brief Draws a fixed-width progress bar followed by the percentage.
 *
 * @param percent Percentage, clamped to [0, 100].
 * @param width Number of cells in the bar.
 * @return std::string e.g. "[███░░░] 50.0%".
 */
std::string drawProgressBar(double percent, int width = 30);

/**
 * @brief Formats a wall-clock time point with a strftime pattern in local time.
 */
std::string formatTimestamp(std::chrono::system_clock::time_point when, const char* pattern);

/**
 * @brief Removes leading and trailing whitespace, including carriage returns.
 */
std::string trim(const std::string& text);

/**
 * @brief Lower-cases ASCII letters.
 */
std::string toLower(std::string text);

#endif // FORMATTING_HPP
