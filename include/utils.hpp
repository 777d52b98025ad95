/**
 * @file utils.hpp
 * @brief Small helpers shared across SiteVault components.
 *
 * Size and time formatting, host probing, shell quoting and base64 encoding.
 * Formatting helpers are deterministic so that manifests stay diffable across runs.
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

/// Version recorded in manifests and in uploaded object metadata.
inline constexpr std::string_view kSiteVaultVersion = "2.0";

/**
 * @brief Converts a byte count into a human-readable size.
 *
 * Uses base-1024 units (B, KB, MB, GB, TB, PB) with one decimal place.
 * Zero is rendered as "0B".
 *
 * @param bytes Size in bytes.
 * @return std::string Formatted size, e.g. "1.5KB".
 */
std::string formatHumanSize(std::uint64_t bytes);

/**
 * @brief Formats a time point in local time.
 *
 * @param timePoint Time to format.
 * @param format strftime-compatible format string.
 * @return std::string Formatted time.
 */
std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* format = "%Y-%m-%d %H:%M:%S");

/**
 * @brief Formats the current local time.
 *
 * @param format strftime-compatible format string.
 * @return std::string Formatted current time.
 */
std::string currentTimestamp(const char* format = "%Y-%m-%d %H:%M:%S");

/**
 * @brief Parses a local time string produced by formatLocalTime().
 *
 * @param text Text to parse.
 * @param format strftime-compatible format the text was written with.
 * @return std::optional<std::chrono::system_clock::time_point> Parsed time or std::nullopt.
 */
std::optional<std::chrono::system_clock::time_point> parseLocalTime(const std::string& text, const char* format);

/**
 * @brief Converts a filesystem timestamp to the system clock.
 */
std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime);

/**
 * @brief Replaces backslashes with forward slashes.
 */
std::string normalizeSeparators(std::string path);

/**
 * @brief Returns the final path segment (empty when the path ends with a separator).
 */
std::string baseName(const std::string& path);

/**
 * @brief Quotes a string for safe use as a single POSIX shell word.
 */
std::string shellQuote(const std::string& value);

/**
 * @brief Encodes binary data as standard base64.
 */
std::string base64Encode(std::string_view data);

/**
 * @brief Returns the host name, or "unknown" when it cannot be determined.
 */
std::string hostName();

/**
 * @brief Returns PRETTY_NAME from /etc/os-release, or "unknown".
 */
std::string osVersion();

#endif // UTILS_HPP
