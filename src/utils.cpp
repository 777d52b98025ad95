#include "utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <unistd.h>
#include <climits>

std::string formatHumanSize(std::uint64_t bytes) {
    if (bytes == 0) {
        return "0B";
    }

    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return std::format("{:.1f}{}", size, unit);
        }
        size /= 1024.0;
    }
    return std::format("{:.1f}PB", size);
}

std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* format) {
    auto timeT = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), format, &tmLocal);
    return timeBuf;
}

std::string currentTimestamp(const char* format) {
    return formatLocalTime(std::chrono::system_clock::now(), format);
}

std::optional<std::chrono::system_clock::time_point> parseLocalTime(const std::string& text, const char* format) {
    std::tm tmLocal{};
    std::istringstream ss(text);
    ss >> std::get_time(&tmLocal, format);
    if (ss.fail()) {
        return std::nullopt;
    }
    tmLocal.tm_isdst = -1;
    std::time_t timeT = std::mktime(&tmLocal);
    if (timeT == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timeT);
}

std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(fileTime));
}

std::string normalizeSeparators(std::string path) {
    std::ranges::replace(path, '\\', '/');
    return path;
}

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
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
    quoted += '\'';
    return quoted;
}

std::string base64Encode(std::string_view data) {
    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a terminator.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::string hostName() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "unknown";
    }
    return buf;
}

std::string osVersion() {
    std::ifstream file("/etc/os-release");
    std::string line;
    while (std::getline(file, line)) {
        if (line.starts_with("PRETTY_NAME=")) {
            std::string value = line.substr(line.find('=') + 1);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
    }
    return "unknown";
}
