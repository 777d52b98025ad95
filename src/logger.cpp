#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

Logger::Logger(LogSettings settings) : settings(std::move(settings)) {
    if (!this->settings.directory.empty()) {
        std::error_code ec;
        fs::create_directories(this->settings.directory, ec);
        if (ec) {
            std::println(stderr, "Error: Cannot create log directory: {} ({})", this->settings.directory, ec.message());
        }
        logFile = (fs::path(this->settings.directory) / "sitevault.log").string();
    }
}

void Logger::debug(const std::string& message) const {
    log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) const {
    log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) const {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) const {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (level < settings.level) {
        return;
    }

    std::string timeBuf = currentTimestamp();
    if (level == LogLevel::Error) {
        std::println(stderr, "[{}] ERROR: {}", timeBuf, message);
    } else {
        std::println("[{}] {}", timeBuf, message);
    }

    if (logFile.empty()) {
        return;
    }

    rotateIfNeeded();
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << std::format("[{}] [{}] {}", timeBuf, levelName(level), message) << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", logFile);
    }
}

void Logger::rotateIfNeeded() const {
    std::error_code ec;
    auto size = fs::file_size(logFile, ec);
    if (ec || size < settings.maxFileBytes) {
        return;
    }

    if (settings.backupCount <= 0) {
        fs::resize_file(logFile, 0, ec);
        return;
    }

    fs::remove(std::format("{}.{}", logFile, settings.backupCount), ec);
    for (int i = settings.backupCount - 1; i >= 1; --i) {
        std::string from = std::format("{}.{}", logFile, i);
        if (fs::exists(from, ec)) {
            fs::rename(from, std::format("{}.{}", logFile, i + 1), ec);
        }
    }
    fs::rename(logFile, logFile + ".1", ec);
    if (ec) {
        std::println(stderr, "Error: Cannot rotate log file: {} ({})", logFile, ec.message());
    }
}

std::expected<LogLevel, std::string> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::unexpected(std::format("Invalid log level: {}", name));
}
