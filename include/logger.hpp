/**
 * @file logger.hpp
 * @brief Leveled logging for SiteVault.
 *
 * Every message is echoed to the console and appended to a size-rotated log file.
 * A logger without a directory writes to the console only, which is what the tests use.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <expected>
#include <cstdint>

/**
 * @brief Severity of a log message.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Log destination and rotation settings.
 */
struct LogSettings {
    std::string directory;                              ///< Log directory; empty disables the log file.
    LogLevel level = LogLevel::Info;                    ///< Minimum level written.
    std::uintmax_t maxFileBytes = 10 * 1024 * 1024;     ///< Rotation threshold for the log file.
    int backupCount = 5;                                ///< Rotated generations kept (sitevault.log.1 ... .N).
};

/**
 * @brief Console and file logger.
 *
 * Log file lines use the form "[YYYY-MM-DD HH:MM:SS] [LEVEL] message"; the console
 * shows "[YYYY-MM-DD HH:MM:SS] message", with errors on stderr.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * Creates the log directory when one is configured.
     *
     * @param settings Destination and rotation settings.
     */
    explicit Logger(LogSettings settings = {});

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;

    /**
     * @brief Logs an error. On the console the message is prefixed with "ERROR: ".
     */
    void error(const std::string& message) const;

    /**
     * @brief Logs a message at the given level.
     */
    void log(LogLevel level, const std::string& message) const;

    /**
     * @brief Path of the active log file, empty when logging to the console only.
     */
    const std::string& logFilePath() const { return logFile; }

    /**
     * @brief Parses a level name ("debug", "info", "warning", "error"), case-insensitively.
     *
     * @param name Level name.
     * @return std::expected<LogLevel, std::string> Level or an error message.
     */
    static std::expected<LogLevel, std::string> parseLevel(const std::string& name);

private:
    void rotateIfNeeded() const;

    LogSettings settings; ///< Destination and rotation settings.
    std::string logFile;  ///< Active log file path.
};

#endif // LOGGER_HPP
