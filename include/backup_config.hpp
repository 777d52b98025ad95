/**
 * @file backup_config.hpp
 * @brief Configuration management for the SiteVault backup system.
 *
 * Defines the configuration structures for the site backup: the tree to archive, its exclusion
 * patterns, retention limits, logging, and the optional S3 and SMTP sections. Everything is
 * resolved once at startup; optional backend sections are std::nullopt when absent or incomplete.
 *
 * @note Configuration is loaded from a JSON file (see backup_config.example.json).
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <json/json.h>
#include "logger.hpp"

/**
 * @brief Connection parameters of one S3-compatible bucket.
 */
struct S3Endpoint {
    std::string endpointUrl;        ///< Service URL (e.g., "https://storage.example.com").
    std::string bucketName;         ///< Bucket name.
    std::string accessKey;          ///< Access key ID.
    std::string secretKey;          ///< Secret access key.
    std::string region = "us-east-1"; ///< Signing region.
};

/**
 * @brief S3 storage for packaged backups.
 */
struct S3BackupConfig {
    S3Endpoint endpoint;                    ///< Backup bucket.
    std::string backupPath = "backups";     ///< Key prefix for uploaded backups.
    int maxBackups = 5;                     ///< Retention limit for uploaded backups.
    bool deleteLocalAfterUpload = false;    ///< Remove the local artifact after a successful upload.
};

/**
 * @brief Work file storage that is mirrored into the backup bucket.
 */
struct S3WorkStorageConfig {
    S3Endpoint endpoint;                                ///< Source (work) bucket.
    std::string backupFolder = "s3-work-file-storage";  ///< Folder in the backup bucket holding snapshots.
    int maxBackups = 5;                                 ///< Retention limit for snapshots.
};

/**
 * @brief SMTP server used for notifications.
 */
struct SmtpConfig {
    std::string server;     ///< SMTP host.
    int port = 587;         ///< SMTP port; 465 uses implicit TLS.
    std::string username;   ///< Login.
    std::string password;   ///< Password.
    bool useTls = true;     ///< Require STARTTLS on non-465 ports.
};

/**
 * @brief Where packaged backups are kept.
 */
enum class StorageType {
    Local,
    S3
};

/**
 * @brief Configuration class for the backup system.
 *
 * Loads and validates settings from a JSON configuration file, applying defaults where needed.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable, or a required field is invalid.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @param configJson Parsed configuration.
     * @return BackupConfig The validated configuration.
     * @throws std::runtime_error If a required field is missing or invalid.
     */
    static BackupConfig fromJson(const Json::Value& configJson);

    /**
     * @brief Returns the S3 backup section or a configuration error.
     *
     * @return std::expected<S3BackupConfig, std::string> The section, or an error when it is absent or incomplete.
     */
    std::expected<S3BackupConfig, std::string> requireS3() const;

    /**
     * @brief Returns the S3 work storage section or a configuration error.
     *
     * @return std::expected<S3WorkStorageConfig, std::string> The section, or an error when it is absent or incomplete.
     */
    std::expected<S3WorkStorageConfig, std::string> requireS3WorkStorage() const;

    /**
     * @brief Logger settings derived from the "log" section.
     */
    LogSettings logSettings() const;

    std::string siteRoot;                           ///< Root of the web application tree.
    std::string backupDir = "/backup";              ///< Directory for final backup archives.
    std::string dbName;                             ///< Database to dump.
    std::string mysqlConfig = "/root/.my.cnf";      ///< mysqldump defaults file with credentials.
    std::vector<std::string> excludePatterns;       ///< Ordered exclusion patterns.
    std::vector<std::string> systemConfigs;         ///< System configuration paths to archive.
    int maxBackups = 7;                             ///< Local retention limit.
    std::uintmax_t minDiskSpaceKb = 1048576;        ///< Required free space in the backup directory.
    StorageType storageType = StorageType::Local;   ///< Where packaged backups are kept.
    bool s3FileBackupEnabled = false;               ///< Mirror the work storage bucket after the backup.
    std::string emailFrom;                          ///< Notification sender.
    std::string emailTo;                            ///< Notification recipient.
    std::string logDir;                             ///< Log directory (defaults to <backupDir>/logs).
    LogLevel logLevel = LogLevel::Info;             ///< Minimum log level.
    int logMaxSizeMb = 10;                          ///< Log rotation threshold in megabytes.
    int logBackupCount = 5;                         ///< Rotated log generations kept.
    std::optional<S3BackupConfig> s3;               ///< Backup bucket, if configured.
    std::optional<S3WorkStorageConfig> s3WorkStorage; ///< Work storage bucket, if configured.
    std::optional<SmtpConfig> smtp;                 ///< SMTP server, if configured.

private:
    BackupConfig() = default;
    void load(const Json::Value& configJson);
};

#endif // BACKUP_CONFIG_HPP
