/**
 * @file backup.hpp
 * @brief Core backup orchestration for SiteVault.
 *
 * Defines the Backup class, which runs one complete backup: database dump, filtered site archive,
 * system configuration archive, manifests, final packaging and verification, retention on the
 * configured storage, the optional work storage mirror, and the closing notification.
 *
 * @note Requires libarchive, zlib, jsoncpp, libcurl and OpenSSL.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <string>
#include <vector>
#include <memory>
#include <expected>
#include <functional>
#include <filesystem>
#include "backup_config.hpp"
#include "database_backup.hpp"
#include "file_backup.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "object_storage.hpp"

namespace fs = std::filesystem;

/**
 * @brief Creates the object storage client for one bucket.
 */
using StorageFactory = std::function<std::expected<std::shared_ptr<ObjectStorage>, std::string>(const S3Endpoint& endpoint)>;

/**
 * @brief Main backup orchestrator.
 *
 * Every step runs to completion before the next. The staging directory is removed on every
 * exit path; the final archive and anything already uploaded are kept when a later step fails.
 */
class Backup {
public:
    /// Name prefix shared by all final archives.
    static constexpr const char* kArchivePrefix = "sitevault_backup_";

    /**
     * @brief Constructs a backup from a configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the configuration cannot be loaded.
     */
    explicit Backup(const std::string& configFile);

    /**
     * @brief Constructs a backup from a loaded configuration.
     */
    explicit Backup(BackupConfig config);

    /**
     * @brief Runs a complete backup.
     *
     * @return std::expected<std::string, std::string> Path of the final archive, or the first error.
     */
    std::expected<std::string, std::string> run();

    /**
     * @brief Uploads one file to "<backup_path>/<name>" in the backup bucket.
     *
     * @param filePath File to upload.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> uploadSingleFile(const std::string& filePath);

    /**
     * @brief Replaces the database strategy (mysqldump by default).
     */
    void setDatabaseStrategy(std::unique_ptr<DatabaseBackupStrategy> strategy);

    /**
     * @brief Replaces the object storage factory (S3 over libcurl by default).
     */
    void setStorageFactory(StorageFactory factory);

    const BackupConfig& configuration() const { return config; }
    const Logger& log() const { return logger; }

    /**
     * @brief Final archive name for a timestamp "YYYYMMDD_HHMMSS".
     */
    static std::string archiveName(const std::string& timestamp);

private:
    std::expected<void, std::string> checkDiskSpace() const;
    std::expected<void, std::string> createInfoFile(const fs::path& stagingDir) const;
    std::expected<void, std::string> manageStorage(const std::string& finalArchive);
    std::expected<void, std::string> uploadToS3(const std::string& finalArchive, ObjectStorage& storage,
                                                const S3BackupConfig& s3);
    std::expected<void, std::string> mirrorWorkStorage();
    void notify(bool success, const std::string& finalArchive);
    std::expected<std::shared_ptr<ObjectStorage>, std::string> connect(const S3Endpoint& endpoint) const;

    BackupConfig config; ///< Backup configuration.
    Logger logger; ///< Run logger.
    std::unique_ptr<DatabaseBackupStrategy> dbStrategy; ///< Database backup strategy.
    std::unique_ptr<FileBackupStrategy> fileStrategy; ///< File backup strategy.
    std::vector<std::unique_ptr<NotificationStrategy>> notificationStrategies; ///< Notification strategies.
    StorageFactory storageFactory; ///< Object storage factory.
    std::string mirrorFolder; ///< Snapshot folder written by the last mirror, if any.
};

#endif // BACKUP_HPP
