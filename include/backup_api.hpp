/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the SiteVault backup system.
 *
 * Provides a simplified interface for running a backup and for uploading a single file to the
 * backup bucket, abstracting the underlying backup orchestration. Configuration is read from a
 * JSON file.
 *
 * @note Ensure the configuration uses absolute paths and that mysqldump is on the PATH.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <expected>

/**
 * @brief API for managing backups in SiteVault.
 *
 * Serves as the primary entry point for the command line tools.
 */
class BackupAPI {
public:
    /**
     * @brief Runs one complete backup.
     *
     * @param configFile Path to the JSON configuration file.
     * @return std::expected<std::string, std::string> Path of the final archive, or an error message.
     */
    static std::expected<std::string, std::string> startBackup(const std::string& configFile);

    /**
     * @brief Uploads one file to the configured backup bucket.
     *
     * @param configFile Path to the JSON configuration file.
     * @param filePath File to upload.
     * @return std::expected<void, std::string> Success or an error message.
     * @note Requires an "s3" section in the configuration.
     */
    static std::expected<void, std::string> uploadFile(const std::string& configFile, const std::string& filePath);
};

#endif // BACKUP_API_HPP
