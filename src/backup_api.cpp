#include "backup_api.hpp"
#include "backup.hpp"
#include <format>

std::expected<std::string, std::string> BackupAPI::startBackup(const std::string& configFile) {
    try {
        Backup backup(configFile);
        return backup.run();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start backup: {}", e.what()));
    }
}

std::expected<void, std::string> BackupAPI::uploadFile(const std::string& configFile, const std::string& filePath) {
    try {
        Backup backup(configFile);
        backup.log().info("========== S3 FILE UPLOAD ==========");
        auto result = backup.uploadSingleFile(filePath);
        if (!result) {
            backup.log().error(std::format("Upload failed: {}", result.error()));
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to upload file: {}", e.what()));
    }
}
