#include "backup_config.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> readStringList(const Json::Value& list, const char* key) {
    std::vector<std::string> values;
    if (list.isNull()) {
        return values;
    }
    if (!list.isArray()) {
        throw std::runtime_error(std::format("Config field '{}' must be an array of strings", key));
    }
    for (const auto& item : list) {
        if (!item.isString()) {
            throw std::runtime_error(std::format("Config field '{}' must be an array of strings", key));
        }
        values.push_back(item.asString());
    }
    return values;
}

// Returns std::nullopt when any connection parameter is missing; such a section counts as not configured.
std::optional<S3Endpoint> readEndpoint(const Json::Value& section) {
    S3Endpoint endpoint;
    endpoint.endpointUrl = section.get("endpoint_url", "").asString();
    endpoint.bucketName = section.get("bucket_name", "").asString();
    endpoint.accessKey = section.get("access_key", "").asString();
    endpoint.secretKey = section.get("secret_key", "").asString();
    endpoint.region = section.get("region", "us-east-1").asString();
    if (endpoint.endpointUrl.empty() || endpoint.bucketName.empty() ||
        endpoint.accessKey.empty() || endpoint.secretKey.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

int readPositive(const Json::Value& section, const char* key, int fallback) {
    int value = section.get(key, fallback).asInt();
    if (value < 1) {
        throw std::runtime_error(std::format("Config field '{}' must be at least 1 (got {})", key, value));
    }
    return value;
}

} // namespace

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile,
                                             reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

BackupConfig BackupConfig::fromJson(const Json::Value& configJson) {
    BackupConfig config;
    config.load(configJson);
    return config;
}

void BackupConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    siteRoot = configJson.get("site_root", "").asString();
    if (siteRoot.empty()) {
        throw std::runtime_error("Config field 'site_root' is required");
    }
    dbName = configJson.get("db_name", "").asString();
    if (dbName.empty()) {
        throw std::runtime_error("Config field 'db_name' is required");
    }

    backupDir = configJson.get("backup_dir", "/backup").asString();
    mysqlConfig = configJson.get("mysql_config", "/root/.my.cnf").asString();
    excludePatterns = readStringList(configJson["exclude_patterns"], "exclude_patterns");
    systemConfigs = readStringList(configJson["system_configs"], "system_configs");
    maxBackups = readPositive(configJson, "max_backups", 7);
    minDiskSpaceKb = configJson.get("min_disk_space_kb", 1048576).asLargestUInt();

    std::string storage = configJson.get("storage_type", "local").asString();
    if (storage == "local") {
        storageType = StorageType::Local;
    } else if (storage == "s3") {
        storageType = StorageType::S3;
    } else {
        throw std::runtime_error(std::format("Unsupported storage type: {}", storage));
    }
    s3FileBackupEnabled = configJson.get("s3_file_backup_enabled", false).asBool();
    emailFrom = configJson.get("email_from", "").asString();
    emailTo = configJson.get("email_to", "").asString();

    const Json::Value& log = configJson["log"];
    logDir = log.get("dir", (fs::path(backupDir) / "logs").string()).asString();
    auto level = Logger::parseLevel(log.get("level", "info").asString());
    if (!level) {
        throw std::runtime_error(level.error());
    }
    logLevel = *level;
    logMaxSizeMb = readPositive(log, "max_size_mb", 10);
    logBackupCount = log.get("backup_count", 5).asInt();

    if (configJson.isMember("s3")) {
        const Json::Value& section = configJson["s3"];
        if (auto endpoint = readEndpoint(section)) {
            S3BackupConfig s3Config;
            s3Config.endpoint = *endpoint;
            s3Config.backupPath = section.get("backup_path", "backups").asString();
            s3Config.maxBackups = readPositive(section, "max_backups", 5);
            s3Config.deleteLocalAfterUpload = section.get("delete_local_after_upload", false).asBool();
            s3 = s3Config;
        }
    }

    if (configJson.isMember("s3_work_storage")) {
        const Json::Value& section = configJson["s3_work_storage"];
        if (auto endpoint = readEndpoint(section)) {
            S3WorkStorageConfig workConfig;
            workConfig.endpoint = *endpoint;
            workConfig.backupFolder = section.get("backup_folder", "s3-work-file-storage").asString();
            workConfig.maxBackups = readPositive(section, "max_backups", 5);
            s3WorkStorage = workConfig;
        }
    }

    if (configJson.isMember("smtp")) {
        const Json::Value& section = configJson["smtp"];
        SmtpConfig smtpConfig;
        smtpConfig.server = section.get("server", "").asString();
        smtpConfig.port = section.get("port", 587).asInt();
        smtpConfig.username = section.get("username", "").asString();
        smtpConfig.password = section.get("password", "").asString();
        smtpConfig.useTls = section.get("use_tls", true).asBool();
        if (!smtpConfig.server.empty() && !smtpConfig.username.empty() && !smtpConfig.password.empty()) {
            smtp = smtpConfig;
        }
    }
}

std::expected<S3BackupConfig, std::string> BackupConfig::requireS3() const {
    if (!s3) {
        return std::unexpected("S3 backup storage is not configured (section 's3' is missing or incomplete)");
    }
    return *s3;
}

std::expected<S3WorkStorageConfig, std::string> BackupConfig::requireS3WorkStorage() const {
    if (!s3WorkStorage) {
        return std::unexpected("S3 work storage is not configured (section 's3_work_storage' is missing or incomplete)");
    }
    return *s3WorkStorage;
}

LogSettings BackupConfig::logSettings() const {
    LogSettings settings;
    settings.directory = logDir;
    settings.level = logLevel;
    settings.maxFileBytes = static_cast<std::uintmax_t>(logMaxSizeMb) * 1024 * 1024;
    settings.backupCount = logBackupCount;
    return settings;
}
