#include "backup.hpp"
#include "archive_writer.hpp"
#include "catalog_builder.hpp"
#include "mirror.hpp"
#include "retention.hpp"
#include "s3_storage.hpp"
#include "tree_classifier.hpp"
#include "utils.hpp"
#include <chrono>
#include <cstdlib>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Temporary directory removed with everything below it when destroyed.
 */
class StagingDirectory {
public:
    static std::expected<StagingDirectory, std::string> create(const std::string& prefix) {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(std::format("Failed to locate temporary directory: {}", ec.message()));
        }
        std::string pattern = (base / (prefix + "XXXXXX")).string();
        if (!mkdtemp(pattern.data())) {
            return std::unexpected(std::format("Failed to create staging directory in {}", base.string()));
        }
        return StagingDirectory(pattern);
    }

    StagingDirectory(StagingDirectory&& other) noexcept : dir(std::move(other.dir)) {
        other.dir.clear();
    }

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;
    StagingDirectory& operator=(StagingDirectory&&) = delete;

    ~StagingDirectory() {
        if (!dir.empty()) {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }
    }

    const fs::path& path() const { return dir; }

private:
    explicit StagingDirectory(fs::path dir) : dir(std::move(dir)) {}

    fs::path dir;
};

std::string fileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? "N/A" : formatHumanSize(size);
}

} // namespace

Backup::Backup(const std::string& configFile) : Backup(BackupConfig(configFile)) {}

Backup::Backup(BackupConfig config) : config(std::move(config)), logger(this->config.logSettings()) {
    dbStrategy = std::make_unique<MySQLBackupStrategy>(this->config.dbName, this->config.mysqlConfig);
    fileStrategy = std::make_unique<TarGzFileBackupStrategy>(ExclusionRules(this->config.excludePatterns), logger);
    notificationStrategies.push_back(std::make_unique<LogNotificationStrategy>(logger));
    if (this->config.smtp && !this->config.emailFrom.empty() && !this->config.emailTo.empty()) {
        notificationStrategies.push_back(std::make_unique<EmailNotificationStrategy>(
            *this->config.smtp, this->config.emailFrom, this->config.emailTo));
    }
    storageFactory = [](const S3Endpoint& endpoint) -> std::expected<std::shared_ptr<ObjectStorage>, std::string> {
        return std::make_shared<S3ObjectStorage>(endpoint);
    };
}

void Backup::setDatabaseStrategy(std::unique_ptr<DatabaseBackupStrategy> strategy) {
    dbStrategy = std::move(strategy);
}

void Backup::setStorageFactory(StorageFactory factory) {
    storageFactory = std::move(factory);
}

std::string Backup::archiveName(const std::string& timestamp) {
    return std::format("{}{}.tar.gz", kArchivePrefix, timestamp);
}

std::expected<std::shared_ptr<ObjectStorage>, std::string> Backup::connect(const S3Endpoint& endpoint) const {
    auto storage = storageFactory(endpoint);
    if (!storage) {
        return std::unexpected(storage.error());
    }
    auto probed = (*storage)->probe();
    if (!probed) {
        return std::unexpected(probed.error());
    }
    logger.info(std::format("Bucket is available: {}", endpoint.bucketName));
    return storage;
}

std::expected<std::string, std::string> Backup::run() {
    logger.info("========== BACKUP STARTED ==========");
    logger.info(std::format("SiteVault v{}", kSiteVaultVersion));
    mirrorFolder.clear();

    auto result = [this]() -> std::expected<std::string, std::string> {
        std::error_code ec;
        fs::create_directories(config.backupDir, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to create backup directory {}: {}", config.backupDir, ec.message()));
        }

        auto space = checkDiskSpace();
        if (!space) {
            return std::unexpected(space.error());
        }

        auto staging = StagingDirectory::create("sitevault_backup_");
        if (!staging) {
            return std::unexpected(staging.error());
        }
        const fs::path& stagingDir = staging->path();

        logger.info("Starting database backup...");
        auto dbResult = dbStrategy->execute(stagingDir.string());
        if (!dbResult) {
            return std::unexpected(std::format("Database backup failed: {}", dbResult.error()));
        }
        logger.info(std::format("Database backup created: {} ({})", baseName(*dbResult), fileSize(*dbResult)));

        logger.info("Starting site files backup...");
        fs::path siteArchive = stagingDir / "site_files.tar.gz";
        auto catalog = fileStrategy->execute(config.siteRoot, siteArchive.string());
        if (!catalog) {
            return std::unexpected(std::format("File backup failed: {}", catalog.error()));
        }
        logger.info(std::format("Included files/directories: {}", catalog->totals().includedCount()));
        logger.info(std::format("Excluded files/directories: {}", catalog->totals().excludedCount()));
        logger.info(std::format("Site files backup created: {}", fileSize(siteArchive)));

        logger.info("Starting system configuration backup...");
        std::vector<std::string> existingConfigs;
        for (const auto& path : config.systemConfigs) {
            if (fs::exists(fs::symlink_status(path, ec))) {
                existingConfigs.push_back(path);
            }
        }
        if (existingConfigs.empty()) {
            logger.info("No system configurations found to back up");
        } else {
            fs::path configArchive = stagingDir / "system_configs.tar.gz";
            auto archived = archivePaths(existingConfigs, configArchive.string(), logger);
            if (!archived) {
                return std::unexpected(std::format("System configuration backup failed: {}", archived.error()));
            }
            logger.info(std::format("System configuration backup created: {} ({} paths)", fileSize(configArchive), *archived));
        }

        auto info = createInfoFile(stagingDir);
        if (!info) {
            return std::unexpected(info.error());
        }

        logger.info("Creating backup file manifest...");
        ManifestInfo manifestInfo{currentTimestamp(), config.siteRoot, config.excludePatterns, std::string(kSiteVaultVersion)};
        auto written = CatalogBuilder::write(CatalogBuilder::build(*catalog, manifestInfo), stagingDir.string());
        if (!written) {
            return std::unexpected(std::format("Manifest creation failed: {}", written.error()));
        }
        logger.info(std::format("File manifest created: {} files, {} directories",
                                catalog->totals().includedFiles, catalog->totals().includedDirectories));

        std::string finalArchive = (fs::path(config.backupDir) / archiveName(currentTimestamp("%Y%m%d_%H%M%S"))).string();
        logger.info("Creating final backup archive...");
        auto packed = packDirectory(stagingDir.string(), finalArchive);
        if (!packed) {
            return std::unexpected(std::format("Final archive creation failed: {}", packed.error()));
        }
        logger.info(std::format("Final backup created: {} ({})", baseName(finalArchive), fileSize(finalArchive)));

        auto verified = verifyArchive(finalArchive);
        if (!verified) {
            return std::unexpected(std::format("Backup verification failed: {}", verified.error()));
        }
        logger.info(std::format("Backup verified: {} entries", *verified));
        return finalArchive;
    }();

    if (result) {
        auto stored = manageStorage(*result);
        if (!stored) {
            result = std::unexpected(std::format("Backup storage failed: {}", stored.error()));
        } else if (config.s3FileBackupEnabled) {
            auto mirrored = mirrorWorkStorage();
            if (!mirrored) {
                result = std::unexpected(std::format("Work storage backup failed: {}", mirrored.error()));
            }
        } else {
            logger.info("Work storage backup is disabled");
        }
    }

    if (result) {
        logger.info("========== BACKUP COMPLETED SUCCESSFULLY ==========");
        notify(true, *result);
    } else {
        logger.error(result.error());
        logger.info("========== BACKUP COMPLETED WITH ERRORS ==========");
        notify(false, "");
    }
    return result;
}

std::expected<void, std::string> Backup::checkDiskSpace() const {
    std::error_code ec;
    auto space = fs::space(config.backupDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to check disk space in {}: {}", config.backupDir, ec.message()));
    }
    std::uintmax_t availableKb = space.available / 1024;
    if (availableKb < config.minDiskSpaceKb) {
        return std::unexpected(std::format("Not enough disk space. Available: {}KB, required: {}KB",
                                           availableKb, config.minDiskSpaceKb));
    }
    logger.info(std::format("Disk space check: OK ({}KB available)", availableKb));
    return {};
}

std::expected<void, std::string> Backup::createInfoFile(const fs::path& stagingDir) const {
    std::string sizes;
    auto entries = listDirectory(stagingDir);
    if (!entries) {
        return std::unexpected(std::format("Failed to read staging directory: {}", entries.error()));
    }
    for (const auto& entry : *entries) {
        sizes += std::format("{}: {}\n", entry.path().filename().string(), fileSize(entry.path()));
    }

    std::string diskUsage = "N/A";
    std::error_code ec;
    auto space = fs::space(config.backupDir, ec);
    if (!ec) {
        diskUsage = std::format("{}: {} total, {} free", config.backupDir,
                                formatHumanSize(space.capacity), formatHumanSize(space.available));
    }

    fs::path infoPath = stagingDir / "backup_info.txt";
    std::ofstream file(infoPath);
    if (!file) {
        return std::unexpected(std::format("Failed to create info file: {}", infoPath.string()));
    }
    file << "SiteVault Backup Information\n"
         << "============================\n"
         << std::format("Backup Date: {}\n", currentTimestamp())
         << std::format("Server: {}\n", hostName())
         << std::format("OS Version: {}\n", osVersion())
         << std::format("Site Root: {}\n", config.siteRoot)
         << std::format("Database: {}\n", config.dbName)
         << std::format("Backup Version: {}\n\n", kSiteVaultVersion)
         << "Backup Contents:\n"
         << "- Database dump (SQL, gzip)\n"
         << "- Site files (exclusion patterns applied)\n"
         << "- System configurations\n"
         << "- File manifests (backup_manifest.json, backup_files_list.txt)\n\n"
         << "Disk Usage:\n"
         << diskUsage << "\n\n"
         << "Backup Size Summary:\n"
         << sizes;
    if (!file) {
        return std::unexpected(std::format("Failed to write info file: {}", infoPath.string()));
    }
    logger.info("Info file created");
    return {};
}

std::expected<void, std::string> Backup::manageStorage(const std::string& finalArchive) {
    RetentionRotator rotator(logger);

    if (config.storageType == StorageType::Local) {
        LocalRetentionDomain domain(config.backupDir, std::format("{}*.tar.gz", kArchivePrefix));
        auto rotated = rotator.rotate(domain, static_cast<std::size_t>(config.maxBackups));
        if (!rotated) {
            return std::unexpected(rotated.error());
        }
        return {};
    }

    auto s3 = config.requireS3();
    if (!s3) {
        return std::unexpected(s3.error());
    }
    auto storage = connect(s3->endpoint);
    if (!storage) {
        return std::unexpected(storage.error());
    }

    auto uploaded = uploadToS3(finalArchive, **storage, *s3);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }

    S3BackupRetentionDomain domain(**storage, std::format("{}/{}", s3->backupPath, kArchivePrefix));
    auto rotated = rotator.rotate(domain, static_cast<std::size_t>(s3->maxBackups));
    if (!rotated) {
        return std::unexpected(rotated.error());
    }

    if (s3->deleteLocalAfterUpload) {
        std::error_code ec;
        if (fs::remove(finalArchive, ec)) {
            logger.info(std::format("Local backup removed after upload: {}", baseName(finalArchive)));
        } else {
            logger.error(std::format("Failed to remove local backup {}: {}", finalArchive,
                                     ec ? ec.message() : std::string("file not found")));
        }
    }
    return {};
}

std::expected<void, std::string> Backup::uploadToS3(const std::string& finalArchive, ObjectStorage& storage,
                                                    const S3BackupConfig& s3) {
    std::string key = std::format("{}/{}", s3.backupPath, baseName(finalArchive));
    logger.info(std::format("Uploading {} ({}) to S3...", baseName(finalArchive), fileSize(finalArchive)));

    std::map<std::string, std::string> metadata{
        {"backup-version", std::string(kSiteVaultVersion)},
        {"created-timestamp", currentTimestamp("%Y-%m-%dT%H:%M:%S")},
        {"server-hostname", hostName()},
        {"site-root", config.siteRoot},
    };
    auto uploaded = storage.uploadFile(finalArchive, key, metadata);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }
    logger.info(std::format("Backup uploaded to s3://{}/{}", storage.bucket(), key));
    return {};
}

std::expected<void, std::string> Backup::mirrorWorkStorage() {
    if (config.storageType != StorageType::S3) {
        logger.info("Work storage backup requires storage_type \"s3\", skipping");
        return {};
    }

    auto s3 = config.requireS3();
    if (!s3) {
        return std::unexpected(s3.error());
    }
    auto work = config.requireS3WorkStorage();
    if (!work) {
        return std::unexpected(work.error());
    }

    logger.info("========== WORK STORAGE BACKUP STARTED ==========");
    auto destination = storageFactory(s3->endpoint);
    if (!destination) {
        return std::unexpected(destination.error());
    }
    auto source = storageFactory(work->endpoint);
    if (!source) {
        return std::unexpected(source.error());
    }

    std::string folder = MirrorCopier::snapshotFolderName(work->backupFolder, std::chrono::system_clock::now());
    MirrorCopier copier(**source, **destination, logger);
    auto report = copier.mirror(folder);
    if (!report) {
        return std::unexpected(report.error());
    }
    mirrorFolder = folder;

    if (!report->verified()) {
        return std::unexpected(std::format("Object count mismatch: source {}, copied {}",
                                           report->source.objectCount, report->destination.objectCount));
    }
    logger.info("Work storage snapshot verified");

    RetentionRotator rotator(logger);
    S3SnapshotRetentionDomain domain(**destination, work->backupFolder);
    auto rotated = rotator.rotate(domain, static_cast<std::size_t>(work->maxBackups));
    if (!rotated) {
        return std::unexpected(rotated.error());
    }
    logger.info("========== WORK STORAGE BACKUP COMPLETED ==========");
    return {};
}

void Backup::notify(bool success, const std::string& finalArchive) {
    std::string subject;
    std::string message;
    std::string now = currentTimestamp();

    if (success) {
        subject = "SiteVault Backup - Success";
        std::string storage;
        if (config.storageType == StorageType::S3 && config.s3) {
            storage = std::format("Storage: S3\nS3 path: s3://{}/{}/{}\nLocal path: {}\n",
                                  config.s3->endpoint.bucketName, config.s3->backupPath, baseName(finalArchive), finalArchive);
        } else {
            storage = std::format("Storage: local\nBackup path: {}\n", finalArchive);
        }
        if (!mirrorFolder.empty() && config.s3 && config.s3WorkStorage) {
            storage += std::format("Work storage: s3://{}/ -> s3://{}/{}/\n",
                                   config.s3WorkStorage->endpoint.bucketName, config.s3->endpoint.bucketName, mirrorFolder);
        }
        message = std::format("Backup completed successfully.\n\n"
                              "Backup file: {}\nSize: {}\nTime: {}\nServer: {}\n{}Log: {}\n",
                              baseName(finalArchive), fileSize(finalArchive), now, hostName(), storage,
                              logger.logFilePath().empty() ? "console" : logger.logFilePath());
    } else {
        subject = "SiteVault Backup - Error";
        message = std::format("The backup failed.\n\nTime: {}\nServer: {}\n\nSee the log for details: {}\n",
                              now, hostName(), logger.logFilePath().empty() ? "console" : logger.logFilePath());
    }

    for (const auto& strategy : notificationStrategies) {
        auto sent = strategy->notify(subject, message);
        if (!sent) {
            logger.error(std::format("Notification failed: {}", sent.error()));
        }
    }
}

std::expected<void, std::string> Backup::uploadSingleFile(const std::string& filePath) {
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        return std::unexpected(std::format("File not found: {}", filePath));
    }

    auto s3 = config.requireS3();
    if (!s3) {
        return std::unexpected(s3.error());
    }
    auto storage = connect(s3->endpoint);
    if (!storage) {
        return std::unexpected(storage.error());
    }

    std::string key = std::format("{}/{}", s3->backupPath, baseName(filePath));
    logger.info(std::format("File: {}", baseName(filePath)));
    logger.info(std::format("Size: {}", fileSize(filePath)));
    logger.info(std::format("S3 key: {}", key));

    std::map<std::string, std::string> metadata{
        {"backup-version", std::string(kSiteVaultVersion)},
        {"uploaded-timestamp", currentTimestamp("%Y-%m-%dT%H:%M:%S")},
        {"server-hostname", hostName()},
        {"manual-upload", "true"},
    };
    auto uploaded = (*storage)->uploadFile(filePath, key, metadata);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }
    logger.info(std::format("File uploaded to s3://{}/{}", (*storage)->bucket(), key));
    return {};
}
