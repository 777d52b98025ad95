/**
 * @file file_backup.cpp
 * @brief File backup strategy implementation for SiteVault.
 */

#include "file_backup.hpp"
#include "archive_writer.hpp"
#include "tree_classifier.hpp"
#include "utils.hpp"
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

TarGzFileBackupStrategy::TarGzFileBackupStrategy(ExclusionRules rules, const Logger& logger)
    : rules(std::move(rules)), logger(logger) {}

std::expected<Catalog, std::string> TarGzFileBackupStrategy::execute(const std::string& sourceDir,
                                                                     const std::string& outputFile) {
    logger.info(std::format("Starting file backup of {} to {}", sourceDir, outputFile));

    auto writer = TarGzArchiveWriter::open(outputFile);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    fs::path root = fs::path(sourceDir).lexically_normal();
    if (!root.has_filename() && root != root.root_path()) {
        root = root.parent_path();
    }
    std::string prefix = root.filename().string();

    std::size_t skipped = 0;
    auto visitor = [&](const CatalogEntry& entry, const fs::path& absolutePath) -> std::expected<void, std::string> {
        std::string archiveName = prefix.empty() ? entry.relativePath : std::format("{}/{}", prefix, entry.relativePath);
        auto status = (*writer)->addEntry(absolutePath, archiveName);
        if (!status) {
            return std::unexpected(status.error());
        }
        if (*status == EntryStatus::Skipped) {
            ++skipped;
            logger.warning(std::format("Skipped unreadable or special entry: {}", absolutePath.string()));
        }
        return {};
    };

    TreeClassifier classifier(rules);
    auto catalog = classifier.classify(root, visitor);
    if (!catalog) {
        return std::unexpected(catalog.error());
    }

    auto closed = (*writer)->close();
    if (!closed) {
        return std::unexpected(closed.error());
    }

    const auto& totals = catalog->totals();
    logger.info(std::format("File backup completed: {} ({} entries archived, {} skipped, {} excluded, {} errors)",
                            outputFile, (*writer)->entryCount(), skipped, totals.excludedCount(), totals.errors));
    return catalog;
}

std::expected<std::size_t, std::string> archivePaths(const std::vector<std::string>& paths,
                                                     const std::string& outputFile,
                                                     const Logger& logger) {
    auto writer = TarGzArchiveWriter::open(outputFile);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    std::size_t archived = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            logger.warning(std::format("Path does not exist, skipping: {}", path));
            continue;
        }
        std::string archiveName = normalizeSeparators(path);
        while (archiveName.starts_with('/')) {
            archiveName.erase(0, 1);
        }
        auto skipped = (*writer)->addTree(path, archiveName);
        if (!skipped) {
            return std::unexpected(skipped.error());
        }
        if (*skipped > 0) {
            logger.warning(std::format("{} unreadable entries skipped under {}", *skipped, path));
        }
        ++archived;
    }

    auto closed = (*writer)->close();
    if (!closed) {
        return std::unexpected(closed.error());
    }
    return archived;
}

std::expected<void, std::string> packDirectory(const std::string& directory, const std::string& outputFile) {
    auto children = listDirectory(directory);
    if (!children) {
        return std::unexpected(std::format("Failed to read directory {}: {}", directory, children.error()));
    }

    auto writer = TarGzArchiveWriter::open(outputFile);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    for (const auto& child : *children) {
        auto skipped = (*writer)->addTree(child.path(), child.path().filename().string());
        if (!skipped) {
            return std::unexpected(skipped.error());
        }
        if (*skipped > 0) {
            return std::unexpected(std::format("Failed to read {}", child.path().string()));
        }
    }
    return (*writer)->close();
}
