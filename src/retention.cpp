#include "retention.hpp"
#include "tree_classifier.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fnmatch.h>

namespace fs = std::filesystem;

LocalRetentionDomain::LocalRetentionDomain(std::string directory, std::string pattern)
    : directory(std::move(directory)), pattern(std::move(pattern)) {}

std::string LocalRetentionDomain::description() const {
    return std::format("local backups in {}", directory);
}

std::expected<std::vector<RetentionCandidate>, std::string> LocalRetentionDomain::listCandidates() {
    auto entries = listDirectory(directory);
    if (!entries) {
        return std::unexpected(std::format("Failed to read directory {}: {}", directory, entries.error()));
    }

    std::vector<RetentionCandidate> candidates;
    for (const auto& entry : *entries) {
        std::string name = entry.path().filename().string();
        std::error_code ec;
        if (!entry.is_regular_file(ec) || fnmatch(pattern.c_str(), name.c_str(), FNM_NOESCAPE) != 0) {
            continue;
        }
        auto lastWrite = entry.last_write_time(ec);
        if (ec) {
            return std::unexpected(std::format("Failed to read modification time of {}: {}", entry.path().string(), ec.message()));
        }
        candidates.push_back({entry.path().string(), toSystemTime(lastWrite)});
    }
    return candidates;
}

std::expected<void, std::string> LocalRetentionDomain::remove(const RetentionCandidate& candidate) {
    std::error_code ec;
    if (!fs::remove(candidate.name, ec) || ec) {
        return std::unexpected(std::format("Failed to delete {}: {}", candidate.name,
                                           ec ? ec.message() : std::string("file not found")));
    }
    return {};
}

S3BackupRetentionDomain::S3BackupRetentionDomain(ObjectStorage& storage, std::string keyPrefix)
    : storage(storage), keyPrefix(std::move(keyPrefix)) {}

std::string S3BackupRetentionDomain::description() const {
    return std::format("backups in s3://{}/{}*", storage.bucket(), keyPrefix);
}

std::expected<std::vector<RetentionCandidate>, std::string> S3BackupRetentionDomain::listCandidates() {
    auto listing = listAllObjects(storage, keyPrefix, "/");
    if (!listing) {
        return std::unexpected(listing.error());
    }
    std::vector<RetentionCandidate> candidates;
    for (const auto& object : listing->objects) {
        candidates.push_back({object.key, object.lastModified});
    }
    return candidates;
}

std::expected<void, std::string> S3BackupRetentionDomain::remove(const RetentionCandidate& candidate) {
    return storage.deleteObject(candidate.name);
}

S3SnapshotRetentionDomain::S3SnapshotRetentionDomain(ObjectStorage& storage, std::string folder)
    : storage(storage), folder(std::move(folder)) {}

std::string S3SnapshotRetentionDomain::description() const {
    return std::format("snapshots in s3://{}/{}/", storage.bucket(), folder);
}

bool S3SnapshotRetentionDomain::isSnapshotFolderName(const std::string& name) {
    if (name.size() != 15) {
        return false;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        bool valid = i == 8 ? name[i] == '_' : std::isdigit(static_cast<unsigned char>(name[i])) != 0;
        if (!valid) {
            return false;
        }
    }
    return true;
}

std::expected<std::vector<RetentionCandidate>, std::string> S3SnapshotRetentionDomain::listCandidates() {
    auto listing = listAllObjects(storage, folder + "/", "/");
    if (!listing) {
        return std::unexpected(listing.error());
    }

    std::vector<RetentionCandidate> candidates;
    for (std::string prefix : listing->commonPrefixes) {
        while (prefix.ends_with('/')) {
            prefix.pop_back();
        }
        std::string name = baseName(prefix);
        if (!isSnapshotFolderName(name)) {
            continue;
        }
        auto timestamp = parseLocalTime(name, "%Y%m%d_%H%M%S");
        if (!timestamp) {
            continue;
        }
        candidates.push_back({name, *timestamp});
    }
    return candidates;
}

std::expected<void, std::string> S3SnapshotRetentionDomain::remove(const RetentionCandidate& candidate) {
    std::string prefix = std::format("{}/{}/", folder, candidate.name);
    auto listing = listAllObjects(storage, prefix);
    if (!listing) {
        return std::unexpected(listing.error());
    }

    std::vector<std::string> keys;
    for (const auto& object : listing->objects) {
        keys.push_back(object.key);
    }

    std::vector<std::string> failed;
    for (std::size_t start = 0; start < keys.size(); start += ObjectStorage::kMaxDeleteBatch) {
        std::size_t end = std::min(keys.size(), start + ObjectStorage::kMaxDeleteBatch);
        std::vector<std::string> batch(keys.begin() + start, keys.begin() + end);
        auto result = storage.deleteObjects(batch);
        if (!result) {
            return std::unexpected(std::format("Failed to delete snapshot {}: {}", candidate.name, result.error()));
        }
        failed.insert(failed.end(), result->begin(), result->end());
    }

    if (!failed.empty()) {
        return std::unexpected(std::format("Failed to delete {} of {} objects in snapshot {}",
                                           failed.size(), keys.size(), candidate.name));
    }
    return {};
}

RetentionRotator::RetentionRotator(const Logger& logger) : logger(logger) {}

std::vector<RetentionCandidate> RetentionRotator::selectExpired(std::vector<RetentionCandidate> candidates, std::size_t maxKeep) {
    if (candidates.size() <= maxKeep) {
        return {};
    }
    std::ranges::stable_sort(candidates, {}, &RetentionCandidate::timestamp);
    candidates.resize(candidates.size() - maxKeep);
    return candidates;
}

std::expected<std::size_t, std::string> RetentionRotator::rotate(RetentionDomain& domain, std::size_t maxKeep) const {
    auto candidates = domain.listCandidates();
    if (!candidates) {
        return std::unexpected(std::format("Failed to list {}: {}", domain.description(), candidates.error()));
    }

    std::size_t count = candidates->size();
    auto expired = selectExpired(std::move(*candidates), maxKeep);
    if (expired.empty()) {
        logger.info(std::format("Backups in {}: {} (maximum: {})", domain.description(), count, maxKeep));
        return 0;
    }

    logger.info(std::format("Found {} backups in {}, removing {} oldest", count, domain.description(), expired.size()));
    std::size_t removed = 0;
    std::vector<std::string> failures;
    for (const auto& candidate : expired) {
        auto result = domain.remove(candidate);
        if (result) {
            ++removed;
            logger.info(std::format("Removed old backup: {}", baseName(candidate.name)));
        } else {
            logger.error(result.error());
            failures.push_back(candidate.name);
        }
    }

    if (!failures.empty()) {
        std::string names;
        for (const auto& name : failures) {
            names += names.empty() ? name : ", " + name;
        }
        return std::unexpected(std::format("Rotation of {} failed for: {}", domain.description(), names));
    }
    return removed;
}
