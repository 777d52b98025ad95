/**
 * @file retention.hpp
 * @brief Bounded retention of backups on local disk and in object storage.
 *
 * One rotation algorithm works over three kinds of storage: packaged backups in the local
 * backup directory, packaged backups in the backup bucket, and dated snapshot folders produced
 * by the bucket mirror. Each kind is a RetentionDomain that lists its candidates and removes one.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <string>
#include <vector>
#include <expected>
#include <chrono>
#include "logger.hpp"
#include "object_storage.hpp"

/**
 * @brief One retained item: a file, an object key, or a snapshot folder name.
 */
struct RetentionCandidate {
    std::string name;                                   ///< Handle used for removal.
    std::chrono::system_clock::time_point timestamp;    ///< Age used for ordering.

    bool operator==(const RetentionCandidate&) const = default;
};

/**
 * @brief Interface for a set of backups sharing one naming convention and one backend.
 */
class RetentionDomain {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RetentionDomain() = default;

    /**
     * @brief Human-readable description used in log messages.
     */
    virtual std::string description() const = 0;

    /**
     * @brief Lists every member of the set, in any order.
     */
    virtual std::expected<std::vector<RetentionCandidate>, std::string> listCandidates() = 0;

    /**
     * @brief Removes one member.
     */
    virtual std::expected<void, std::string> remove(const RetentionCandidate& candidate) = 0;
};

/**
 * @brief Backup archives in a local directory, ordered by modification time.
 */
class LocalRetentionDomain : public RetentionDomain {
public:
    /**
     * @brief Constructs a local domain.
     *
     * @param directory Directory holding the archives.
     * @param pattern Glob matched against file names.
     */
    LocalRetentionDomain(std::string directory, std::string pattern);

    std::string description() const override;
    std::expected<std::vector<RetentionCandidate>, std::string> listCandidates() override;
    std::expected<void, std::string> remove(const RetentionCandidate& candidate) override;

private:
    std::string directory;
    std::string pattern;
};

/**
 * @brief Backup archives in a bucket, selected by key prefix and ordered by LastModified.
 *
 * Only objects directly under the prefix's folder are considered (listing uses the '/' delimiter).
 */
class S3BackupRetentionDomain : public RetentionDomain {
public:
    /**
     * @brief Constructs a bucket domain.
     *
     * @param storage Backup bucket.
     * @param keyPrefix Key prefix, e.g. "backups/sitevault_backup_".
     */
    S3BackupRetentionDomain(ObjectStorage& storage, std::string keyPrefix);

    std::string description() const override;
    std::expected<std::vector<RetentionCandidate>, std::string> listCandidates() override;
    std::expected<void, std::string> remove(const RetentionCandidate& candidate) override;

private:
    ObjectStorage& storage;
    std::string keyPrefix;
};

/**
 * @brief Dated mirror snapshot folders "<folder>/YYYYMMDD_HHMMSS/" in a bucket.
 *
 * Folders are ordered by the timestamp in their name. Removing a folder deletes every object
 * below it in batches of at most ObjectStorage::kMaxDeleteBatch keys.
 */
class S3SnapshotRetentionDomain : public RetentionDomain {
public:
    /**
     * @brief Constructs a snapshot domain.
     *
     * @param storage Backup bucket.
     * @param folder Folder holding the snapshots, without a trailing '/'.
     */
    S3SnapshotRetentionDomain(ObjectStorage& storage, std::string folder);

    std::string description() const override;
    std::expected<std::vector<RetentionCandidate>, std::string> listCandidates() override;
    std::expected<void, std::string> remove(const RetentionCandidate& candidate) override;

    /**
     * @brief Whether a folder name has the snapshot shape YYYYMMDD_HHMMSS.
     *
     * The name must be 15 characters with the only '_' at index 8 and digits elsewhere.
     */
    static bool isSnapshotFolderName(const std::string& name);

private:
    ObjectStorage& storage;
    std::string folder;
};

/**
 * @brief Keeps at most N most recent members of a retention domain.
 */
class RetentionRotator {
public:
    explicit RetentionRotator(const Logger& logger);

    /**
     * @brief Selects the members to remove.
     *
     * Candidates are stable-sorted oldest first; when there are more than maxKeep, the
     * count - maxKeep oldest are returned.
     *
     * @param candidates Members in any order.
     * @param maxKeep Number of members to keep.
     * @return std::vector<RetentionCandidate> Members to remove, oldest first.
     */
    static std::vector<RetentionCandidate> selectExpired(std::vector<RetentionCandidate> candidates, std::size_t maxKeep);

    /**
     * @brief Removes the expired members of a domain.
     *
     * Every removal is attempted once. Failures are logged and reported together.
     *
     * @param domain Domain to rotate.
     * @param maxKeep Number of members to keep.
     * @return std::expected<std::size_t, std::string> Number of members removed, or an error naming the failures.
     */
    std::expected<std::size_t, std::string> rotate(RetentionDomain& domain, std::size_t maxKeep) const;

private:
    const Logger& logger;
};

#endif // RETENTION_HPP
