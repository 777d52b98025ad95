/**
 * @file mirror.hpp
 * @brief Copies a whole bucket into a dated folder of another bucket.
 */

#ifndef MIRROR_HPP
#define MIRROR_HPP

#include <string>
#include <expected>
#include <chrono>
#include "logger.hpp"
#include "object_storage.hpp"

/**
 * @brief Outcome of one mirror run.
 */
struct MirrorReport {
    std::string destinationFolder;  ///< Folder in the destination bucket, without a trailing '/'.
    StorageStats source;            ///< Source bucket contents after the copy.
    StorageStats destination;       ///< Destination folder contents after the copy.
    std::size_t copied = 0;         ///< Objects copied successfully.
    std::size_t failed = 0;         ///< Objects whose copy failed.

    /**
     * @brief A mirror is verified iff source and destination object counts are equal.
     */
    bool verified() const { return source.objectCount == destination.objectCount; }
};

/**
 * @brief Server-side copy of every object of a source bucket.
 *
 * Both buckets must answer the existence probe before anything is copied. Objects are copied
 * page by page to "<destinationFolder>/<key>". A failed copy is logged and skipped; nothing
 * already copied is ever deleted.
 */
class MirrorCopier {
public:
    /// Progress is logged after this many copied objects.
    static constexpr std::size_t kProgressInterval = 100;

    /**
     * @brief Constructs a copier.
     *
     * @param source Bucket to copy from.
     * @param destination Bucket to copy into.
     * @param logger Run logger.
     */
    MirrorCopier(ObjectStorage& source, ObjectStorage& destination, const Logger& logger);

    /**
     * @brief Copies the source bucket and recounts both sides.
     *
     * @param destinationFolder Destination folder.
     * @return std::expected<MirrorReport, std::string> The report (check verified()), or an error if a probe
     *         or a listing failed.
     */
    std::expected<MirrorReport, std::string> mirror(const std::string& destinationFolder);

    /**
     * @brief Snapshot folder name "<backupFolder>/YYYYMMDD_HHMMSS" for a point in time.
     */
    static std::string snapshotFolderName(const std::string& backupFolder,
                                          std::chrono::system_clock::time_point now);

private:
    ObjectStorage& source;
    ObjectStorage& destination;
    const Logger& logger;
};

#endif // MIRROR_HPP
