/**
 * @file object_storage.hpp
 * @brief Defines the object storage interface used for remote backups.
 *
 * Provides the contract for S3-compatible buckets (listing, upload, server-side copy, deletion)
 * and helpers built on top of it. Retention and mirroring only talk to this interface.
 */

#ifndef OBJECT_STORAGE_HPP
#define OBJECT_STORAGE_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <expected>
#include <chrono>
#include <cstdint>

/**
 * @brief One stored object as reported by a listing.
 */
struct ObjectInfo {
    std::string key;                                    ///< Object key.
    std::uint64_t size = 0;                             ///< Size in bytes.
    std::chrono::system_clock::time_point lastModified; ///< Last modification time.

    bool operator==(const ObjectInfo&) const = default;
};

/**
 * @brief One page of a bucket listing.
 */
struct ObjectPage {
    std::vector<ObjectInfo> objects;                    ///< Objects on this page.
    std::vector<std::string> commonPrefixes;            ///< Grouped prefixes when a delimiter is used.
    std::optional<std::string> nextContinuationToken;   ///< Token for the next page, absent on the last one.
};

/**
 * @brief Object count and total size under a prefix.
 */
struct StorageStats {
    std::size_t objectCount = 0;
    std::uint64_t totalBytes = 0;

    bool operator==(const StorageStats&) const = default;
};

/**
 * @brief One uploaded part of a multipart upload.
 */
struct CompletedPart {
    int partNumber = 0;     ///< 1-based part number.
    std::string etag;       ///< ETag returned for the part.

    bool operator==(const CompletedPart&) const = default;
};

/**
 * @brief Interface for object storage backends.
 *
 * Defines the contract for an S3-compatible bucket.
 */
class ObjectStorage {
public:
    /// Largest number of keys a single bulk delete may carry.
    static constexpr std::size_t kMaxDeleteBatch = 1000;
    /// Files larger than this are uploaded in parts.
    static constexpr std::uint64_t kMultipartThreshold = 8ULL * 1024 * 1024;
    /// Smallest part size the service accepts (except for the last part).
    static constexpr std::uint64_t kMinPartSize = 8ULL * 1024 * 1024;
    /// Largest number of parts in one multipart upload.
    static constexpr std::uint64_t kMaxParts = 10000;

    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ObjectStorage() = default;

    /**
     * @brief Name of the bucket this storage talks to.
     */
    virtual const std::string& bucket() const = 0;

    /**
     * @brief Checks that the bucket exists and is accessible.
     *
     * @return std::expected<void, std::string> Success, or an error naming the cause (missing bucket, access denied, connection failure).
     */
    virtual std::expected<void, std::string> probe() = 0;

    /**
     * @brief Lists one page of objects.
     *
     * @param prefix Key prefix to list.
     * @param delimiter Grouping delimiter, empty for a flat listing.
     * @param continuationToken Token returned by the previous page.
     * @return std::expected<ObjectPage, std::string> The page or an error message.
     */
    virtual std::expected<ObjectPage, std::string> listObjectsPage(const std::string& prefix,
                                                                   const std::string& delimiter,
                                                                   const std::optional<std::string>& continuationToken) = 0;

    /**
     * @brief Uploads a local file.
     *
     * @param localFile Path of the file to upload.
     * @param key Destination key.
     * @param metadata User metadata stored with the object.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> uploadFile(const std::string& localFile, const std::string& key,
                                                        const std::map<std::string, std::string>& metadata) = 0;

    /**
     * @brief Starts a multipart upload.
     *
     * @param key Destination key.
     * @param metadata User metadata stored with the completed object.
     * @return std::expected<std::string, std::string> The upload ID or an error message.
     */
    virtual std::expected<std::string, std::string> createMultipartUpload(const std::string& key,
                                                                          const std::map<std::string, std::string>& metadata) = 0;

    /**
     * @brief Uploads bytes [offset, offset + length) of a local file as one part.
     *
     * @return std::expected<std::string, std::string> The part's ETag or an error message.
     */
    virtual std::expected<std::string, std::string> uploadPart(const std::string& key, const std::string& uploadId,
                                                               int partNumber, const std::string& localFile,
                                                               std::uint64_t offset, std::uint64_t length) = 0;

    /**
     * @brief Assembles the uploaded parts into the final object.
     */
    virtual std::expected<void, std::string> completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                                     const std::vector<CompletedPart>& parts) = 0;

    /**
     * @brief Discards a multipart upload and the parts stored so far.
     */
    virtual std::expected<void, std::string> abortMultipartUpload(const std::string& key, const std::string& uploadId) = 0;

    /**
     * @brief Copies an object from another bucket of the same service into this one.
     *
     * Source metadata is preserved.
     *
     * @param sourceBucket Bucket holding the source object.
     * @param sourceKey Source key.
     * @param destinationKey Key in this bucket.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> copyObject(const std::string& sourceBucket, const std::string& sourceKey,
                                                        const std::string& destinationKey) = 0;

    /**
     * @brief Deletes one object.
     */
    virtual std::expected<void, std::string> deleteObject(const std::string& key) = 0;

    /**
     * @brief Deletes up to kMaxDeleteBatch objects in one request.
     *
     * @param keys Keys to delete.
     * @return std::expected<std::vector<std::string>, std::string> Keys the service failed to delete (empty when all
     *         succeeded), or an error if the request itself failed.
     */
    virtual std::expected<std::vector<std::string>, std::string> deleteObjects(const std::vector<std::string>& keys) = 0;
};

/**
 * @brief Lists every object under a prefix, following continuation tokens.
 *
 * @param storage Storage to list.
 * @param prefix Key prefix.
 * @param delimiter Grouping delimiter, empty for a flat listing.
 * @return std::expected<ObjectPage, std::string> All objects and common prefixes, or the first page error.
 */
std::expected<ObjectPage, std::string> listAllObjects(ObjectStorage& storage, const std::string& prefix,
                                                      const std::string& delimiter = "");

/**
 * @brief Part size for a multipart upload of fileSize bytes.
 *
 * kMinPartSize, grown in whole MiB when the file would otherwise need more than kMaxParts parts.
 */
std::uint64_t multipartPartSize(std::uint64_t fileSize);

/**
 * @brief Uploads a local file as a multipart upload.
 *
 * Parts are sent in order. The upload is aborted if any part or the completion fails.
 *
 * @param storage Destination storage.
 * @param localFile Path of the file to upload.
 * @param key Destination key.
 * @param metadata User metadata stored with the object.
 * @param partSize Size of every part except the last.
 * @return std::expected<void, std::string> Success or the first error.
 */
std::expected<void, std::string> uploadFileInParts(ObjectStorage& storage, const std::string& localFile,
                                                   const std::string& key,
                                                   const std::map<std::string, std::string>& metadata,
                                                   std::uint64_t partSize);

/**
 * @brief Counts objects and bytes under a prefix.
 */
std::expected<StorageStats, std::string> storageStats(ObjectStorage& storage, const std::string& prefix);

#endif // OBJECT_STORAGE_HPP
