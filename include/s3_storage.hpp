/**
 * @file s3_storage.hpp
 * @brief S3-compatible object storage over libcurl.
 *
 * Requests use path-style URLs (<endpoint>/<bucket>/<key>) and are signed with AWS Signature
 * Version 4 by libcurl itself. Payloads are sent unsigned.
 *
 * @note Requires libcurl 7.75 or later (CURLOPT_AWS_SIGV4) and OpenSSL for Content-MD5.
 */

#ifndef S3_STORAGE_HPP
#define S3_STORAGE_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <expected>
#include <cstdio>
#include <cstdint>
#include "object_storage.hpp"
#include "backup_config.hpp"

/**
 * @brief Object storage backed by an S3-compatible service.
 */
class S3ObjectStorage : public ObjectStorage {
public:
    /**
     * @brief Constructs a client for one bucket.
     *
     * @param endpoint Service URL, bucket and credentials.
     */
    explicit S3ObjectStorage(const S3Endpoint& endpoint);

    const std::string& bucket() const override { return bucket_; }

    /**
     * @brief Sends HEAD <bucket>. 404 and 403 are reported as a missing bucket and denied access.
     */
    std::expected<void, std::string> probe() override;

    std::expected<ObjectPage, std::string> listObjectsPage(const std::string& prefix,
                                                           const std::string& delimiter,
                                                           const std::optional<std::string>& continuationToken) override;

    /**
     * @brief Uploads a file, storing metadata as x-amz-meta-* headers.
     *
     * Files up to kMultipartThreshold go in a single PUT; larger ones through uploadFileInParts().
     */
    std::expected<void, std::string> uploadFile(const std::string& localFile, const std::string& key,
                                                const std::map<std::string, std::string>& metadata) override;

    /**
     * @brief POST <key>?uploads with the metadata headers.
     */
    std::expected<std::string, std::string> createMultipartUpload(const std::string& key,
                                                                  const std::map<std::string, std::string>& metadata) override;

    /**
     * @brief PUT <key>?partNumber=N&uploadId=ID with a slice of the file as body.
     */
    std::expected<std::string, std::string> uploadPart(const std::string& key, const std::string& uploadId,
                                                       int partNumber, const std::string& localFile,
                                                       std::uint64_t offset, std::uint64_t length) override;

    /**
     * @brief POST <key>?uploadId=ID with the part list.
     *
     * A 200 response carrying an error document is treated as a failure.
     */
    std::expected<void, std::string> completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                             const std::vector<CompletedPart>& parts) override;

    std::expected<void, std::string> abortMultipartUpload(const std::string& key, const std::string& uploadId) override;

    /**
     * @brief Server-side copy (PUT with x-amz-copy-source, metadata directive COPY).
     *
     * A 200 response carrying an error document is treated as a failure.
     */
    std::expected<void, std::string> copyObject(const std::string& sourceBucket, const std::string& sourceKey,
                                                const std::string& destinationKey) override;

    std::expected<void, std::string> deleteObject(const std::string& key) override;

    /**
     * @brief Quiet DeleteObjects request (POST ?delete) with a Content-MD5 header.
     */
    std::expected<std::vector<std::string>, std::string> deleteObjects(const std::vector<std::string>& keys) override;

    /**
     * @brief URL of an object, with the key percent-encoded segment by segment.
     */
    std::string objectUrl(const std::string& key) const;

    /**
     * @brief URL of one part of a multipart upload.
     */
    std::string partUrl(const std::string& key, const std::string& uploadId, int partNumber) const;

    /**
     * @brief ListObjectsV2 URL with its query parameters in sorted order.
     */
    std::string listUrl(const std::string& prefix, const std::string& delimiter,
                        const std::optional<std::string>& continuationToken) const;

    /**
     * @brief Percent-encodes every character outside the RFC 3986 unreserved set.
     *
     * @param value Text to encode.
     * @param keepSlash Leave '/' unencoded (object keys).
     */
    static std::string uriEncode(const std::string& value, bool keepSlash);

private:
    struct Response {
        long status = 0;
        std::string body;
        std::map<std::string, std::string> headers;  ///< Response headers, names lowercased.
    };

    /**
     * @brief Request description passed to perform().
     */
    struct Request {
        std::string method;
        std::string url;
        std::vector<std::string> headers;
        const std::string* body = nullptr;  ///< In-memory body (POST).
        std::FILE* upload = nullptr;        ///< File body (PUT).
        std::uint64_t uploadOffset = 0;     ///< Offset of the body within the file.
        std::uint64_t uploadSize = 0;       ///< Size of the file body.
    };

    std::expected<Response, std::string> perform(const Request& request) const;
    std::expected<void, std::string> putFile(const std::string& localFile, const std::string& key,
                                             const std::map<std::string, std::string>& metadata);

    std::string endpointUrl_;   ///< Service URL without a trailing '/'.
    std::string bucket_;        ///< Bucket name.
    std::string accessKey_;     ///< Access key ID.
    std::string secretKey_;     ///< Secret access key.
    std::string region_;        ///< Signing region.
};

#endif // S3_STORAGE_HPP
