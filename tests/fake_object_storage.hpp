/**
 * @file fake_object_storage.hpp
 * @brief In-memory ObjectStorage used by the unit tests.
 *
 * Keeps objects in a sorted map, pages listings by a configurable page size, groups keys into
 * common prefixes when a delimiter is given, records multipart parts, and lets tests inject probe,
 * copy, delete and upload failures.
 */

#ifndef FAKE_OBJECT_STORAGE_HPP
#define FAKE_OBJECT_STORAGE_HPP

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "object_storage.hpp"

class FakeObjectStorage : public ObjectStorage {
public:
    explicit FakeObjectStorage(std::string name, std::size_t pageSize = 1000)
        : name(std::move(name)), pageSize(pageSize) {}

    const std::string& bucket() const override { return name; }

    void put(const std::string& key, std::uint64_t size, std::chrono::system_clock::time_point lastModified) {
        objects[key] = ObjectInfo{key, size, lastModified};
    }

    void put(const std::string& key, std::uint64_t size = 1) {
        clock += std::chrono::seconds(1);
        put(key, size, clock);
    }

    bool contains(const std::string& key) const { return objects.contains(key); }

    std::size_t countWithPrefix(const std::string& prefix) const {
        std::size_t count = 0;
        for (const auto& [key, object] : objects) {
            if (key.starts_with(prefix)) {
                ++count;
            }
        }
        return count;
    }

    std::expected<void, std::string> probe() override {
        ++probeCalls;
        if (!available) {
            return std::unexpected(std::format("Bucket does not exist: {}", name));
        }
        return {};
    }

    std::expected<ObjectPage, std::string> listObjectsPage(const std::string& prefix,
                                                           const std::string& delimiter,
                                                           const std::optional<std::string>& continuationToken) override {
        ++listCalls;
        if (failListing) {
            return std::unexpected("HTTP 500: InternalError: listing failed");
        }

        // Objects and grouped prefixes share one ordered sequence, as on a real service.
        std::vector<std::variant<ObjectInfo, std::string>> items;
        std::set<std::string> grouped;
        for (const auto& [key, object] : objects) {
            if (!key.starts_with(prefix)) {
                continue;
            }
            if (!delimiter.empty()) {
                auto pos = key.find(delimiter, prefix.size());
                if (pos != std::string::npos) {
                    std::string common = key.substr(0, pos + delimiter.size());
                    if (grouped.insert(common).second) {
                        items.emplace_back(common);
                    }
                    continue;
                }
            }
            items.emplace_back(object);
        }

        std::size_t start = continuationToken ? std::stoul(*continuationToken) : 0;
        std::size_t end = std::min(items.size(), start + pageSize);
        ObjectPage page;
        for (std::size_t i = start; i < end; ++i) {
            if (const auto* object = std::get_if<ObjectInfo>(&items[i])) {
                page.objects.push_back(*object);
            } else {
                page.commonPrefixes.push_back(std::get<std::string>(items[i]));
            }
        }
        if (end < items.size()) {
            page.nextContinuationToken = std::to_string(end);
        }
        return page;
    }

    std::expected<void, std::string> uploadFile(const std::string& localFile, const std::string& key,
                                                const std::map<std::string, std::string>& metadata) override {
        if (failUploads) {
            return std::unexpected("HTTP 403: AccessDenied: upload refused");
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(localFile, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to open file: {}", localFile));
        }
        put(key, size);
        uploadedMetadata[key] = metadata;
        return {};
    }

    std::expected<std::string, std::string> createMultipartUpload(const std::string& key,
                                                                  const std::map<std::string, std::string>& metadata) override {
        if (failUploads) {
            return std::unexpected("HTTP 403: AccessDenied: upload refused");
        }
        std::string uploadId = std::format("upload-{}", ++uploadCounter);
        pendingUploads[uploadId] = PendingUpload{key, metadata, 0};
        return uploadId;
    }

    std::expected<std::string, std::string> uploadPart(const std::string& key, const std::string& uploadId,
                                                       int partNumber, const std::string& localFile,
                                                       std::uint64_t offset, std::uint64_t length) override {
        auto it = pendingUploads.find(uploadId);
        if (it == pendingUploads.end() || it->second.key != key) {
            return std::unexpected(std::format("HTTP 404: NoSuchUpload: {}", uploadId));
        }
        if (failingPart && *failingPart == partNumber) {
            return std::unexpected("HTTP 500: InternalError: part failed");
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(localFile, ec);
        if (ec || offset + length > size) {
            return std::unexpected(std::format("Part {} out of range for {}", partNumber, localFile));
        }
        uploadedParts.push_back({partNumber, offset, length});
        it->second.bytes += length;
        return std::format("\"etag-{}\"", partNumber);
    }

    std::expected<void, std::string> completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                             const std::vector<CompletedPart>& parts) override {
        auto it = pendingUploads.find(uploadId);
        if (it == pendingUploads.end() || it->second.key != key) {
            return std::unexpected(std::format("HTTP 404: NoSuchUpload: {}", uploadId));
        }
        if (failCompletion) {
            return std::unexpected("HTTP 400: InvalidPart: completion refused");
        }
        completedParts = parts;
        put(key, it->second.bytes);
        uploadedMetadata[key] = it->second.metadata;
        pendingUploads.erase(it);
        return {};
    }

    std::expected<void, std::string> abortMultipartUpload(const std::string& key, const std::string& uploadId) override {
        auto it = pendingUploads.find(uploadId);
        if (it == pendingUploads.end() || it->second.key != key) {
            return std::unexpected(std::format("HTTP 404: NoSuchUpload: {}", uploadId));
        }
        pendingUploads.erase(it);
        abortedUploads.push_back(uploadId);
        return {};
    }

    std::expected<void, std::string> copyObject(const std::string& sourceBucket, const std::string& sourceKey,
                                                const std::string& destinationKey) override {
        if (failingCopies.contains(sourceKey)) {
            return std::unexpected("HTTP 500: InternalError: copy failed");
        }
        if (!copySource || copySource->bucket() != sourceBucket) {
            return std::unexpected(std::format("HTTP 404: NoSuchBucket: {}", sourceBucket));
        }
        auto it = copySource->objects.find(sourceKey);
        if (it == copySource->objects.end()) {
            return std::unexpected(std::format("HTTP 404: NoSuchKey: {}", sourceKey));
        }
        put(destinationKey, it->second.size);
        return {};
    }

    std::expected<void, std::string> deleteObject(const std::string& key) override {
        if (failingDeletes.contains(key)) {
            return std::unexpected(std::format("HTTP 403: AccessDenied: {}", key));
        }
        objects.erase(key);
        deletedKeys.push_back(key);
        return {};
    }

    std::expected<std::vector<std::string>, std::string> deleteObjects(const std::vector<std::string>& keys) override {
        if (keys.size() > kMaxDeleteBatch) {
            return std::unexpected("HTTP 400: MalformedXML: too many keys");
        }
        deleteBatchSizes.push_back(keys.size());
        std::vector<std::string> failed;
        for (const auto& key : keys) {
            if (failingDeletes.contains(key)) {
                failed.push_back(key);
                continue;
            }
            objects.erase(key);
            deletedKeys.push_back(key);
        }
        return failed;
    }

    struct PendingUpload {
        std::string key;
        std::map<std::string, std::string> metadata;
        std::uint64_t bytes = 0;
    };

    struct RecordedPart {
        int partNumber = 0;
        std::uint64_t offset = 0;
        std::uint64_t length = 0;

        bool operator==(const RecordedPart&) const = default;
    };

    std::string name;
    std::size_t pageSize;
    std::map<std::string, ObjectInfo> objects;
    const FakeObjectStorage* copySource = nullptr;
    bool available = true;
    bool failListing = false;
    bool failUploads = false;
    std::set<std::string> failingCopies;
    std::set<std::string> failingDeletes;
    std::vector<std::string> deletedKeys;
    std::vector<std::size_t> deleteBatchSizes;
    std::map<std::string, std::map<std::string, std::string>> uploadedMetadata;
    std::map<std::string, PendingUpload> pendingUploads;
    std::vector<RecordedPart> uploadedParts;
    std::vector<CompletedPart> completedParts;
    std::vector<std::string> abortedUploads;
    std::optional<int> failingPart;
    bool failCompletion = false;
    int uploadCounter = 0;
    int probeCalls = 0;
    int listCalls = 0;
    std::chrono::system_clock::time_point clock = std::chrono::system_clock::from_time_t(1700000000);
};

#endif // FAKE_OBJECT_STORAGE_HPP
