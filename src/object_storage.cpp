#include "object_storage.hpp"
#include <filesystem>
#include <format>
#include <algorithm>

namespace fs = std::filesystem;

std::expected<ObjectPage, std::string> listAllObjects(ObjectStorage& storage, const std::string& prefix,
                                                      const std::string& delimiter) {
    ObjectPage all;
    std::optional<std::string> token;
    do {
        auto page = storage.listObjectsPage(prefix, delimiter, token);
        if (!page) {
            return std::unexpected(page.error());
        }
        all.objects.insert(all.objects.end(), page->objects.begin(), page->objects.end());
        all.commonPrefixes.insert(all.commonPrefixes.end(), page->commonPrefixes.begin(), page->commonPrefixes.end());
        token = page->nextContinuationToken;
    } while (token);
    return all;
}

std::expected<StorageStats, std::string> storageStats(ObjectStorage& storage, const std::string& prefix) {
    StorageStats stats;
    std::optional<std::string> token;
    do {
        auto page = storage.listObjectsPage(prefix, "", token);
        if (!page) {
            return std::unexpected(page.error());
        }
        for (const auto& object : page->objects) {
            ++stats.objectCount;
            stats.totalBytes += object.size;
        }
        token = page->nextContinuationToken;
    } while (token);
    return stats;
}

std::uint64_t multipartPartSize(std::uint64_t fileSize) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    std::uint64_t needed = (fileSize + ObjectStorage::kMaxParts - 1) / ObjectStorage::kMaxParts;
    needed = (needed + kMiB - 1) / kMiB * kMiB;
    return std::max(ObjectStorage::kMinPartSize, needed);
}

std::expected<void, std::string> uploadFileInParts(ObjectStorage& storage, const std::string& localFile,
                                                   const std::string& key,
                                                   const std::map<std::string, std::string>& metadata,
                                                   std::uint64_t partSize) {
    std::error_code ec;
    auto size = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to open local file {}: {}", localFile, ec.message()));
    }
    if (partSize == 0) {
        return std::unexpected("Multipart part size must be positive");
    }

    auto uploadId = storage.createMultipartUpload(key, metadata);
    if (!uploadId) {
        return std::unexpected(std::format("Failed to start multipart upload of {}: {}", key, uploadId.error()));
    }

    auto abortWith = [&](const std::string& error) -> std::expected<void, std::string> {
        if (auto aborted = storage.abortMultipartUpload(key, *uploadId); !aborted) {
            return std::unexpected(std::format("{} (abort also failed: {})", error, aborted.error()));
        }
        return std::unexpected(error);
    };

    std::vector<CompletedPart> parts;
    std::uint64_t offset = 0;
    int partNumber = 1;
    do {
        std::uint64_t length = std::min(partSize, size - offset);
        auto etag = storage.uploadPart(key, *uploadId, partNumber, localFile, offset, length);
        if (!etag) {
            return abortWith(std::format("Failed to upload part {} of {}: {}", partNumber, key, etag.error()));
        }
        parts.push_back({partNumber, *etag});
        offset += length;
        ++partNumber;
    } while (offset < size);

    if (auto completed = storage.completeMultipartUpload(key, *uploadId, parts); !completed) {
        return abortWith(std::format("Failed to complete multipart upload of {}: {}", key, completed.error()));
    }
    return {};
}
