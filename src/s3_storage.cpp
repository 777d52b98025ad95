#include "s3_storage.hpp"
#include "s3_response.hpp"
#include "utils.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <filesystem>
#include <format>
#include <cstdio>
#include <cctype>
#include <algorithm>
#include <sys/types.h>

namespace fs = std::filesystem;

namespace {

size_t appendCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    std::string_view line(buffer, size * nitems);
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        std::string name(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
            value.remove_suffix(1);
        }
        (*static_cast<std::map<std::string, std::string>*>(userp))[name] = std::string(value);
    }
    return size * nitems;
}

struct FileSlice {
    std::FILE* file;
    std::uint64_t remaining;
};

size_t sliceReadCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* slice = static_cast<FileSlice*>(userp);
    std::uint64_t wanted = std::min<std::uint64_t>(size * nitems, slice->remaining);
    if (wanted == 0) {
        return 0;
    }
    size_t read = std::fread(buffer, 1, wanted, slice->file);
    if (read == 0 && std::ferror(slice->file)) {
        return CURL_READFUNC_ABORT;
    }
    slice->remaining -= read;
    return read;
}

size_t emptyReadCallback([[maybe_unused]] char* buffer, [[maybe_unused]] size_t size,
                         [[maybe_unused]] size_t nitems, [[maybe_unused]] void* userp) {
    return 0;
}

std::expected<std::string, std::string> contentMd5(const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(body.data(), body.size(), digest, &length, EVP_md5(), nullptr) != 1) {
        return std::unexpected("Failed to compute Content-MD5");
    }
    return base64Encode(std::string_view(reinterpret_cast<const char*>(digest), length));
}

} // namespace

S3ObjectStorage::S3ObjectStorage(const S3Endpoint& endpoint)
    : endpointUrl_(endpoint.endpointUrl),
      bucket_(endpoint.bucketName),
      accessKey_(endpoint.accessKey),
      secretKey_(endpoint.secretKey),
      region_(endpoint.region.empty() ? "us-east-1" : endpoint.region) {
    while (endpointUrl_.ends_with('/')) {
        endpointUrl_.pop_back();
    }
}

std::string S3ObjectStorage::uriEncode(const std::string& value, bool keepSlash) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (keepSlash && c == '/')) {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += kHex[c >> 4];
            encoded += kHex[c & 0x0F];
        }
    }
    return encoded;
}

std::string S3ObjectStorage::objectUrl(const std::string& key) const {
    return std::format("{}/{}/{}", endpointUrl_, bucket_, uriEncode(key, true));
}

std::string S3ObjectStorage::listUrl(const std::string& prefix, const std::string& delimiter,
                                     const std::optional<std::string>& continuationToken) const {
    std::string url = std::format("{}/{}?", endpointUrl_, bucket_);
    if (continuationToken) {
        url += std::format("continuation-token={}&", uriEncode(*continuationToken, false));
    }
    if (!delimiter.empty()) {
        url += std::format("delimiter={}&", uriEncode(delimiter, false));
    }
    url += "list-type=2";
    if (!prefix.empty()) {
        url += std::format("&prefix={}", uriEncode(prefix, false));
    }
    return url;
}

std::expected<S3ObjectStorage::Response, std::string> S3ObjectStorage::perform(const Request& request) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    Response response;
    std::string credentials = std::format("{}:{}", accessKey_, secretKey_);
    std::string sigv4 = std::format("aws:amz:{}:s3", region_);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "x-amz-content-sha256: UNSIGNED-PAYLOAD");
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl, CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    FileSlice slice{request.upload, request.uploadSize};

    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (request.method == "PUT") {
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        if (request.upload) {
            if (fseeko(request.upload, static_cast<off_t>(request.uploadOffset), SEEK_SET) != 0) {
                curl_slist_free_all(headers);
                curl_easy_cleanup(curl);
                return std::unexpected(std::format("Failed to seek to offset {} for {}", request.uploadOffset, request.url));
            }
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, sliceReadCallback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &slice);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.uploadSize));
        } else {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, emptyReadCallback);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
        }
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body ? request.body->c_str() : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body ? request.body->size() : 0));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::format("{} {} failed: {}", request.method, request.url, curl_easy_strerror(res)));
    }
    return response;
}

std::expected<void, std::string> S3ObjectStorage::probe() {
    auto response = perform({.method = "HEAD", .url = std::format("{}/{}", endpointUrl_, bucket_)});
    if (!response) {
        return std::unexpected(std::format("Failed to connect to bucket {}: {}", bucket_, response.error()));
    }
    if (response->status == 404) {
        return std::unexpected(std::format("Bucket {} does not exist", bucket_));
    }
    if (response->status == 403) {
        return std::unexpected(std::format("Access denied to bucket {}", bucket_));
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Failed to access bucket {}: HTTP {}", bucket_, response->status));
    }
    return {};
}

std::expected<ObjectPage, std::string> S3ObjectStorage::listObjectsPage(const std::string& prefix,
                                                                        const std::string& delimiter,
                                                                        const std::optional<std::string>& continuationToken) {
    auto response = perform({.method = "GET", .url = listUrl(prefix, delimiter, continuationToken)});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Failed to list {}/{}: {}", bucket_, prefix,
                                           describeS3Error(response->status, response->body)));
    }
    return parseListObjectsResponse(response->body);
}

std::expected<void, std::string> S3ObjectStorage::uploadFile(const std::string& localFile, const std::string& key,
                                                             const std::map<std::string, std::string>& metadata) {
    std::error_code ec;
    auto size = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to open local file {}: {}", localFile, ec.message()));
    }
    if (size > kMultipartThreshold) {
        return uploadFileInParts(*this, localFile, key, metadata, multipartPartSize(size));
    }
    return putFile(localFile, key, metadata);
}

std::expected<void, std::string> S3ObjectStorage::putFile(const std::string& localFile, const std::string& key,
                                                          const std::map<std::string, std::string>& metadata) {
    std::error_code ec;
    auto size = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to open local file {}: {}", localFile, ec.message()));
    }
    std::FILE* file = std::fopen(localFile.c_str(), "rb");
    if (!file) {
        return std::unexpected(std::format("Failed to open local file: {}", localFile));
    }

    Request request{.method = "PUT", .url = objectUrl(key), .upload = file, .uploadSize = size};
    request.headers.push_back("Content-Type: application/octet-stream");
    for (const auto& [name, value] : metadata) {
        request.headers.push_back(std::format("x-amz-meta-{}: {}", name, value));
    }

    auto response = perform(request);
    std::fclose(file);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Failed to upload {} to {}/{}: {}", localFile, bucket_, key,
                                           describeS3Error(response->status, response->body)));
    }
    return {};
}

std::string S3ObjectStorage::partUrl(const std::string& key, const std::string& uploadId, int partNumber) const {
    return std::format("{}?partNumber={}&uploadId={}", objectUrl(key), partNumber, uriEncode(uploadId, false));
}

std::expected<std::string, std::string> S3ObjectStorage::createMultipartUpload(const std::string& key,
                                                                               const std::map<std::string, std::string>& metadata) {
    std::string body;
    Request request{.method = "POST", .url = std::format("{}?uploads=", objectUrl(key)), .body = &body};
    request.headers.push_back("Content-Type: application/octet-stream");
    for (const auto& [name, value] : metadata) {
        request.headers.push_back(std::format("x-amz-meta-{}: {}", name, value));
    }

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(describeS3Error(response->status, response->body));
    }
    return parseInitiateMultipartUpload(response->body);
}

std::expected<std::string, std::string> S3ObjectStorage::uploadPart(const std::string& key, const std::string& uploadId,
                                                                    int partNumber, const std::string& localFile,
                                                                    std::uint64_t offset, std::uint64_t length) {
    std::FILE* file = std::fopen(localFile.c_str(), "rb");
    if (!file) {
        return std::unexpected(std::format("Failed to open local file: {}", localFile));
    }

    Request request{.method = "PUT", .url = partUrl(key, uploadId, partNumber), .upload = file,
                    .uploadOffset = offset, .uploadSize = length};
    auto response = perform(request);
    std::fclose(file);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(describeS3Error(response->status, response->body));
    }
    auto etag = response->headers.find("etag");
    if (etag == response->headers.end() || etag->second.empty()) {
        return std::unexpected(std::format("No ETag returned for part {}", partNumber));
    }
    return etag->second;
}

std::expected<void, std::string> S3ObjectStorage::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                                          const std::vector<CompletedPart>& parts) {
    std::string body = buildCompleteMultipartUpload(parts);
    Request request{.method = "POST", .url = std::format("{}?uploadId={}", objectUrl(key), uriEncode(uploadId, false)),
                    .body = &body};
    request.headers.push_back("Content-Type: application/xml");

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(describeS3Error(response->status, response->body));
    }
    if (auto error = s3ErrorDocument(response->body)) {
        return std::unexpected(*error);
    }
    return {};
}

std::expected<void, std::string> S3ObjectStorage::abortMultipartUpload(const std::string& key, const std::string& uploadId) {
    auto response = perform({.method = "DELETE",
                             .url = std::format("{}?uploadId={}", objectUrl(key), uriEncode(uploadId, false))});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 204 && response->status != 200) {
        return std::unexpected(describeS3Error(response->status, response->body));
    }
    return {};
}

std::expected<void, std::string> S3ObjectStorage::copyObject(const std::string& sourceBucket, const std::string& sourceKey,
                                                             const std::string& destinationKey) {
    Request request{.method = "PUT", .url = objectUrl(destinationKey)};
    request.headers.push_back(std::format("x-amz-copy-source: /{}/{}", sourceBucket, uriEncode(sourceKey, true)));
    request.headers.push_back("x-amz-metadata-directive: COPY");

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Failed to copy {}/{}: {}", sourceBucket, sourceKey,
                                           describeS3Error(response->status, response->body)));
    }
    if (auto error = s3ErrorDocument(response->body)) {
        return std::unexpected(std::format("Failed to copy {}/{}: {}", sourceBucket, sourceKey, *error));
    }
    return {};
}

std::expected<void, std::string> S3ObjectStorage::deleteObject(const std::string& key) {
    auto response = perform({.method = "DELETE", .url = objectUrl(key)});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 204 && response->status != 200) {
        return std::unexpected(std::format("Failed to delete {}/{}: {}", bucket_, key,
                                           describeS3Error(response->status, response->body)));
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> S3ObjectStorage::deleteObjects(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return std::vector<std::string>{};
    }
    if (keys.size() > kMaxDeleteBatch) {
        return std::unexpected(std::format("Too many keys for one delete request: {} (max {})", keys.size(), kMaxDeleteBatch));
    }

    std::string body = buildDeleteRequest(keys);
    auto md5 = contentMd5(body);
    if (!md5) {
        return std::unexpected(md5.error());
    }

    Request request{.method = "POST", .url = std::format("{}/{}?delete=", endpointUrl_, bucket_), .body = &body};
    request.headers.push_back("Content-Type: application/xml");
    request.headers.push_back(std::format("Content-MD5: {}", *md5));

    auto response = perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Failed to delete objects from {}: {}", bucket_,
                                           describeS3Error(response->status, response->body)));
    }
    if (auto error = s3ErrorDocument(response->body)) {
        return std::unexpected(std::format("Failed to delete objects from {}: {}", bucket_, *error));
    }
    return parseDeleteErrors(response->body);
}
