/**
 * @file s3_response.hpp
 * @brief Request bodies and response parsing for the S3 REST API.
 *
 * S3 answers in small, flat XML documents. Only the handful of elements SiteVault reads are
 * extracted; nested elements of the same name are not supported.
 */

#ifndef S3_RESPONSE_HPP
#define S3_RESPONSE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <chrono>
#include "object_storage.hpp"

/**
 * @brief Returns the raw inner text of every <tag>...</tag> element, in document order.
 */
std::vector<std::string_view> xmlElements(std::string_view xml, std::string_view tag);

/**
 * @brief Returns the unescaped text of the first <tag> element, if any.
 */
std::optional<std::string> xmlElementText(std::string_view xml, std::string_view tag);

/**
 * @brief Name of the document's root element, skipping the XML declaration.
 */
std::string xmlRootElement(std::string_view xml);

std::string xmlEscape(std::string_view text);

/**
 * @brief Decodes the predefined entities and numeric character references (&#13; &#x0D;) as UTF-8.
 *
 * Malformed references are copied through unchanged.
 */
std::string xmlUnescape(std::string_view text);

/**
 * @brief Parses an ISO 8601 UTC timestamp such as "2024-05-01T10:20:30.000Z".
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(std::string_view text);

/**
 * @brief Parses a ListObjectsV2 result.
 *
 * @param xml Response body.
 * @return std::expected<ObjectPage, std::string> The page, or an error if the body is an S3 error document
 *         or lacks a ListBucketResult.
 */
std::expected<ObjectPage, std::string> parseListObjectsResponse(std::string_view xml);

/**
 * @brief Extracts the keys reported as failed in a DeleteObjects result.
 */
std::vector<std::string> parseDeleteErrors(std::string_view xml);

/**
 * @brief Builds a quiet DeleteObjects request body.
 */
std::string buildDeleteRequest(const std::vector<std::string>& keys);

/**
 * @brief Extracts the UploadId of an InitiateMultipartUploadResult.
 */
std::expected<std::string, std::string> parseInitiateMultipartUpload(std::string_view xml);

/**
 * @brief Builds a CompleteMultipartUpload request body.
 */
std::string buildCompleteMultipartUpload(const std::vector<CompletedPart>& parts);

/**
 * @brief Describes an S3 error document, if the body is one.
 *
 * @return std::optional<std::string> "Code: Message", or std::nullopt when the root element is not <Error>.
 */
std::optional<std::string> s3ErrorDocument(std::string_view xml);

/**
 * @brief Formats an error message for a failed HTTP exchange.
 *
 * @param status HTTP status code.
 * @param body Response body.
 */
std::string describeS3Error(long status, std::string_view body);

#endif // S3_RESPONSE_HPP
