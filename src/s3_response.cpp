#include "s3_response.hpp"
#include <ctime>
#include <format>
#include <charconv>
#include <cstdint>

std::vector<std::string_view> xmlElements(std::string_view xml, std::string_view tag) {
    std::vector<std::string_view> elements;
    std::string open = std::format("<{}", tag);
    std::string close = std::format("</{}>", tag);

    std::size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string_view::npos) {
        std::size_t nameEnd = pos + open.size();
        if (nameEnd >= xml.size()) {
            break;
        }
        char next = xml[nameEnd];
        if (next != '>' && next != ' ' && next != '/') {
            pos = nameEnd;
            continue;
        }
        std::size_t tagEnd = xml.find('>', nameEnd);
        if (tagEnd == std::string_view::npos) {
            break;
        }
        if (xml[tagEnd - 1] == '/') {
            elements.emplace_back();
            pos = tagEnd + 1;
            continue;
        }
        std::size_t contentEnd = xml.find(close, tagEnd + 1);
        if (contentEnd == std::string_view::npos) {
            break;
        }
        elements.push_back(xml.substr(tagEnd + 1, contentEnd - tagEnd - 1));
        pos = contentEnd + close.size();
    }
    return elements;
}

std::optional<std::string> xmlElementText(std::string_view xml, std::string_view tag) {
    auto elements = xmlElements(xml, tag);
    if (elements.empty()) {
        return std::nullopt;
    }
    return xmlUnescape(elements.front());
}

std::string xmlRootElement(std::string_view xml) {
    std::size_t pos = 0;
    while ((pos = xml.find('<', pos)) != std::string_view::npos) {
        if (pos + 1 < xml.size() && (xml[pos + 1] == '?' || xml[pos + 1] == '!')) {
            pos = xml.find('>', pos);
            if (pos == std::string_view::npos) {
                break;
            }
            continue;
        }
        std::size_t end = xml.find_first_of(" />", pos + 1);
        if (end == std::string_view::npos) {
            break;
        }
        return std::string(xml.substr(pos + 1, end - pos - 1));
    }
    return {};
}

std::string xmlEscape(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

namespace {

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Decodes "&#N;" or "&#xH;" at the start of text. Returns the length consumed, 0 if malformed.
std::size_t decodeCharReference(std::string_view text, std::string& out) {
    if (!text.starts_with("&#")) {
        return 0;
    }
    std::size_t semicolon = text.find(';');
    if (semicolon == std::string_view::npos) {
        return 0;
    }
    std::string_view digits = text.substr(2, semicolon - 2);
    int base = 10;
    if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
        base = 16;
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        return 0;
    }
    std::uint32_t cp = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    appendUtf8(out, cp);
    return semicolon + 1;
}

} // namespace

std::string xmlUnescape(std::string_view text) {
    static constexpr std::pair<std::string_view, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            if (std::size_t used = decodeCharReference(text.substr(i), result)) {
                i += used;
                continue;
            }
            for (const auto& [entity, c] : kEntities) {
                if (text.substr(i, entity.size()) == entity) {
                    result += c;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            result += text[i++];
        }
    }
    return result;
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(std::string_view text) {
    std::tm tm{};
    int fields[6] = {};
    static constexpr std::size_t kOffsets[6] = {0, 5, 8, 11, 14, 17};
    static constexpr std::size_t kWidths[6] = {4, 2, 2, 2, 2, 2};
    if (text.size() < 19) {
        return std::nullopt;
    }
    for (int i = 0; i < 6; ++i) {
        auto part = text.substr(kOffsets[i], kWidths[i]);
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), fields[i]);
        if (ec != std::errc() || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
    }
    tm.tm_year = fields[0] - 1900;
    tm.tm_mon = fields[1] - 1;
    tm.tm_mday = fields[2];
    tm.tm_hour = fields[3];
    tm.tm_min = fields[4];
    tm.tm_sec = fields[5];
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::expected<ObjectPage, std::string> parseListObjectsResponse(std::string_view xml) {
    if (auto error = s3ErrorDocument(xml)) {
        return std::unexpected(*error);
    }
    if (xmlRootElement(xml) != "ListBucketResult") {
        return std::unexpected("Unexpected ListObjectsV2 response");
    }

    ObjectPage page;
    for (auto contents : xmlElements(xml, "Contents")) {
        ObjectInfo object;
        object.key = xmlElementText(contents, "Key").value_or("");
        auto size = xmlElementText(contents, "Size").value_or("0");
        auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), object.size);
        if (ec != std::errc()) {
            return std::unexpected(std::format("Invalid object size for {}: {}", object.key, size));
        }
        auto modified = parseIso8601(xmlElementText(contents, "LastModified").value_or(""));
        if (modified) {
            object.lastModified = *modified;
        }
        page.objects.push_back(std::move(object));
    }
    for (auto prefix : xmlElements(xml, "CommonPrefixes")) {
        if (auto text = xmlElementText(prefix, "Prefix")) {
            page.commonPrefixes.push_back(*text);
        }
    }
    if (xmlElementText(xml, "IsTruncated").value_or("false") == "true") {
        page.nextContinuationToken = xmlElementText(xml, "NextContinuationToken");
    }
    return page;
}

std::vector<std::string> parseDeleteErrors(std::string_view xml) {
    std::vector<std::string> failed;
    for (auto error : xmlElements(xml, "Error")) {
        if (auto key = xmlElementText(error, "Key")) {
            failed.push_back(*key);
        }
    }
    return failed;
}

std::string buildDeleteRequest(const std::vector<std::string>& keys) {
    std::string body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Delete><Quiet>true</Quiet>";
    for (const auto& key : keys) {
        body += std::format("<Object><Key>{}</Key></Object>", xmlEscape(key));
    }
    body += "</Delete>";
    return body;
}

std::expected<std::string, std::string> parseInitiateMultipartUpload(std::string_view xml) {
    if (auto error = s3ErrorDocument(xml)) {
        return std::unexpected(*error);
    }
    auto uploadId = xmlElementText(xml, "UploadId");
    if (!uploadId || uploadId->empty()) {
        return std::unexpected("Unexpected CreateMultipartUpload response");
    }
    return *uploadId;
}

std::string buildCompleteMultipartUpload(const std::vector<CompletedPart>& parts) {
    std::string body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        body += std::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>", part.partNumber, xmlEscape(part.etag));
    }
    body += "</CompleteMultipartUpload>";
    return body;
}

std::optional<std::string> s3ErrorDocument(std::string_view xml) {
    if (xmlRootElement(xml) != "Error") {
        return std::nullopt;
    }
    std::string code = xmlElementText(xml, "Code").value_or("UnknownError");
    std::string message = xmlElementText(xml, "Message").value_or("");
    return message.empty() ? code : std::format("{}: {}", code, message);
}

std::string describeS3Error(long status, std::string_view body) {
    if (auto error = s3ErrorDocument(body)) {
        return std::format("HTTP {}: {}", status, *error);
    }
    return std::format("HTTP {}", status);
}
