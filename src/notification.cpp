#include "notification.hpp"
#include "utils.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <format>
#include <sstream>

namespace {

struct PayloadReader {
    const std::string& payload;
    std::size_t offset = 0;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* reader = static_cast<PayloadReader*>(userp);
    std::size_t remaining = reader->payload.size() - reader->offset;
    std::size_t count = std::min(remaining, size * nitems);
    std::memcpy(buffer, reader->payload.data() + reader->offset, count);
    reader->offset += count;
    return count;
}

} // namespace

std::string buildEmailPayload(const std::string& from, const std::string& to, const std::string& subject,
                              const std::string& body, const std::string& date) {
    std::string payload = std::format("Date: {}\r\nFrom: {}\r\nTo: {}\r\nSubject: {}\r\n"
                                      "MIME-Version: 1.0\r\nContent-Type: text/plain; charset=UTF-8\r\n"
                                      "X-Mailer: SiteVault {}\r\n\r\n",
                                      date, from, to, subject, kSiteVaultVersion);
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.ends_with('\r')) {
            line.pop_back();
        }
        payload += line + "\r\n";
    }
    return payload;
}

EmailNotificationStrategy::EmailNotificationStrategy(SmtpConfig smtp, std::string emailFrom, std::string emailTo)
    : smtp(std::move(smtp)), emailFrom(std::move(emailFrom)), emailTo(std::move(emailTo)) {}

std::string EmailNotificationStrategy::serverUrl() const {
    return smtp.port == 465 ? std::format("smtps://{}:{}", smtp.server, smtp.port)
                            : std::format("smtp://{}:{}", smtp.server, smtp.port);
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& subject, const std::string& message) {
    if (emailFrom.empty() || emailTo.empty()) {
        return std::unexpected("Sender or recipient address is not configured");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string payload = buildEmailPayload(emailFrom, emailTo, subject, message,
                                            currentTimestamp("%a, %d %b %Y %H:%M:%S %z"));
    PayloadReader reader{payload};
    std::string url = serverUrl();
    std::string mailFrom = std::format("<{}>", emailFrom);
    std::string mailTo = std::format("<{}>", emailTo);
    struct curl_slist* recipients = curl_slist_append(nullptr, mailTo.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (smtp.port != 465 && smtp.useTls) {
        curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }
    if (!smtp.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, smtp.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, smtp.password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &reader);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send email via {}: {}", smtp.server, curl_easy_strerror(res)));
    }
    return {};
}

LogNotificationStrategy::LogNotificationStrategy(const Logger& logger) : logger(logger) {}

std::expected<void, std::string> LogNotificationStrategy::notify(const std::string& subject, const std::string& message) {
    logger.info(std::format("NOTIFICATION: {}", subject));
    std::istringstream lines(message);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            logger.info(std::format("  {}", line));
        }
    }
    return {};
}
