/**
 * @file notification.hpp
 * @brief Defines notification strategies for SiteVault.
 *
 * Provides interfaces and implementations for reporting the backup outcome by e-mail and to the
 * run log. Mail is delivered over SMTP with libcurl.
 *
 * @note Requires libcurl built with SMTP support.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <expected>
#include "backup_config.hpp"
#include "logger.hpp"

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending notifications about backup status.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param subject Short summary line.
     * @param message Message body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& subject, const std::string& message) = 0;
};

/**
 * @brief Email notification strategy.
 *
 * Sends a plain text message through an SMTP server. Port 465 uses implicit TLS; other ports
 * upgrade with STARTTLS when use_tls is set.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param smtp SMTP server and credentials.
     * @param emailFrom Sender address.
     * @param emailTo Recipient address.
     */
    EmailNotificationStrategy(SmtpConfig smtp, std::string emailFrom, std::string emailTo);

    /**
     * @brief Sends a notification via email.
     *
     * @param subject Mail subject.
     * @param message Mail body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override;

    /**
     * @brief SMTP URL for the configured server ("smtps://host:465" or "smtp://host:port").
     */
    std::string serverUrl() const;

private:
    SmtpConfig smtp;        ///< SMTP server.
    std::string emailFrom;  ///< Sender address.
    std::string emailTo;    ///< Recipient address.
};

/**
 * @brief Notification strategy that writes the message to the run log.
 */
class LogNotificationStrategy : public NotificationStrategy {
public:
    explicit LogNotificationStrategy(const Logger& logger);

    /**
     * @brief Logs the subject and every non-blank line of the message.
     */
    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override;

private:
    const Logger& logger;
};

/**
 * @brief Builds an RFC 5322 message with CRLF line endings.
 *
 * @param from Sender address.
 * @param to Recipient address.
 * @param subject Subject line.
 * @param body Plain text body; line endings are normalized to CRLF.
 * @param date Value of the Date header.
 * @return std::string The complete message.
 */
std::string buildEmailPayload(const std::string& from, const std::string& to, const std::string& subject,
                              const std::string& body, const std::string& date);

#endif // NOTIFICATION_HPP
