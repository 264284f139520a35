#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sgaudit {

struct MailMessage {
    std::string              sender;
    std::vector<std::string> recipients;
    std::string              subject;
    std::string              body;      // plain text
};

/// Delivers a plain-text message. Implementations throw DispatchError on failure.
class MailSender {
public:
    virtual ~MailSender() = default;
    virtual void send(const MailMessage& message) = 0;
};

/**
 * SmtpMailSender
 *
 * Hands messages to an SMTP relay over a blocking TCP connection, one
 * connection per message. No TLS or authentication: the relay is expected
 * to be local or otherwise trusted.
 */
class SmtpMailSender : public MailSender {
public:
    SmtpMailSender(std::string host, unsigned short port,
                   std::string helo_domain = "localhost");

    void send(const MailMessage& message) override;

private:
    std::string    host_;
    unsigned short port_;
    std::string    helo_domain_;
};

/// Headers plus CRLF-normalised, dot-stuffed body, without the terminating ".".
std::string format_smtp_payload(const MailMessage& message,
                                std::chrono::system_clock::time_point sent_at =
                                    std::chrono::system_clock::now());

} // namespace sgaudit
