#pragma once

#include "run.hpp"
#include <core/types.hpp>
#include <memory>
#include <string>

struct MailMessage {
    std::string from;
    std::string to;
    std::string subject;
    std::string html_body;
};

// Mail relay collaborator. Implementations report connection, authentication
// and rejection failures as Err; they must not throw for those.
class MailTransport {
public:
    virtual ~MailTransport() = default;
    virtual Result<void> send(const MailMessage& message) = 0;
};

// SMTP delivery through libcurl. With credentials, a relay that cannot
// STARTTLS is a delivery failure.
class SmtpTransport : public MailTransport {
public:
    explicit SmtpTransport(const MailConfig& mail);
    Result<void> send(const MailMessage& message) override;

    // Full RFC 5322 message (headers + body, CRLF line endings).
    static std::string build_payload(const MailMessage& message);

    // CURLOPT_USE_SSL level: STARTTLS is mandatory once credentials are set,
    // not used otherwise.
    static long tls_mode(const MailConfig& mail);

private:
    MailConfig mail_;
};

// Read-only outcome report built from a finished Run.
struct Notification {
    std::string subject;
    std::string html_body;
};

// Composes and sends the outcome report for a Run. Delivery problems are
// logged and returned as DeliveryFailed; they never change the Run outcome
// and never escape as exceptions.
class Notifier {
public:
    Notifier(const MailConfig& mail, std::unique_ptr<MailTransport> transport);

    SendResult notify(const Run& run);

    static Notification compose(const Run& run);

private:
    MailConfig mail_;
    std::unique_ptr<MailTransport> transport_;
};

std::string html_escape(const std::string& s);
