#include "notifier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <iterator>

// ── Composition ──────────────────────────────────────────────

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c;
        }
    }
    return out;
}

static std::string summary_row(const std::string& label, const std::string& value) {
    return fmt::format("<tr><td style=\"padding:2px 12px 2px 0\"><b>{}</b></td><td>{}</td></tr>\n",
                       html_escape(label), html_escape(value));
}

static std::string summary_table(const Run& run, const char* time_label) {
    std::string out = "<table>\n";
    out += summary_row("Device", run.device_address);
    out += summary_row("Share", run.destination_label);
    out += summary_row("Watch directory", run.watch_dir);
    out += summary_row(time_label, format_report_time(run.start_time));
    out += summary_row("Duration", format_seconds(run.duration_secs));
    out += "</table>\n";
    return out;
}

static std::string file_table(const std::vector<CandidateFile>& files) {
    std::string out =
        "<table border=\"1\" cellpadding=\"4\" cellspacing=\"0\">\n"
        "<tr><th>#</th><th>File</th><th>Modified</th><th>Status</th></tr>\n";
    int n = 0;
    for (const auto& f : files) {
        out += fmt::format("<tr><td>{}</td><td>{}</td><td>{}</td><td>{}</td></tr>\n",
                           ++n, html_escape(f.name()),
                           html_escape(format_local_time(f.mtime)),
                           to_string(f.status));
    }
    out += "</table>\n";
    return out;
}

Notification Notifier::compose(const Run& run) {
    Notification n;
    std::string body =
        "<html><body style=\"font-family: Helvetica, Arial, sans-serif;\">\n";

    if (run.outcome == RunOutcome::Success) {
        size_t count = run.files.size();
        n.subject = fmt::format("TiVo Transfer Complete: {} file{}", count, count == 1 ? "" : "s");
        body += "<h2>Transfer complete</h2>\n";
        body += summary_table(run, "Started");
        body += fmt::format("<h3>Files ({})</h3>\n", count);
        body += file_table(run.files);
    } else {
        n.subject = "TiVo Transfer FAILED";
        body += "<h2 style=\"color:#b00\">Transfer failed</h2>\n";
        body += summary_table(run, "Time");
        body += "<h3>Error</h3>\n";
        body += "<pre>" + html_escape(run.error_detail.empty() ? "unknown error" : run.error_detail) +
                "</pre>\n";

        std::vector<CandidateFile> queued;
        std::copy_if(run.files.begin(), run.files.end(), std::back_inserter(queued),
                     [](const CandidateFile& f) { return f.status != FileStatus::Pending; });
        body += "<h3>Files queued before failure</h3>\n";
        if (queued.empty()) {
            body += "<p>None</p>\n";
        } else {
            body += file_table(queued);
        }
    }

    body += "</body></html>\n";
    n.html_body = std::move(body);
    return n;
}

// ── Notifier ─────────────────────────────────────────────────

Notifier::Notifier(const MailConfig& mail, std::unique_ptr<MailTransport> transport)
    : mail_(mail), transport_(std::move(transport)) {}

SendResult Notifier::notify(const Run& run) {
    if (!mail_.enabled()) {
        watch_log("No recipient configured, notification suppressed");
        return SendResult::Suppressed;
    }
    if (!transport_) {
        watch_log_error("No mail transport available, notification not sent");
        return SendResult::DeliveryFailed;
    }

    try {
        Notification n = compose(run);
        MailMessage msg{mail_.from, mail_.to, n.subject, n.html_body};
        auto r = transport_->send(msg);
        if (r.is_err()) {
            watch_log_error(fmt::format("Failed to send notification to {}: {}", mail_.to, r.error));
            return SendResult::DeliveryFailed;
        }
        watch_log(fmt::format("Notification sent to {}: {}", mail_.to, n.subject));
        return SendResult::Sent;
    } catch (const std::exception& e) {
        watch_log_error(fmt::format("Failed to send notification to {}: {}", mail_.to, e.what()));
        return SendResult::DeliveryFailed;
    }
}

// ── SMTP transport ───────────────────────────────────────────

SmtpTransport::SmtpTransport(const MailConfig& mail) : mail_(mail) {}

long SmtpTransport::tls_mode(const MailConfig& mail) {
    // Credentials never travel over a plaintext session
    return static_cast<long>(mail.authenticated() ? CURLUSESSL_ALL : CURLUSESSL_NONE);
}

static std::string rfc2822_date() {
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &tm_buf);
    return std::string(buf);
}

// Header values must not carry line breaks
static std::string header_value(std::string s) {
    std::replace(s.begin(), s.end(), '\r', ' ');
    std::replace(s.begin(), s.end(), '\n', ' ');
    return s;
}

std::string SmtpTransport::build_payload(const MailMessage& message) {
    std::string payload;
    payload += "Date: " + rfc2822_date() + "\r\n";
    payload += "To: " + header_value(message.to) + "\r\n";
    payload += "From: " + header_value(message.from) + "\r\n";
    payload += "Subject: " + header_value(message.subject) + "\r\n";
    payload += "MIME-Version: 1.0\r\n";
    payload += "Content-Type: text/html; charset=UTF-8\r\n";
    payload += "\r\n";

    // Normalise body line endings to CRLF
    const std::string& body = message.html_body;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\n' && (i == 0 || body[i - 1] != '\r')) payload += '\r';
        payload += c;
    }
    if (payload.size() < 2 || payload.compare(payload.size() - 2, 2, "\r\n") != 0) {
        payload += "\r\n";
    }
    return payload;
}

namespace {

struct UploadState {
    const std::string* data;
    size_t offset;
};

size_t read_payload(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* st = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = st->data->size() - st->offset;
    size_t n = std::min(room, left);
    if (n > 0) {
        std::memcpy(buffer, st->data->data() + st->offset, n);
        st->offset += n;
    }
    return n;
}

} // namespace

Result<void> SmtpTransport::send(const MailMessage& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<void>::Err("Failed to initialize CURL");
    }

    std::string url = fmt::format("smtp://{}:{}", mail_.smtp_server, mail_.smtp_port);
    std::string payload = build_payload(message);
    UploadState upload{&payload, 0};

    struct curl_slist* recipients = nullptr;
    recipients = curl_slist_append(recipients, ("<" + message.to + ">").c_str());
    std::string mail_from = "<" + message.from + ">";

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_payload);
    curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, SMTP_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (mail_.authenticated()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, mail_.smtp_user.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, mail_.smtp_pass.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_USE_SSL, tls_mode(mail_));

    CURLcode res = curl_easy_perform(curl);
    long response = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        if (response > 0) {
            return Result<void>::Err(fmt::format("{} (SMTP {})", curl_easy_strerror(res), response));
        }
        return Result<void>::Err(curl_easy_strerror(res));
    }
    return Result<void>::Ok();
}
