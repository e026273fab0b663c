#include "test_support.hpp"
#include <managers/notifier.hpp>
#include <curl/curl.h>
#include <stdexcept>

// Records messages; optionally fails or throws.
class FakeTransport : public MailTransport {
public:
    std::vector<MailMessage>* sent;
    std::string fail_with;
    bool throw_instead = false;

    explicit FakeTransport(std::vector<MailMessage>* out) : sent(out) {}

    Result<void> send(const MailMessage& message) override {
        if (throw_instead) throw std::runtime_error("socket exploded");
        if (!fail_with.empty()) return Result<void>::Err(fail_with);
        sent->push_back(message);
        return Result<void>::Ok();
    }
};

class NotifierTest : public ScratchDirTest {
protected:
    MailConfig mail;
    std::vector<MailMessage> sent;

    void SetUp() override {
        ScratchDirTest::SetUp();
        mail.from = "watcher@example.com";
        mail.to = "me@example.com";
    }

    static ::Run success_run(int count) {
        ::Run run;
        run.outcome = RunOutcome::Success;
        run.start_time = "2025-01-15T14:35:22";
        run.device_address = "192.168.1.185";
        run.destination_label = "Watcher";
        run.watch_dir = "/mnt/cloud/pytivo-watcher";
        run.duration_secs = 330;
        for (int i = 0; i < count; ++i) {
            CandidateFile f;
            f.path = "/mnt/cloud/pytivo-watcher/show" + std::to_string(i) + ".mkv";
            f.mtime = 1736951722;
            f.status = FileStatus::Transferred;
            run.files.push_back(f);
        }
        return run;
    }
};

TEST_F(NotifierTest, SuccessSubjectCountsFiles) {
    EXPECT_EQ(Notifier::compose(success_run(1)).subject, "TiVo Transfer Complete: 1 file");
    EXPECT_EQ(Notifier::compose(success_run(3)).subject, "TiVo Transfer Complete: 3 files");
}

TEST_F(NotifierTest, SuccessBodyListsFilesAndSummary) {
    auto n = Notifier::compose(success_run(2));
    EXPECT_NE(n.html_body.find("show0.mkv"), std::string::npos);
    EXPECT_NE(n.html_body.find("show1.mkv"), std::string::npos);
    EXPECT_NE(n.html_body.find("192.168.1.185"), std::string::npos);
    EXPECT_NE(n.html_body.find("2025-01-15 14:35:22"), std::string::npos);
    EXPECT_NE(n.html_body.find("5m30s"), std::string::npos);
    EXPECT_NE(n.html_body.find("Transferred"), std::string::npos);
}

TEST_F(NotifierTest, FailureBodyEscapesDetail) {
    ::Run run = success_run(2);
    run.outcome = RunOutcome::Failure;
    run.error_detail = "refused <tivo> & gone";
    run.files[1].status = FileStatus::Pending;

    auto n = Notifier::compose(run);
    EXPECT_EQ(n.subject, "TiVo Transfer FAILED");
    EXPECT_NE(n.html_body.find("refused &lt;tivo&gt; &amp; gone"), std::string::npos);
    EXPECT_NE(n.html_body.find("show0.mkv"), std::string::npos);
    EXPECT_EQ(n.html_body.find("show1.mkv"), std::string::npos);
}

TEST_F(NotifierTest, FailureWithNothingQueuedSaysNone) {
    ::Run run = success_run(1);
    run.outcome = RunOutcome::Failure;
    run.files[0].status = FileStatus::Pending;
    auto n = Notifier::compose(run);
    EXPECT_NE(n.html_body.find("<p>None</p>"), std::string::npos);
}

TEST_F(NotifierTest, SendsThroughTransport) {
    Notifier notifier(mail, std::make_unique<FakeTransport>(&sent));
    EXPECT_EQ(notifier.notify(success_run(1)), SendResult::Sent);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].to, "me@example.com");
    EXPECT_EQ(sent[0].from, "watcher@example.com");
    EXPECT_EQ(sent[0].subject, "TiVo Transfer Complete: 1 file");
}

TEST_F(NotifierTest, NoRecipientSuppresses) {
    mail.to.clear();
    Notifier notifier(mail, std::make_unique<FakeTransport>(&sent));
    EXPECT_EQ(notifier.notify(success_run(1)), SendResult::Suppressed);
    EXPECT_TRUE(sent.empty());
}

TEST_F(NotifierTest, TransportErrorIsDeliveryFailed) {
    auto transport = std::make_unique<FakeTransport>(&sent);
    transport->fail_with = "535 authentication failed";
    Notifier notifier(mail, std::move(transport));
    EXPECT_EQ(notifier.notify(success_run(1)), SendResult::DeliveryFailed);
}

TEST_F(NotifierTest, TransportExceptionIsContained) {
    auto transport = std::make_unique<FakeTransport>(&sent);
    transport->throw_instead = true;
    Notifier notifier(mail, std::move(transport));
    EXPECT_EQ(notifier.notify(success_run(1)), SendResult::DeliveryFailed);
}

TEST_F(NotifierTest, MissingTransportIsDeliveryFailed) {
    Notifier notifier(mail, nullptr);
    EXPECT_EQ(notifier.notify(success_run(1)), SendResult::DeliveryFailed);
}

TEST(SmtpTransport, PayloadHeadersAndCrlfBody) {
    MailMessage msg{"a@example.com", "b@example.com", "Hello\r\nBcc: x", "<p>one</p>\n<p>two</p>"};
    std::string p = SmtpTransport::build_payload(msg);
    EXPECT_EQ(p.rfind("Date: ", 0), 0u);
    EXPECT_NE(p.find("To: b@example.com\r\n"), std::string::npos);
    EXPECT_NE(p.find("From: a@example.com\r\n"), std::string::npos);
    EXPECT_NE(p.find("Subject: Hello  Bcc: x\r\n"), std::string::npos);
    EXPECT_NE(p.find("Content-Type: text/html; charset=UTF-8\r\n\r\n"), std::string::npos);
    EXPECT_NE(p.find("<p>one</p>\r\n<p>two</p>\r\n"), std::string::npos);
}

TEST(SmtpTransport, CredentialsRequireTls) {
    MailConfig mail;
    EXPECT_EQ(SmtpTransport::tls_mode(mail), static_cast<long>(CURLUSESSL_NONE));

    mail.smtp_user = "watcher";
    mail.smtp_pass = "secret";
    EXPECT_EQ(SmtpTransport::tls_mode(mail), static_cast<long>(CURLUSESSL_ALL));
}

TEST(HtmlEscape, EscapesMarkup) {
    EXPECT_EQ(html_escape("a<b>&\"'"), "a&lt;b&gt;&amp;&quot;&#39;");
}
