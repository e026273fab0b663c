#include "test_support.hpp"
#include <managers/transfer_dispatcher.hpp>
#include <core/constants.hpp>
#include <csignal>

class TransferDispatcherTest : public ScratchDirTest {
protected:
    DeviceConfig device;

    void SetUp() override {
        ScratchDirTest::SetUp();
        set_log_file((test_dir / "watch.log").string());
        device.sequence = "watcher";
    }

    TransferDispatcher with_client(const fs::path& client) {
        device.transfer_client = client.string();
        return TransferDispatcher(device);
    }
};

TEST_F(TransferDispatcherTest, CommandLine) {
    device.transfer_client = "/usr/local/bin/pytivo_transfer.py";
    TransferDispatcher d(device);
    auto cmd = d.command_line("10.0.0.2");
    ASSERT_EQ(cmd.size(), 3u);
    EXPECT_EQ(cmd[0], "/usr/local/bin/pytivo_transfer.py");
    EXPECT_EQ(cmd[1], "10.0.0.2");
    EXPECT_EQ(cmd[2], "watcher");
}

TEST_F(TransferDispatcherTest, SuccessfulClient) {
    auto client = write_script("client.sh",
        "echo \"addr=$1 seq=$2 share=$SHARE_NAME\"\n"
        "echo 'warning on stderr' >&2\n"
        "exit 0\n");

    int started_pid = 0;
    std::vector<std::string> seen;
    TransferDispatcher::Hooks hooks;
    hooks.on_started = [&](int pid) { started_pid = pid; };
    hooks.on_line = [&](const std::string& l) { seen.push_back(l); };

    auto job = with_client(client).dispatch("10.0.0.2", "Movies", hooks);

    EXPECT_TRUE(job.started);
    EXPECT_TRUE(job.succeeded());
    EXPECT_EQ(job.exit_status, 0);
    EXPECT_GT(started_pid, 0);
    EXPECT_TRUE(job.error_detail.empty());
    ASSERT_EQ(job.output_lines.size(), 2u);
    EXPECT_EQ(job.output_lines[0], "addr=10.0.0.2 seq=watcher share=Movies");
    EXPECT_EQ(job.output_lines[1], "warning on stderr");
    EXPECT_EQ(seen, job.output_lines);
    EXPECT_FALSE(job.started_at.empty());
    EXPECT_FALSE(job.ended_at.empty());
}

TEST_F(TransferDispatcherTest, OutputIsTimestampedIntoLog) {
    auto client = write_script("client.sh", "echo 'Start sending \"a.mkv\"'\n");
    with_client(client).dispatch("10.0.0.2", "Watcher");

    std::string log = read_file(test_dir / "watch.log");
    EXPECT_NE(log.find(" - Start sending \"a.mkv\""), std::string::npos);
}

TEST_F(TransferDispatcherTest, FailingClientReportsOutputTail) {
    auto client = write_script("client.sh",
        "echo 'connecting'\n"
        "echo 'Error: connection refused' >&2\n"
        "exit 2\n");

    auto job = with_client(client).dispatch("10.0.0.2", "Watcher");

    EXPECT_TRUE(job.started);
    EXPECT_FALSE(job.succeeded());
    EXPECT_EQ(job.exit_status, 2);
    EXPECT_NE(job.error_detail.find("connection refused"), std::string::npos);
}

TEST_F(TransferDispatcherTest, SilentFailureReportsStatus) {
    auto client = write_script("client.sh", "exit 3\n");
    auto job = with_client(client).dispatch("10.0.0.2", "Watcher");
    EXPECT_EQ(job.exit_status, 3);
    EXPECT_EQ(job.error_detail, "transfer client exited with status 3");
}

TEST_F(TransferDispatcherTest, MissingClientExitsWith127) {
    auto job = with_client(test_dir / "no-such-client").dispatch("10.0.0.2", "Watcher");
    EXPECT_FALSE(job.succeeded());
    EXPECT_EQ(job.exit_status, EXEC_FAILED_STATUS);
    EXPECT_NE(job.error_detail.find("exec failed"), std::string::npos);
}

TEST_F(TransferDispatcherTest, PartialLastLineIsKept) {
    auto client = write_script("client.sh", "printf 'no newline'\n");
    auto job = with_client(client).dispatch("10.0.0.2", "Watcher");
    ASSERT_EQ(job.output_lines.size(), 1u);
    EXPECT_EQ(job.output_lines[0], "no newline");
}

TEST_F(TransferDispatcherTest, ClientKilledBySignal) {
    auto client = write_script("client.sh", "kill -KILL $$\n");
    auto job = with_client(client).dispatch("10.0.0.2", "Watcher");
    EXPECT_EQ(job.exit_status, 128 + 9);
    EXPECT_FALSE(job.succeeded());
}

TEST_F(TransferDispatcherTest, TerminationStopsClient) {
    auto client = write_script("client.sh", "echo started\nexec sleep 30\n");
    TransferDispatcher::Hooks hooks;
    hooks.on_line = [](const std::string&) { platform::request_termination(15); };

    auto start = std::chrono::steady_clock::now();
    auto job = with_client(client).dispatch("10.0.0.2", "Watcher", hooks);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(job.aborted);
    EXPECT_FALSE(job.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(TransferDispatcherTest, ClientStartsWithDefaultSigpipe) {
    platform::TerminationGuard signals;
    auto client = write_script("client.sh", "grep '^SigIgn:' /proc/self/status\n");

    auto job = with_client(client).dispatch("10.0.0.2", "Watcher");

    ASSERT_TRUE(job.succeeded()) << job.error_detail;
    ASSERT_EQ(job.output_lines.size(), 1u);
    std::string mask_hex = job.output_lines[0].substr(job.output_lines[0].find(':') + 1);
    unsigned long long ignored = std::stoull(mask_hex, nullptr, 16);
    EXPECT_EQ((ignored >> (SIGPIPE - 1)) & 1ULL, 0ULL);
    EXPECT_EQ((ignored >> (SIGTERM - 1)) & 1ULL, 0ULL);
}

TEST(TransferProgress, StartThenDone) {
    std::vector<CandidateFile> files(2);
    files[0].path = "/watch/a.mkv";
    files[1].path = "/watch/b.mkv";

    EXPECT_TRUE(apply_transfer_progress("Start sending \"a.mkv\"", files));
    EXPECT_EQ(files[0].status, FileStatus::Queued);
    EXPECT_EQ(files[1].status, FileStatus::Pending);

    EXPECT_TRUE(apply_transfer_progress("2025-01-01 Done sending \"/watch/a.mkv\"", files));
    EXPECT_EQ(files[0].status, FileStatus::Transferred);

    EXPECT_FALSE(apply_transfer_progress("Start sending \"a.mkv\"", files));
    EXPECT_EQ(files[0].status, FileStatus::Transferred);

    EXPECT_FALSE(apply_transfer_progress("unrelated output", files));
    EXPECT_FALSE(apply_transfer_progress("Start sending \"other.mkv\"", files));
}

TEST(TransferProgress, OutputTail) {
    std::vector<std::string> lines{"one", "", "two", "  three  ", "four", "five", "six"};
    EXPECT_EQ(output_tail(lines, 3), "four\nfive\nsix");
    EXPECT_EQ(output_tail(lines, 10), "one\ntwo\nthree\nfour\nfive\nsix");
    EXPECT_EQ(output_tail({}, 5), "");
}
