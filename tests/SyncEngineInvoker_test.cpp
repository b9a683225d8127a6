#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/process_runner.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/sync_engine_invoker.hpp"
#include "mailbridge/sync_exception.hpp"
#include "mailbridge/models/sync_attempt.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <cstdlib>
#include <signal.h>
#include <thread>
#include <unistd.h>

using ::testing::HasSubstr;
using ::testing::Not;

#define TEST_APP_DIR "/tmp/mailbridge_invoker_test"

static ParameterSet Shell(std::string script) {
    return {"/bin/sh", "-c", script};
}

// True once the process has exited (reaped, or a zombie waiting for its parent).
static bool ProcessGone(pid_t pid) {
    std::string stat;
    if (!MailUtils::readFile("/proc/" + std::to_string(pid) + "/stat", stat)) {
        return true;
    }
    size_t close = stat.rfind(')');
    return close != std::string::npos && close + 2 < stat.size() && stat[close + 2] == 'Z';
}

class SyncEngineInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf " TEST_APP_DIR " && mkdir -p " TEST_APP_DIR "/data " TEST_APP_DIR "/logs");
        log = InstallTestLogger();
        context = RuntimeContext::ForApplicationDirectory(TEST_APP_DIR);
        health = std::make_shared<HealthSupervisor>(context);
        invoker = std::make_shared<SyncEngineInvoker>(std::make_shared<ForkExecProcessRunner>(), *health, context, shutdown, std::chrono::seconds(10));
    }

    void TearDown() override {
        invoker = nullptr;
        health = nullptr;
        system("rm -rf " TEST_APP_DIR);
    }

    HealthRecord healthRecord() {
        HealthRecord record;
        EXPECT_TRUE(health->read(record));
        return record;
    }

    std::shared_ptr<std::ostringstream> log;
    RuntimeContext context;
    ShutdownSignal shutdown;
    std::shared_ptr<HealthSupervisor> health;
    std::shared_ptr<SyncEngineInvoker> invoker;
};

TEST(TransferStatisticsTest, ParsesEngineSummary) {
    TransferStatistics stats = ParseTransferStatistics(
        "Host1 Folder INBOX\n"
        "Messages transferred       : 12\n"
        "Messages skipped           : 3\n"
        "Total bytes transferred    : 4096\n");
    EXPECT_EQ(stats.messagesTransferred, 12);
    EXPECT_EQ(stats.messagesSkipped, 3);
    EXPECT_EQ(stats.bytesTransferred, 4096);
}

TEST(TransferStatisticsTest, ShortFormIsCaseInsensitive) {
    TransferStatistics stats = ParseTransferStatistics("TRANSFERRED: 5\nskipped:2\n");
    EXPECT_EQ(stats.messagesTransferred, 5);
    EXPECT_EQ(stats.messagesSkipped, 2);
    EXPECT_EQ(stats.bytesTransferred, 0);
}

TEST(TransferStatisticsTest, MissingCountersAreZero) {
    TransferStatistics stats = ParseTransferStatistics("nothing to see here\n");
    EXPECT_EQ(stats.messagesTransferred, 0);
    EXPECT_EQ(stats.messagesSkipped, 0);
    EXPECT_EQ(stats.bytesTransferred, 0);
}

TEST_F(SyncEngineInvokerTest, SuccessfulAttemptReportsStatistics) {
    SyncAttempt attempt = invoker->runAttempt(Shell(
        "echo 'Messages transferred       : 12';"
        "echo 'Messages skipped           : 3';"
        "echo 'Total bytes transferred    : 4096' 1>&2;"
        "exit 0"));

    EXPECT_TRUE(attempt.succeeded());
    EXPECT_EQ(attempt.exitCode(), 0);
    EXPECT_EQ(attempt.messagesTransferred(), 12);
    EXPECT_EQ(attempt.messagesSkipped(), 3);
    EXPECT_EQ(attempt.bytesTransferred(), 4096);
    EXPECT_GE(attempt.endTime(), attempt.startTime());

    EXPECT_EQ(healthRecord().status, HealthStatus::Healthy);

    std::string text = LogText(log);
    EXPECT_THAT(text, HasSubstr("Starting email synchronization..."));
    EXPECT_THAT(text, HasSubstr("=== Sync Details "));
    EXPECT_THAT(text, HasSubstr("Messages transferred       : 12"));
    EXPECT_THAT(text, HasSubstr("=== End Sync Details ==="));
}

TEST_F(SyncEngineInvokerTest, SuccessWithoutSummaryHasZeroCounters) {
    SyncAttempt attempt = invoker->runAttempt(Shell("echo done"));
    EXPECT_TRUE(attempt.succeeded());
    EXPECT_EQ(attempt.messagesTransferred(), 0);
    EXPECT_EQ(attempt.messagesSkipped(), 0);
    EXPECT_EQ(attempt.bytesTransferred(), 0);
}

TEST_F(SyncEngineInvokerTest, FailureLogsExitCodeAndOutputTail) {
    SyncAttempt attempt = invoker->runAttempt(Shell("i=1; while [ $i -le 30 ]; do printf 'line-%02d\\n' $i; i=$((i+1)); done; exit 3"));

    EXPECT_FALSE(attempt.succeeded());
    EXPECT_EQ(attempt.exitCode(), 3);
    EXPECT_EQ(healthRecord().status, HealthStatus::Unhealthy);

    std::string text = LogText(log);
    EXPECT_THAT(text, HasSubstr("[ERROR] Synchronization failed with exit code: 3"));
    EXPECT_THAT(text, HasSubstr("=== Sync Error Details "));
    EXPECT_THAT(text, HasSubstr("=== End Sync Error Details ==="));
    EXPECT_THAT(text, HasSubstr("line-11"));
    EXPECT_THAT(text, HasSubstr("line-30"));
    EXPECT_THAT(text, Not(HasSubstr("line-10")));
}

TEST_F(SyncEngineInvokerTest, CommandIsLoggedRedacted) {
    invoker->runAttempt({"/bin/true", "--password1", "topsecret", "--host1", "imap.test"});
    std::string text = LogText(log);
    EXPECT_THAT(text, HasSubstr("Sync command: /bin/true --password1 [hidden] --host1 imap.test"));
    EXPECT_THAT(text, Not(HasSubstr("topsecret")));
}

TEST_F(SyncEngineInvokerTest, TransientOutputIsRemoved) {
    invoker->runAttempt(Shell("echo hello"));
    EXPECT_NE(access(context.engineOutputPath.c_str(), F_OK), 0);
}

TEST_F(SyncEngineInvokerTest, MissingEngineFailsWithExecCode) {
    SyncAttempt attempt = invoker->runAttempt({"/nonexistent/imapsync", "--host1", "x"});
    EXPECT_FALSE(attempt.succeeded());
    EXPECT_EQ(attempt.exitCode(), 127);
}

TEST_F(SyncEngineInvokerTest, TimeoutKillsEngine) {
    SyncEngineInvoker shortInvoker(std::make_shared<ForkExecProcessRunner>(), *health, context, shutdown, std::chrono::seconds(1));

    auto started = std::chrono::steady_clock::now();
    SyncAttempt attempt = shortInvoker.runAttempt(Shell("sleep 30"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(attempt.timedOut());
    EXPECT_FALSE(attempt.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(healthRecord().status, HealthStatus::Unhealthy);
    EXPECT_THAT(LogText(log), HasSubstr("Synchronization timed out after 1 seconds"));
}

TEST_F(SyncEngineInvokerTest, ShutdownCancelsRunningEngine) {
    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        shutdown.requestShutdown();
    });

    auto started = std::chrono::steady_clock::now();
    SyncAttempt attempt = invoker->runAttempt(Shell("sleep 30"));
    auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    EXPECT_TRUE(attempt.cancelled());
    EXPECT_FALSE(attempt.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(SyncEngineInvokerTest, ConcurrentAttemptsAreSerialized) {
    std::string lock = std::string(TEST_APP_DIR) + "/engine.lock";
    std::string script = "if [ -e " + lock + " ]; then exit 9; fi; touch " + lock + "; sleep 0.3; rm -f " + lock;

    int first = -1;
    int second = -1;
    std::thread a([&]() { first = invoker->runAttempt(Shell(script)).exitCode(); });
    std::thread b([&]() { second = invoker->runAttempt(Shell(script)).exitCode(); });
    a.join();
    b.join();

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 0);
}

TEST_F(SyncEngineInvokerTest, LostChildStillKillsProcessGroup) {
    // With SIGCHLD ignored the kernel reaps the engine itself and waitpid fails.
    std::string pidFile = std::string(TEST_APP_DIR) + "/background.pid";
    ForkExecProcessRunner runner;

    auto previous = signal(SIGCHLD, SIG_IGN);
    EXPECT_THROW(runner.run(Shell("sleep 30 & echo $! > " + pidFile + "; exit 0"), context.engineOutputPath, std::chrono::seconds(10), nullptr), SyncException);
    signal(SIGCHLD, previous);

    std::string contents;
    ASSERT_TRUE(MailUtils::readFile(pidFile, contents));
    pid_t background = (pid_t)strtol(MailUtils::trim(contents).c_str(), nullptr, 10);
    ASSERT_GT(background, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!ProcessGone(background) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(ProcessGone(background));
}
