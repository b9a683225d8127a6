#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailbridge/lifecycle_manager.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/sync_exception.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using ::testing::HasSubstr;

#define TEST_APP_DIR "/tmp/mailbridge_lifecycle_test"

static bool IsDirectory(const std::string & path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static bool Exists(const std::string & path) {
    return access(path.c_str(), F_OK) == 0;
}

class LifecycleManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf " TEST_APP_DIR " && mkdir -p " TEST_APP_DIR);
        log = InstallTestLogger();
        context = RuntimeContext::ForApplicationDirectory(TEST_APP_DIR);
    }

    void TearDown() override {
        system("rm -rf " TEST_APP_DIR);
    }

    std::shared_ptr<std::ostringstream> log;
    RuntimeContext context;
    ShutdownSignal shutdown;
};

TEST(RuntimeContextTest, DerivesPathsFromApplicationDirectory) {
    RuntimeContext ctx = RuntimeContext::ForApplicationDirectory("/srv/mailbridge/");
    ASSERT_EQ(ctx.appDir, "/srv/mailbridge");
    ASSERT_EQ(ctx.logPath, "/srv/mailbridge/logs/imapsync.log");
    ASSERT_EQ(ctx.healthPath, "/srv/mailbridge/data/health");
    ASSERT_EQ(ctx.pidPath, "/srv/mailbridge/data/imapsync.pid");
}

TEST(RuntimeContextTest, FallsBackToAppDirEnvironment) {
    setenv("APP_DIR", "/opt/bridge", 1);
    RuntimeContext ctx = RuntimeContext::ForApplicationDirectory("");
    unsetenv("APP_DIR");
    ASSERT_EQ(ctx.dataDir, "/opt/bridge/data");
}

TEST_F(LifecycleManagerTest, CreatesRuntimeDirectories) {
    LifecycleManager lifecycle(context, shutdown);
    DirectoryStatus status = lifecycle.prepareDirectories();
    EXPECT_TRUE(status.dataDirWritable);
    EXPECT_TRUE(status.logDirWritable);
    EXPECT_TRUE(IsDirectory(context.dataDir));
    EXPECT_TRUE(IsDirectory(context.logDir));
}

TEST_F(LifecycleManagerTest, UnusableDataDirectoryIsFatal) {
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.dataDir, "not a directory"));
    LifecycleManager lifecycle(context, shutdown);
    try {
        lifecycle.prepareDirectories();
        FAIL() << "prepareDirectories should have thrown";
    } catch (SyncException & ex) {
        EXPECT_EQ(ex.key, ERROR_KEY_FATAL_STARTUP);
        EXPECT_FALSE(ex.isRetryable());
    }
}

TEST_F(LifecycleManagerTest, UnusableLogDirectoryIsReportedOnly) {
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.logDir, "not a directory"));
    LifecycleManager lifecycle(context, shutdown);
    DirectoryStatus status = lifecycle.prepareDirectories();
    EXPECT_TRUE(status.dataDirWritable);
    EXPECT_FALSE(status.logDirWritable);
}

TEST_F(LifecycleManagerTest, WritesProcessIdentity) {
    LifecycleManager lifecycle(context, shutdown);
    lifecycle.prepareDirectories();
    ASSERT_TRUE(lifecycle.writeProcessIdentity());

    std::string contents;
    ASSERT_TRUE(MailUtils::readFile(context.pidPath, contents));
    EXPECT_EQ(MailUtils::trim(contents), std::to_string(getpid()));
}

TEST_F(LifecycleManagerTest, ShutdownRemovesRuntimeFiles) {
    LifecycleManager lifecycle(context, shutdown);
    lifecycle.prepareDirectories();
    lifecycle.writeProcessIdentity();
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.healthPath, "healthy\n1\n"));
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.engineOutputPath, "partial output"));

    EXPECT_EQ(lifecycle.shutdown(), 0);
    EXPECT_FALSE(Exists(context.pidPath));
    EXPECT_FALSE(Exists(context.healthPath));
    EXPECT_FALSE(Exists(context.engineOutputPath));

    std::string text = LogText(log);
    EXPECT_THAT(text, HasSubstr("Received shutdown signal, cleaning up..."));
    EXPECT_THAT(text, HasSubstr("Shutdown complete"));
}

TEST_F(LifecycleManagerTest, ShutdownToleratesMissingFiles) {
    LifecycleManager lifecycle(context, shutdown);
    lifecycle.prepareDirectories();
    EXPECT_EQ(lifecycle.shutdown(), 0);
    EXPECT_THAT(LogText(log), ::testing::Not(HasSubstr("Could not remove")));
}

TEST_F(LifecycleManagerTest, TerminationSignalRequestsShutdown) {
    LifecycleManager lifecycle(context, shutdown);
    lifecycle.installSignalHandlers();

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!shutdown.isShutdownRequested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(shutdown.isShutdownRequested());
    EXPECT_THAT(LogText(log), HasSubstr("Received signal 15"));
}

TEST_F(LifecycleManagerTest, ShutdownWakesSleepers) {
    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        shutdown.requestShutdown();
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(shutdown.sleepFor(std::chrono::seconds(60)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    stopper.join();
}

TEST_F(LifecycleManagerTest, LateShutdownHandlersRunImmediately) {
    int calls = 0;
    shutdown.addShutdownHandler([&calls]() { calls++; });
    shutdown.requestShutdown();
    shutdown.requestShutdown();
    EXPECT_EQ(calls, 1);

    shutdown.addShutdownHandler([&calls]() { calls++; });
    EXPECT_EQ(calls, 2);
}

TEST_F(LifecycleManagerTest, ThreadsStartedAfterBlockingInheritTheMask) {
    LifecycleManager lifecycle(context, shutdown);
    lifecycle.blockTerminationSignals();

    bool termBlocked = false;
    bool hupBlocked = false;
    std::thread worker([&]() {
        sigset_t mask;
        pthread_sigmask(SIG_SETMASK, nullptr, &mask);
        termBlocked = sigismember(&mask, SIGTERM) == 1;
        hupBlocked = sigismember(&mask, SIGHUP) == 1;
    });
    worker.join();

    EXPECT_TRUE(termBlocked);
    EXPECT_TRUE(hupBlocked);
}
