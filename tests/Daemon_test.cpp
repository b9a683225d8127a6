#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailbridge/daemon.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/runtime_context.hpp"
#include "TestHelpers.hpp"
#include <chrono>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using ::testing::HasSubstr;

#define TEST_APP_DIR "/tmp/mailbridge_daemon_test"

static bool Exists(const std::string & path) {
    return access(path.c_str(), F_OK) == 0;
}

// Runs the daemon in a child process, the way the container entry point does.
class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf " TEST_APP_DIR " && mkdir -p " TEST_APP_DIR);
        InstallTestLogger();
        context = RuntimeContext::ForApplicationDirectory(TEST_APP_DIR);
        child = -1;
    }

    void TearDown() override {
        if (child > 0) {
            kill(child, SIGKILL);
            waitpid(child, nullptr, 0);
        }
        system("rm -rf " TEST_APP_DIR);
    }

    void writeCompleteEnvFile() {
        ASSERT_TRUE(MailUtils::writeFileAtomically(context.appDir + "/.env",
            "HOST_1=imap.source.test\n"
            "USER_1=alice@source.test\n"
            "PASSWORD_1=source-secret\n"
            "HOST_2=imap.dest.test\n"
            "USER_2=alice@dest.test\n"
            "PASSWORD_2=dest-secret\n"
            "SYNC_MODE=poll\n"
            "POLL_SECONDS=3600\n"
            "IMAPSYNC_BIN=/bin/true\n"
            "CONNECTION_TEST=false\n"));
    }

    void startDaemon() {
        child = fork();
        ASSERT_GE(child, 0);
        if (child == 0) {
            int devNull = open("/dev/null", O_WRONLY);
            if (devNull >= 0) {
                dup2(devNull, STDOUT_FILENO);
                dup2(devNull, STDERR_FILENO);
            }
            ClearMailBridgeEnvironment();
            unsetenv("LOG_LEVEL");
            _exit(Daemon(context, false).run());
        }
    }

    bool waitForFile(const std::string & path, std::chrono::seconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!Exists(path)) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    // Returns false if the child is still running after the timeout.
    bool waitForExit(std::chrono::milliseconds timeout, int & status) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (waitpid(child, &status, WNOHANG) == child) {
                child = -1;
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    RuntimeContext context;
    pid_t child;
};

TEST_F(DaemonTest, TerminationDuringPollSleepShutsDownCleanly) {
    writeCompleteEnvFile();
    startDaemon();

    ASSERT_TRUE(waitForFile(context.pidPath, std::chrono::seconds(10)));
    ASSERT_TRUE(waitForFile(context.healthPath, std::chrono::seconds(10)));
    // let the first attempt finish so the signal lands in the poll sleep
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    ASSERT_EQ(kill(child, SIGTERM), 0);
    int status = 0;
    ASSERT_TRUE(waitForExit(std::chrono::milliseconds(2000), status));

    ASSERT_TRUE(WIFEXITED(status)) << "terminated by signal " << (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_FALSE(Exists(context.pidPath));
    EXPECT_FALSE(Exists(context.healthPath));
    EXPECT_FALSE(Exists(context.engineOutputPath));

    std::string log;
    ASSERT_TRUE(MailUtils::readFile(context.logPath, log));
    EXPECT_THAT(log, HasSubstr("Synchronization completed successfully"));
    EXPECT_THAT(log, HasSubstr("Received signal 15"));
    EXPECT_THAT(log, HasSubstr("Shutdown complete"));
}

TEST_F(DaemonTest, TerminationWhileWaitingForConfigurationExitsCleanly) {
    startDaemon();

    ASSERT_TRUE(waitForFile(context.pidPath, std::chrono::seconds(10)));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    ASSERT_EQ(kill(child, SIGTERM), 0);
    int status = 0;
    ASSERT_TRUE(waitForExit(std::chrono::milliseconds(2000), status));

    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_FALSE(Exists(context.pidPath));

    std::string log;
    ASSERT_TRUE(MailUtils::readFile(context.logPath, log));
    EXPECT_THAT(log, HasSubstr("Missing required environment variables"));
    EXPECT_THAT(log, HasSubstr("Shutdown requested while waiting for configuration"));
}

TEST_F(DaemonTest, UnusableDataDirectoryFailsStartup) {
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.dataDir, "not a directory"));
    startDaemon();

    int status = 0;
    ASSERT_TRUE(waitForExit(std::chrono::milliseconds(5000), status));
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 1);
}
