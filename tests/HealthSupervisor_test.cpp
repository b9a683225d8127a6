#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/models/health_record.hpp"
#include "mailbridge/models/sync_attempt.hpp"
#include "TestHelpers.hpp"
#include <sys/wait.h>
#include <unistd.h>

using ::testing::HasSubstr;

#define TEST_APP_DIR "/tmp/mailbridge_health_test"

class HealthSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf " TEST_APP_DIR " && mkdir -p " TEST_APP_DIR "/data " TEST_APP_DIR "/logs");
        InstallTestLogger();
        context = RuntimeContext::ForApplicationDirectory(TEST_APP_DIR);
        health = std::make_shared<HealthSupervisor>(context);
        writePid(getpid());
    }

    void TearDown() override {
        health = nullptr;
        system("rm -rf " TEST_APP_DIR);
    }

    void writePid(pid_t pid) {
        ASSERT_TRUE(MailUtils::writeFileAtomically(context.pidPath, std::to_string(pid) + "\n"));
    }

    void writeRecord(HealthStatus status, time_t ts) {
        HealthRecord record;
        record.status = status;
        record.lastUpdateTimestamp = ts;
        ASSERT_TRUE(health->write(record));
    }

    RuntimeContext context;
    std::shared_ptr<HealthSupervisor> health;
};

TEST(HealthRecordTest, SerializesStatusAndTimestamp) {
    HealthRecord record;
    record.status = HealthStatus::Unhealthy;
    record.lastUpdateTimestamp = 1700000000;
    ASSERT_EQ(record.serialize(), "unhealthy\n1700000000\n");
}

TEST(HealthRecordTest, ParsesTolerantly) {
    HealthRecord record;
    ASSERT_TRUE(HealthRecord::parse(" Healthy \n1700000000", record));
    ASSERT_EQ(record.status, HealthStatus::Healthy);
    ASSERT_EQ(record.lastUpdateTimestamp, 1700000000);

    ASSERT_TRUE(HealthRecord::parse("healthy\nnot-a-number\n", record));
    ASSERT_EQ(record.lastUpdateTimestamp, 0);

    ASSERT_TRUE(HealthRecord::parse("sideways\n5\n", record));
    ASSERT_EQ(record.status, HealthStatus::Unknown);

    ASSERT_FALSE(HealthRecord::parse("", record));
}

TEST_F(HealthSupervisorTest, FreshHealthyRecordIsHealthy) {
    time_t now = time(0);
    writeRecord(HealthStatus::Healthy, now - 299);
    HealthReport report = health->evaluate(now);
    ASSERT_TRUE(report.healthy);
    ASSERT_EQ(report.reason, "");
}

TEST_F(HealthSupervisorTest, StaleRecordIsUnhealthy) {
    time_t now = time(0);
    writeRecord(HealthStatus::Healthy, now - 301);
    HealthReport report = health->evaluate(now);
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Health status is stale (301 seconds old)");
}

TEST_F(HealthSupervisorTest, UnhealthyStatusIsReported) {
    time_t now = time(0);
    writeRecord(HealthStatus::Unhealthy, now);
    HealthReport report = health->evaluate(now);
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Service reported unhealthy status");
}

TEST_F(HealthSupervisorTest, MissingIdentityFileMeansNotRunning) {
    writeRecord(HealthStatus::Healthy, time(0));
    remove(context.pidPath.c_str());
    HealthReport report = health->evaluate();
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Process is not running");
}

TEST_F(HealthSupervisorTest, GarbageIdentityFileIsInvalid) {
    writeRecord(HealthStatus::Healthy, time(0));
    ASSERT_TRUE(MailUtils::writeFileAtomically(context.pidPath, "not-a-pid\n"));
    HealthReport report = health->evaluate();
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Process identity file is invalid");
}

TEST_F(HealthSupervisorTest, DeadProcessIsNotRunning) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        _exit(0);
    }
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);

    writePid(child);
    writeRecord(HealthStatus::Healthy, time(0));
    HealthReport report = health->evaluate();
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Process is not running");
}

TEST_F(HealthSupervisorTest, MissingRecordIsReported) {
    HealthReport report = health->evaluate();
    ASSERT_FALSE(report.healthy);
    ASSERT_EQ(report.reason, "Health status file not found");
}

TEST_F(HealthSupervisorTest, HeartbeatWritesHealthyRecord) {
    time_t now = time(0);
    health->recordHeartbeat(now);

    std::string contents;
    ASSERT_TRUE(MailUtils::readFile(context.healthPath, contents));
    ASSERT_EQ(contents, "healthy\n" + std::to_string((long long)now) + "\n");
    ASSERT_TRUE(health->evaluate(now).healthy);
}

TEST_F(HealthSupervisorTest, AttemptOutcomeDrivesStatus) {
    time_t now = time(0);
    health->recordAttempt(SyncAttempt(now - 10, now - 5, 2, false, false, TransferStatistics()));

    HealthRecord record;
    ASSERT_TRUE(health->read(record));
    ASSERT_EQ(record.status, HealthStatus::Unhealthy);
    ASSERT_EQ(record.lastUpdateTimestamp, now - 5);

    health->recordAttempt(SyncAttempt(now - 4, now, 0, false, false, TransferStatistics()));
    ASSERT_TRUE(health->read(record));
    ASSERT_EQ(record.status, HealthStatus::Healthy);
    ASSERT_EQ(record.lastUpdateTimestamp, now);
}

TEST_F(HealthSupervisorTest, WritesNeverMoveBackwards) {
    time_t now = time(0);
    writeRecord(HealthStatus::Unhealthy, now);

    HealthRecord older;
    older.status = HealthStatus::Healthy;
    older.lastUpdateTimestamp = now - 60;
    ASSERT_FALSE(health->write(older));

    HealthRecord record;
    ASSERT_TRUE(health->read(record));
    ASSERT_EQ(record.status, HealthStatus::Unhealthy);
    ASSERT_EQ(record.lastUpdateTimestamp, now);
}

TEST_F(HealthSupervisorTest, NewerRecordOnDiskFromAnotherWriterWins) {
    time_t now = time(0);
    HealthSupervisor other(context);
    HealthRecord newer;
    newer.status = HealthStatus::Healthy;
    newer.lastUpdateTimestamp = now + 30;
    ASSERT_TRUE(other.write(newer));

    HealthRecord stale;
    stale.status = HealthStatus::Unhealthy;
    stale.lastUpdateTimestamp = now;
    ASSERT_FALSE(health->write(stale));
}

TEST_F(HealthSupervisorTest, ClearRemovesRecord) {
    writeRecord(HealthStatus::Healthy, time(0));
    health->clear();
    HealthRecord record;
    ASSERT_FALSE(health->read(record));
    ASSERT_EQ(health->evaluate().reason, "Health status file not found");
}
