#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"

#include <cstdlib>
#include <cstdio>
#include <errno.h>
#include <signal.h>
#include <sys/types.h>

HealthSupervisor::HealthSupervisor(RuntimeContext context) :
    context(context),
    logger(spdlog::get("logger")),
    lastWrittenTimestamp(0)
{
}

void HealthSupervisor::recordHeartbeat(time_t now) {
    HealthRecord record;
    record.status = HealthStatus::Healthy;
    record.lastUpdateTimestamp = now;
    write(record);
}

void HealthSupervisor::recordAttempt(const SyncAttempt & attempt) {
    HealthRecord record;
    record.status = attempt.succeeded() ? HealthStatus::Healthy : HealthStatus::Unhealthy;
    record.lastUpdateTimestamp = attempt.endTime();
    write(record);
}

bool HealthSupervisor::write(HealthRecord record) {
    std::lock_guard<std::mutex> lock(writeMtx);

    // Never move the record backwards in time. Compare against what is on disk
    // as well, another writer may have touched it.
    time_t newest = lastWrittenTimestamp;
    HealthRecord existing;
    if (read(existing) && existing.lastUpdateTimestamp > newest) {
        newest = existing.lastUpdateTimestamp;
    }
    if (record.lastUpdateTimestamp < newest) {
        logger->debug("Skipping health update older than the current record ({} < {})", (long long)record.lastUpdateTimestamp, (long long)newest);
        return false;
    }

    if (!MailUtils::writeFileAtomically(context.healthPath, record.serialize())) {
        logger->warn("Could not write health record to {}", context.healthPath);
        return false;
    }
    lastWrittenTimestamp = record.lastUpdateTimestamp;
    return true;
}

bool HealthSupervisor::read(HealthRecord & out) const {
    std::string contents;
    if (!MailUtils::readFile(context.healthPath, contents)) {
        return false;
    }
    return HealthRecord::parse(contents, out);
}

HealthReport HealthSupervisor::evaluate(time_t now) const {
    HealthReport report;

    std::string pidContents;
    if (!MailUtils::readFile(context.pidPath, pidContents)) {
        report.reason = "Process is not running";
        return report;
    }
    std::string pidString = MailUtils::trim(pidContents);
    char * end = nullptr;
    long pid = strtol(pidString.c_str(), &end, 10);
    if (pidString == "" || *end != '\0' || pid <= 0) {
        report.reason = "Process identity file is invalid";
        return report;
    }
    // EPERM still means the process exists, it just belongs to someone else.
    if (kill((pid_t)pid, 0) != 0 && errno != EPERM) {
        report.reason = "Process is not running";
        return report;
    }

    HealthRecord record;
    if (!read(record)) {
        report.reason = "Health status file not found";
        return report;
    }
    if (record.status != HealthStatus::Healthy) {
        report.reason = "Service reported unhealthy status";
        return report;
    }
    long long age = (long long)(now - record.lastUpdateTimestamp);
    if (age > HEALTH_MAX_AGE_SECONDS) {
        report.reason = "Health status is stale (" + std::to_string(age) + " seconds old)";
        return report;
    }

    report.healthy = true;
    return report;
}

void HealthSupervisor::clear() {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (remove(context.healthPath.c_str()) != 0 && errno != ENOENT) {
        logger->warn("Could not remove health record {}", context.healthPath);
    }
    lastWrittenTimestamp = 0;
}
