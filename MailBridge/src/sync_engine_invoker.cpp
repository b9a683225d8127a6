#include "mailbridge/sync_engine_invoker.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/sync_exception.hpp"

#include <cstdio>
#include <errno.h>

SyncEngineInvoker::SyncEngineInvoker(std::shared_ptr<ProcessRunner> runner, HealthSupervisor & health, RuntimeContext context, ShutdownSignal & shutdownSignal, std::chrono::seconds timeout) :
    runner(runner),
    health(health),
    context(context),
    shutdownSignal(shutdownSignal),
    timeout(timeout),
    logger(spdlog::get("logger"))
{
}

void SyncEngineInvoker::logOutputBlock(const std::string & title, const std::vector<std::string> & lines, time_t when) {
    logger->info("=== {} {} ===", title, MailUtils::localTimestampForTime(when));
    for (const auto & line : lines) {
        logger->info("{}", line);
    }
    logger->info("=== End {} ===", title);
}

SyncAttempt SyncEngineInvoker::runAttempt(const ParameterSet & params) {
    std::lock_guard<std::mutex> lock(attemptMtx);

    logger->info("Starting email synchronization...");
    logger->debug("Sync command: {}", RedactedCommand(params));

    time_t start = time(0);
    ProcessResult result;
    try {
        result = runner->run(params, context.engineOutputPath, timeout, [this]() {
            return shutdownSignal.isShutdownRequested();
        });
    } catch (SyncException & ex) {
        // could not start or supervise the engine, this counts as a failed attempt
        logger->error("Could not run sync engine: {}", ex.toJSON().dump());
        result.exitCode = -1;
    }
    time_t end = time(0);

    std::string output = "";
    MailUtils::readFile(context.engineOutputPath, output);
    if (remove(context.engineOutputPath.c_str()) != 0 && errno != ENOENT) {
        logger->warn("Could not remove {}", context.engineOutputPath);
    }

    TransferStatistics stats;
    bool ok = result.exitCode == 0 && !result.timedOut && !result.aborted;
    if (ok) {
        stats = ParseTransferStatistics(output);
    }
    SyncAttempt attempt(start, end, result.exitCode, result.timedOut, result.aborted, stats);

    if (attempt.cancelled()) {
        logger->info("Synchronization interrupted by shutdown after {} seconds", attempt.durationSeconds());
        return attempt;
    }

    if (attempt.succeeded()) {
        logOutputBlock("Sync Details", MailUtils::splitLines(output), end);
        logger->info("Synchronization completed successfully in {} seconds ({} transferred, {} skipped, {} bytes)",
                     attempt.durationSeconds(), attempt.messagesTransferred(), attempt.messagesSkipped(), attempt.bytesTransferred());
    } else {
        if (attempt.timedOut()) {
            logger->error("Synchronization timed out after {} seconds", timeout.count());
        } else {
            logger->error("Synchronization failed with exit code: {}", attempt.exitCode());
        }
        logger->error("Sync duration: {} seconds", attempt.durationSeconds());
        logOutputBlock("Sync Error Details", MailUtils::lastLines(output, ENGINE_ERROR_TAIL_LINES), end);
    }

    health.recordAttempt(attempt);
    return attempt;
}
