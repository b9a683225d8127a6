#include "mailbridge/sync_strategies.hpp"
#include "mailbridge/command_builder.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/sync_exception.hpp"

#include <algorithm>
#include <chrono>

SyncStrategy::SyncStrategy(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal) :
    config(config),
    invoker(invoker),
    health(health),
    shutdownSignal(shutdownSignal),
    logger(spdlog::get("logger"))
{
}

SyncAttempt SyncStrategy::runAttempt() {
    return invoker.runAttempt(BuildSyncCommand(*config));
}

// Poll

std::string PollStrategy::name() {
    return "poll";
}

void PollStrategy::run() {
    int interval = config->pollIntervalSeconds();
    logger->info("Starting traditional polling mode...");

    while (!shutdownSignal.isShutdownRequested()) {
        health.recordHeartbeat();

        SyncAttempt attempt = runAttempt();
        if (attempt.cancelled()) {
            break;
        }
        if (attempt.succeeded()) {
            logger->info("Sync cycle completed, waiting {} seconds...", interval);
        } else {
            logger->warn("Sync cycle failed, waiting {} seconds before retry...", interval);
        }

        if (!shutdownSignal.sleepFor(std::chrono::seconds(interval))) {
            break;
        }
    }
}

// Idle / Push

NotificationStrategy::NotificationStrategy(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal, std::shared_ptr<ChangeNotifier> notifier) :
    SyncStrategy(config, invoker, health, shutdownSignal),
    notifier(notifier)
{
}

std::string NotificationStrategy::name() {
    return notifier->name();
}

SyncAttempt NotificationStrategy::runPeriodicSync() {
    logger->info("Performing periodic sync ({} second refresh interval)", notifier->refreshIntervalSeconds());
    return runAttempt();
}

void NotificationStrategy::run() {
    logger->info("Starting {} synchronization...", notifier->name());

    std::shared_ptr<ChangeNotifier> n = notifier;
    shutdownSignal.addShutdownHandler([n]() {
        n->interrupt();
    });

    const auto refreshInterval = std::chrono::seconds(notifier->refreshIntervalSeconds());
    const auto heartbeatInterval = std::chrono::seconds(HEARTBEAT_INTERVAL_SECONDS);
    auto nextRefresh = std::chrono::steady_clock::now() + refreshInterval;

    bool started = false;
    bool needsRefresh = false;
    int consecutiveFailures = 0;

    // While the engine is failing, heartbeats would overwrite the unhealthy
    // record it left. They resume after the next successful attempt.
    bool engineFailing = false;
    auto noteAttempt = [&engineFailing](const SyncAttempt & attempt) {
        if (!attempt.cancelled()) {
            engineFailing = !attempt.succeeded();
        }
    };

    while (!shutdownSignal.isShutdownRequested()) {
        try {
            if (!started) {
                notifier->start();
                started = true;
                needsRefresh = false;
                health.recordHeartbeat();
                noteAttempt(runAttempt());
                nextRefresh = std::chrono::steady_clock::now() + refreshInterval;
                continue;
            }
            if (needsRefresh) {
                notifier->refresh();
                needsRefresh = false;
            }

            if (!engineFailing) {
                health.recordHeartbeat();
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= nextRefresh) {
                noteAttempt(runPeriodicSync());
                nextRefresh = std::chrono::steady_clock::now() + refreshInterval;
                notifier->refresh();
                continue;
            }

            auto untilRefresh = std::chrono::duration_cast<std::chrono::seconds>(nextRefresh - now) + std::chrono::seconds(1);
            auto wait = std::min(heartbeatInterval, untilRefresh);

            NotifierEvent event = notifier->waitForChange(wait);
            consecutiveFailures = 0;

            if (event == NotifierEvent::Changed && !shutdownSignal.isShutdownRequested()) {
                logger->info("Change detected, starting sync");
                noteAttempt(runAttempt());
            }
        } catch (SyncException & ex) {
            if (shutdownSignal.isShutdownRequested()) {
                break;
            }
            if (!ex.isRetryable()) {
                logger->error("{} failed with a non-retryable error: {}", notifier->name(), ex.toJSON().dump());
                notifier->stop();
                throw;
            }
            consecutiveFailures++;
            int delay = notifier->retryDelaySeconds(consecutiveFailures);
            logger->error("{} error: {}", notifier->name(), ex.toJSON().dump());
            logger->info("Reconnecting in {} seconds...", delay);
            if (!shutdownSignal.sleepFor(std::chrono::seconds(delay))) {
                break;
            }
            needsRefresh = started;
        }
    }

    notifier->stop();
}
