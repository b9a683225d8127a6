#include "mailbridge/mode_dispatcher.hpp"
#include "mailbridge/sync_exception.hpp"

ModeDispatcher::ModeDispatcher(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal,
                               std::shared_ptr<ChangeNotifier> idleNotifier, std::shared_ptr<ChangeNotifier> pushNotifier) :
    config(config),
    invoker(invoker),
    health(health),
    shutdownSignal(shutdownSignal),
    idleNotifier(idleNotifier),
    pushNotifier(pushNotifier),
    logger(spdlog::get("logger"))
{
}

std::unique_ptr<SyncStrategy> ModeDispatcher::selectStrategy() {
    SyncMode mode = config->mode();
    if (mode == SyncMode::Poll) {
        return std::unique_ptr<SyncStrategy>(new PollStrategy(config, invoker, health, shutdownSignal));
    }

    std::shared_ptr<ChangeNotifier> notifier = (mode == SyncMode::Idle) ? idleNotifier : pushNotifier;
    std::string label = (mode == SyncMode::Idle) ? "IMAP IDLE" : "Gmail push";

    bool available = false;
    if (notifier) {
        try {
            available = notifier->isAvailable();
        } catch (SyncException & ex) {
            logger->warn("{} capability check failed: {}", label, ex.toJSON().dump());
        }
    }
    if (!available) {
        logger->error("{} is not available, falling back to polling mode", label);
        return std::unique_ptr<SyncStrategy>(new PollStrategy(config, invoker, health, shutdownSignal));
    }
    return std::unique_ptr<SyncStrategy>(new NotificationStrategy(config, invoker, health, shutdownSignal, notifier));
}

void ModeDispatcher::run() {
    logger->info("Sync mode: {}", SyncModeName(config->mode()));
    if (shutdownSignal.isShutdownRequested()) {
        // skip the capability check, it may block on a network connection
        logger->info("Shutdown requested before sync started");
        return;
    }
    std::unique_ptr<SyncStrategy> strategy = selectStrategy();
    strategy->run();
    logger->info("{} strategy stopped", strategy->name());
}
