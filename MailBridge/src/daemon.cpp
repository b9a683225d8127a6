#include "mailbridge/daemon.hpp"
#include "mailbridge/config_resolver.hpp"
#include "mailbridge/connection_tester.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/gmail_push_notifier.hpp"
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/imap_idle_notifier.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/mode_dispatcher.hpp"
#include "mailbridge/process_runner.hpp"
#include "mailbridge/spd_log_extensions.hpp"
#include "mailbridge/sync_engine_invoker.hpp"
#include "mailbridge/sync_exception.hpp"

#include <curl/curl.h>
#include "spdlog/spdlog.h"

Daemon::Daemon(RuntimeContext context, bool verbose) :
    context(context),
    verbose(verbose),
    lifecycle(context, shutdownSignal)
{
}

void Daemon::runStartupConnectionTest(std::shared_ptr<const SyncConfiguration> config) {
    auto logger = spdlog::get("logger");
    logger->info("Testing IMAP connections...");

    ConnectionTester tester(config);
    nlohmann::json resp = tester.run([this]() {
        return shutdownSignal.isShutdownRequested();
    });
    if (resp["error"].is_null()) {
        logger->info("Connection test successful");
        return;
    }
    if (shutdownSignal.isShutdownRequested()) {
        logger->info("Connection test abandoned, shutdown requested");
        return;
    }
    logger->error("Connection test failed: {} ({})", resp["error"].get<std::string>(), resp["error_service"].get<std::string>());
    logger->debug("Connection test log:\n{}", resp["log"].get<std::string>());
    logger->warn("Continuing startup, sync attempts will report failures until the connection succeeds");
}

int Daemon::run() {
    std::string levelName = MailUtils::getEnvUTF8("LOG_LEVEL");

    // Before ConfigureLogging, which starts the log flusher thread. Every
    // thread created from here on inherits the blocked mask.
    DirectoryStatus dirs;
    try {
        lifecycle.blockTerminationSignals();
        dirs = lifecycle.prepareDirectories();
    } catch (SyncException & ex) {
        ConfigureLogging(context, false, verbose, levelName);
        spdlog::get("logger")->critical("Cannot start: {}", ex.toJSON().dump());
        return 1;
    }

    bool fileLogging = ConfigureLogging(context, dirs.logDirWritable, verbose, levelName);
    auto logger = spdlog::get("logger");
    if (!dirs.logDirWritable) {
        SyncException degraded(ERROR_KEY_PERMISSION_DEGRADED, "log directory " + context.logDir + " is not writable", true);
        logger->warn("Logging to stdout only: {}", degraded.toJSON().dump());
    } else if (!fileLogging) {
        logger->warn("Logging to stdout only");
    }

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);
    lifecycle.installSignalHandlers();

    logger->info("IMAP Synchronization Service starting...");
    logger->info("Version: {}", MAILBRIDGE_VERSION);
    logger->info("Application directory: {}", context.appDir);

    lifecycle.writeProcessIdentity();

    ConfigResolver resolver(context.appDir, shutdownSignal);
    std::shared_ptr<const SyncConfiguration> config = resolver.resolve();
    if (!config) {
        return lifecycle.shutdown();
    }

    logger->info("Poll interval: {} seconds", config->pollIntervalSeconds());
    logger->info("Target folder: {}", config->folder());
    logger->info("Move mode: {}", config->moveMode() ? "true" : "false");
    logger->info("Date filter enabled: syncing emails from last {} days", config->dateFilterDays());
    logger->info("Max emails per sync: {}, max email size: {} bytes", config->maxEmailsPerSync(), config->maxEmailSizeBytes());
    logger->debug("Configuration: {}", config->toJSON().dump());

    if (config->connectionTest() && !shutdownSignal.isShutdownRequested()) {
        runStartupConnectionTest(config);
    }
    if (shutdownSignal.isShutdownRequested()) {
        return lifecycle.shutdown();
    }

    HealthSupervisor health(context);
    SyncEngineInvoker invoker(std::make_shared<ForkExecProcessRunner>(), health, context, shutdownSignal, std::chrono::seconds(config->engineTimeoutSeconds()));

    std::shared_ptr<ChangeNotifier> idleNotifier = nullptr;
    std::shared_ptr<ChangeNotifier> pushNotifier = nullptr;
    if (config->mode() == SyncMode::Idle) {
        idleNotifier = std::make_shared<ImapIdleNotifier>(*config);
    } else if (config->mode() == SyncMode::Push) {
        pushNotifier = std::make_shared<GmailPushNotifier>(*config);
    }

    ModeDispatcher dispatcher(config, invoker, health, shutdownSignal, idleNotifier, pushNotifier);
    try {
        dispatcher.run();
    } catch (SyncException & ex) {
        logger->critical("Sync stopped with a fatal error: {}", ex.toJSON().dump());
        lifecycle.shutdown();
        return 1;
    }

    return lifecycle.shutdown();
}
