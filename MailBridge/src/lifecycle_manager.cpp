#include "mailbridge/lifecycle_manager.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/sync_exception.hpp"
#include "mailbridge/thread_utils.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>
#include <pthread.h>
#include <time.h>
#include <unistd.h>

LifecycleManager::LifecycleManager(RuntimeContext context, ShutdownSignal & shutdownSignal) :
    context(context),
    shutdownSignal(shutdownSignal),
    watcherStop(false),
    signalsBlocked(false),
    handlersInstalled(false)
{
    sigemptyset(&watchedSignals);
    sigaddset(&watchedSignals, SIGTERM);
    sigaddset(&watchedSignals, SIGINT);
    sigaddset(&watchedSignals, SIGHUP);
    sigemptyset(&previousMask);
}

LifecycleManager::~LifecycleManager() {
    if (watcherThread.joinable()) {
        watcherStop = true;
        watcherThread.join();
    }
    if (signalsBlocked) {
        pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
    }
}

DirectoryStatus LifecycleManager::prepareDirectories() {
    DirectoryStatus status;

    status.dataDirWritable = MailUtils::ensureDirectory(context.dataDir) && MailUtils::isDirectoryWritable(context.dataDir);
    if (!status.dataDirWritable) {
        throw SyncException(ERROR_KEY_FATAL_STARTUP, "data directory " + context.dataDir + " is not writable", false);
    }

    status.logDirWritable = MailUtils::ensureDirectory(context.logDir) && MailUtils::isDirectoryWritable(context.logDir);
    return status;
}

bool LifecycleManager::writeProcessIdentity() {
    auto logger = spdlog::get("logger");
    if (!MailUtils::writeFileAtomically(context.pidPath, std::to_string(getpid()) + "\n")) {
        if (logger) {
            logger->warn("Could not write process id to {}, health checks will report the service as down", context.pidPath);
        }
        return false;
    }
    if (logger) {
        logger->debug("Wrote process id {} to {}", getpid(), context.pidPath);
    }
    return true;
}

void LifecycleManager::blockTerminationSignals() {
    if (signalsBlocked) {
        return;
    }
    int rc = pthread_sigmask(SIG_BLOCK, &watchedSignals, &previousMask);
    if (rc != 0) {
        throw SyncException(ERROR_KEY_FATAL_STARTUP, "pthread_sigmask failed: " + std::to_string(rc), false);
    }
    signalsBlocked = true;
}

void LifecycleManager::installSignalHandlers() {
    if (handlersInstalled) {
        return;
    }
    blockTerminationSignals();
    handlersInstalled = true;

    sigset_t watched = watchedSignals;
    watcherThread = std::thread([this, watched]() {
        SetThreadName("signals");
        runSignalWatcher(watched);
    });
}

void LifecycleManager::runSignalWatcher(sigset_t watched) {
    struct timespec interval;
    interval.tv_sec = 0;
    interval.tv_nsec = 200 * 1000 * 1000;

    while (!watcherStop) {
        int sig = sigtimedwait(&watched, nullptr, &interval);
        if (sig < 0) {
            // EAGAIN on timeout, EINTR when another signal arrived
            continue;
        }
        auto logger = spdlog::get("logger");
        if (logger) {
            logger->info("Received signal {} ({})", sig, strsignal(sig));
        }
        shutdownSignal.requestShutdown();
    }
}

int LifecycleManager::shutdown() {
    auto logger = spdlog::get("logger");
    if (logger) {
        logger->info("Received shutdown signal, cleaning up...");
    }

    for (const std::string & path : {context.pidPath, context.healthPath, context.engineOutputPath}) {
        if (remove(path.c_str()) != 0 && errno != ENOENT && logger) {
            logger->warn("Could not remove {}", path);
        }
    }

    if (logger) {
        logger->info("Shutdown complete");
        logger->flush();
    }
    return 0;
}
