#include "mailbridge/imap_idle_notifier.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/sync_exception.hpp"
#include "mailbridge/thread_utils.hpp"

#include <thread>

using namespace mailcore;

ImapIdleNotifier::ImapIdleNotifier(const SyncConfiguration & config) :
    endpoint(config.source()),
    folder(config.folder()),
    refreshSeconds(config.idleRefreshSeconds()),
    session(IMAPSession()),
    logger(spdlog::get("logger")),
    idling(false),
    interruptRequested(false),
    deadlineReached(false)
{
    MailUtils::configureSessionForEndpoint(session, endpoint);
}

ImapIdleNotifier::~ImapIdleNotifier() {
    session.disconnect();
}

std::string ImapIdleNotifier::name() {
    return "IMAP IDLE";
}

void ImapIdleNotifier::connect() {
    ErrorCode err = ErrorCode::ErrorNone;
    session.connectIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "connectIfNeeded");
    }
    session.loginIfNeeded(&err);
    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "loginIfNeeded");
    }
}

bool ImapIdleNotifier::isAvailable() {
    AutoreleasePool pool;
    try {
        connect();
    } catch (SyncException & ex) {
        logger->warn("Could not connect to {} to check IDLE support: {}", endpoint.host, ex.toJSON().dump());
        session.disconnect();
        return false;
    }

    ErrorCode err = ErrorCode::ErrorNone;
    IndexSet * capabilities = session.storedCapabilities();
    if (capabilities == nullptr || capabilities->count() == 0) {
        capabilities = session.capability(&err);
    }
    if (err != ErrorCode::ErrorNone || capabilities == nullptr || !capabilities->containsIndex(IMAPCapabilityIdle)) {
        logger->warn("Server {} does not advertise IDLE", endpoint.host);
        session.disconnect();
        return false;
    }
    return true;
}

void ImapIdleNotifier::start() {
    AutoreleasePool pool;
    {
        std::unique_lock<std::mutex> lck(idleMtx);
        if (interruptRequested) {
            return;
        }
    }
    connect();
    logger->info("Connected to {} as {}, watching folder {}", endpoint.host, endpoint.user, folder);
}

NotifierEvent ImapIdleNotifier::waitForChange(std::chrono::seconds timeout) {
    AutoreleasePool pool;
    {
        std::unique_lock<std::mutex> lck(idleMtx);
        if (interruptRequested) {
            interruptRequested = false;
            return NotifierEvent::Interrupted;
        }
    }

    connect();

    if (!session.setupIdle()) {
        session.disconnect();
        throw SyncException(ErrorCode::ErrorIdle, "setupIdle");
    }

    {
        std::unique_lock<std::mutex> lck(idleMtx);
        idling = true;
        deadlineReached = false;
        if (interruptRequested) {
            session.interruptIdle();
        }
    }

    std::thread watchdog([this, timeout]() {
        SetThreadName("idle-watchdog");
        std::unique_lock<std::mutex> lck(idleMtx);
        if (!idleCv.wait_for(lck, timeout, [this]() { return !idling; })) {
            deadlineReached = true;
            session.interruptIdle();
        }
    });

    logger->debug("Idling on folder {} for up to {} seconds", folder, timeout.count());
    ErrorCode err = ErrorCode::ErrorNone;
    String path = AS_MCSTR(folder);
    session.idle(&path, 0, &err);

    {
        std::unique_lock<std::mutex> lck(idleMtx);
        idling = false;
    }
    idleCv.notify_all();
    watchdog.join();
    session.unsetupIdle();

    if (err != ErrorCode::ErrorNone) {
        session.disconnect();
        throw SyncException(err, "idle");
    }

    std::unique_lock<std::mutex> lck(idleMtx);
    if (interruptRequested) {
        interruptRequested = false;
        return NotifierEvent::Interrupted;
    }
    if (deadlineReached) {
        return NotifierEvent::TimedOut;
    }
    logger->info("IDLE notification received for folder {}", folder);
    return NotifierEvent::Changed;
}

void ImapIdleNotifier::refresh() {
    logger->info("Refreshing IDLE connection to {}", endpoint.host);
    session.disconnect();
}

void ImapIdleNotifier::interrupt() {
    std::unique_lock<std::mutex> lck(idleMtx);
    interruptRequested = true;
    if (idling) {
        session.interruptIdle();
    }
    idleCv.notify_all();
}

void ImapIdleNotifier::stop() {
    logger->info("Closing IDLE connection to {}", endpoint.host);
    session.disconnect();
}

int ImapIdleNotifier::refreshIntervalSeconds() {
    return refreshSeconds;
}

int ImapIdleNotifier::retryDelaySeconds(int) {
    return IDLE_RETRY_SECONDS;
}
