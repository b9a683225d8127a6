/** LifecycleManager [MailBridge]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef LifecycleManager_hpp
#define LifecycleManager_hpp

#include <atomic>
#include <memory>
#include <thread>

#include <signal.h>

#include "spdlog/spdlog.h"

#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"

struct DirectoryStatus {
    bool logDirWritable = false;
    bool dataDirWritable = false;
};

/*
 Owns process-level state: the runtime directories, the pid file and the
 termination signals. Signals are consumed by a dedicated watcher thread,
 which keeps all real work out of signal context.

 A thread inherits the signal mask of the thread that creates it, so
 blockTerminationSignals() must run on the main thread before anything else
 starts a thread (the log flusher included). Otherwise the kernel may deliver
 SIGTERM to a thread that never blocked it and the default action kills the
 process.
*/
class LifecycleManager {
    RuntimeContext context;
    ShutdownSignal & shutdownSignal;

    std::atomic<bool> watcherStop;
    std::thread watcherThread;
    sigset_t watchedSignals;
    sigset_t previousMask;
    bool signalsBlocked;
    bool handlersInstalled;

    void runSignalWatcher(sigset_t watched);

public:
    LifecycleManager(RuntimeContext context, ShutdownSignal & shutdownSignal);
    ~LifecycleManager();

    // Throws SyncException (fatal-startup) when the data directory is unusable.
    // An unusable log directory is reported in the result only, logging is
    // configured after this runs.
    DirectoryStatus prepareDirectories();

    bool writeProcessIdentity();

    // Blocks SIGTERM, SIGINT and SIGHUP in the calling thread.
    void blockTerminationSignals();

    // Blocks the signals if that has not happened yet and starts the watcher.
    void installSignalHandlers();

    int shutdown();
};

#endif /* LifecycleManager_hpp */
