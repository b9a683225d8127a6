/** Daemon [MailBridge]
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

#ifndef Daemon_hpp
#define Daemon_hpp

#include <memory>

#include "mailbridge/lifecycle_manager.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/models/sync_configuration.hpp"

/*
 The long-running sync service: prepares the runtime directories, configures
 logging, waits for configuration and drives the selected mode until a
 termination signal arrives. run() returns the process exit code.
*/
class Daemon {
    RuntimeContext context;
    bool verbose;
    ShutdownSignal shutdownSignal;
    LifecycleManager lifecycle;

    void runStartupConnectionTest(std::shared_ptr<const SyncConfiguration> config);

public:
    Daemon(RuntimeContext context, bool verbose);

    int run();
};

#endif /* Daemon_hpp */
