/** ModeDispatcher [MailBridge]
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

#ifndef ModeDispatcher_hpp
#define ModeDispatcher_hpp

#include <memory>

#include "spdlog/spdlog.h"

#include "mailbridge/change_notifier.hpp"
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/sync_engine_invoker.hpp"
#include "mailbridge/sync_strategies.hpp"
#include "mailbridge/models/sync_configuration.hpp"

class ModeDispatcher {
    std::shared_ptr<const SyncConfiguration> config;
    SyncEngineInvoker & invoker;
    HealthSupervisor & health;
    ShutdownSignal & shutdownSignal;
    std::shared_ptr<ChangeNotifier> idleNotifier;
    std::shared_ptr<ChangeNotifier> pushNotifier;
    std::shared_ptr<spdlog::logger> logger;

public:
    // Either notifier may be null, the matching mode then runs as poll.
    ModeDispatcher(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal,
                   std::shared_ptr<ChangeNotifier> idleNotifier, std::shared_ptr<ChangeNotifier> pushNotifier);

    std::unique_ptr<SyncStrategy> selectStrategy();

    // Returns when shutdown is requested.
    void run();
};

#endif /* ModeDispatcher_hpp */
