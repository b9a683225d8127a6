/** SyncStrategies [MailBridge]
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

#ifndef SyncStrategies_hpp
#define SyncStrategies_hpp

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "mailbridge/change_notifier.hpp"
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/sync_engine_invoker.hpp"
#include "mailbridge/models/sync_configuration.hpp"

/*
 A strategy owns the loop that decides when to run the engine. run() returns
 once shutdown has been requested; a non-retryable collaborator error escapes
 as a SyncException.
*/
class SyncStrategy {
protected:
    std::shared_ptr<const SyncConfiguration> config;
    SyncEngineInvoker & invoker;
    HealthSupervisor & health;
    ShutdownSignal & shutdownSignal;
    std::shared_ptr<spdlog::logger> logger;

    SyncAttempt runAttempt();

public:
    SyncStrategy(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal);
    virtual ~SyncStrategy() {}

    virtual std::string name() = 0;
    virtual void run() = 0;
};

class PollStrategy : public SyncStrategy {
public:
    using SyncStrategy::SyncStrategy;

    std::string name() override;
    void run() override;
};

class NotificationStrategy : public SyncStrategy {
    std::shared_ptr<ChangeNotifier> notifier;

    SyncAttempt runPeriodicSync();

public:
    NotificationStrategy(std::shared_ptr<const SyncConfiguration> config, SyncEngineInvoker & invoker, HealthSupervisor & health, ShutdownSignal & shutdownSignal, std::shared_ptr<ChangeNotifier> notifier);

    std::string name() override;
    void run() override;
};

#endif /* SyncStrategies_hpp */
