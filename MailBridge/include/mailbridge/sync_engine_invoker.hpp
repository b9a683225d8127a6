/** SyncEngineInvoker [MailBridge]
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

#ifndef SyncEngineInvoker_hpp
#define SyncEngineInvoker_hpp

#include <chrono>
#include <memory>
#include <mutex>

#include "spdlog/spdlog.h"

#include "mailbridge/command_builder.hpp"
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/process_runner.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/models/sync_attempt.hpp"

class SyncEngineInvoker {
    std::shared_ptr<ProcessRunner> runner;
    HealthSupervisor & health;
    RuntimeContext context;
    ShutdownSignal & shutdownSignal;
    std::chrono::seconds timeout;
    std::shared_ptr<spdlog::logger> logger;

    // at most one engine process at a time
    std::mutex attemptMtx;

    void logOutputBlock(const std::string & title, const std::vector<std::string> & lines, time_t when);

public:
    SyncEngineInvoker(std::shared_ptr<ProcessRunner> runner, HealthSupervisor & health, RuntimeContext context, ShutdownSignal & shutdownSignal, std::chrono::seconds timeout);

    // Runs the engine once and records the outcome with the health supervisor.
    // Engine failures are reported in the result, never thrown.
    SyncAttempt runAttempt(const ParameterSet & params);
};

#endif /* SyncEngineInvoker_hpp */
