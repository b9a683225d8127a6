/** ConfigResolver [MailBridge]
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

#ifndef ConfigResolver_hpp
#define ConfigResolver_hpp

#include <chrono>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailbridge/constants.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/models/sync_configuration.hpp"

class EnvFileLoader {
public:
    // Loads the first of .env.test, .env, .env.example found in `dir` and
    // returns its path, or "" if none exist. Variables already present in the
    // environment are left alone.
    static std::string loadFirstAvailable(const std::string & dir);

    static bool loadFile(const std::string & path);
};

class ConfigResolver {
    std::string appDir;
    ShutdownSignal & shutdownSignal;
    std::chrono::milliseconds recheckInterval;
    std::shared_ptr<spdlog::logger> logger;
    bool diagnosticsLogged;

    int intFromEnv(const std::string & name, int fallback);
    nlohmann::json endpointFromEnv(const std::string & suffix);
    void logEnvironmentDiagnostics();

public:
    ConfigResolver(std::string appDir, ShutdownSignal & shutdownSignal, std::chrono::milliseconds recheckInterval = std::chrono::seconds(CONFIG_RECHECK_SECONDS));

    static void applyAliases();

    // Reads the current process environment. Does not validate.
    nlohmann::json buildConfiguration();

    // Blocks until every required field is present. Returns nullptr only when
    // shutdown is requested while waiting.
    std::shared_ptr<const SyncConfiguration> resolve();
};

#endif /* ConfigResolver_hpp */
