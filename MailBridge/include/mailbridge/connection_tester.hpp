/** ConnectionTester [MailBridge]
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

#ifndef ConnectionTester_hpp
#define ConnectionTester_hpp

#include <functional>
#include <memory>
#include <string>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

#include "mailbridge/models/sync_configuration.hpp"

class AccumulatorLogger : public mailcore::ConnectionLogger {
public:
    std::string accumulated;

    void log(std::string str);
    void log(void * sender, mailcore::ConnectionLogType logType, mailcore::Data * buffer) override;
};

/*
 Logs into the source and then the destination and returns
 {"error": null | "<ErrorCode name>", "error_service": "source" | "destination", "log": "..."}

 shouldAbort is checked before each endpoint. An aborted run reports the
 error "Cancelled" for the endpoint that was skipped.
*/
class ConnectionTester {
    std::shared_ptr<const SyncConfiguration> config;

    mailcore::ErrorCode testEndpoint(const EndpointSettings & endpoint, const std::string & folder, AccumulatorLogger & logger);

public:
    ConnectionTester(std::shared_ptr<const SyncConfiguration> config);

    nlohmann::json run(std::function<bool()> shouldAbort = nullptr);
};

#endif /* ConnectionTester_hpp */
