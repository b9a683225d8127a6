/** SyncException [MailBridge]
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

#ifndef SyncException_hpp
#define SyncException_hpp

#include <string>

#include "MailCore/MailCore.h"
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "mailbridge/generic_exception.hpp"

// Error keys shared between the orchestrator components
#define ERROR_KEY_CONFIG_INCOMPLETE         "config-incomplete"
#define ERROR_KEY_COLLABORATOR_UNAVAILABLE  "collaborator-unavailable"
#define ERROR_KEY_PERMISSION_DEGRADED       "permission-degraded"
#define ERROR_KEY_FATAL_STARTUP             "fatal-startup"

class SyncException : public GenericException {
    bool retryable = false;
    bool offline = false;

public:
    SyncException(std::string key, std::string di, bool retryable);
    SyncException(CURLcode c, std::string di);
    SyncException(mailcore::ErrorCode c, std::string di);
    std::string key;
    std::string debuginfo;
    bool isRetryable();
    bool isOffline();
    const char * what() const noexcept override;
    nlohmann::json toJSON() override;
};


#endif /* SyncException_hpp */
