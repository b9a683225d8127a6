/** GoogleTokenManager [MailBridge]
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

#ifndef GoogleTokenManager_hpp
#define GoogleTokenManager_hpp

#include <memory>
#include <mutex>
#include <string>
#include <time.h>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailbridge/models/sync_configuration.hpp"

#define GOOGLE_DEFAULT_TOKEN_URL "https://oauth2.googleapis.com/token"

struct GoogleTokenParts {
    std::string clientId;
    std::string clientSecret;
    std::string refreshToken;
    std::string tokenURL;
};

/*
 Exchanges the stored refresh token for short-lived access tokens. The token
 file is the authorized-user JSON written by the consent flow; client details
 missing from it are read from the OAuth client credentials file.
*/
class GoogleTokenManager {
    std::string credentialsPath;
    std::string tokenPath;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex _cacheLock;
    std::string _accessToken;
    time_t _expiryDate;

    void persistRefreshToken(const std::string & refreshToken);

public:
    GoogleTokenManager(const PushSettings & settings);

    // Throws SyncException (non-retryable) when the files are missing or incomplete.
    GoogleTokenParts loadParts();

    // True if loadParts would succeed. `reason` receives the failure otherwise.
    bool hasRefreshCredentials(std::string * reason = nullptr);

    std::string accessToken();
    void invalidate();
};

#endif /* GoogleTokenManager_hpp */
