/** SyncConfiguration [MailBridge]
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

#ifndef SyncConfiguration_hpp
#define SyncConfiguration_hpp

#include <string>
#include <vector>
#include "nlohmann/json.hpp"

enum class SyncMode {
    Poll,
    Idle,
    Push
};

std::string SyncModeName(SyncMode mode);
SyncMode SyncModeFromString(std::string value, bool * recognized = nullptr);

// One side of the synchronization pair.
struct EndpointSettings {
    std::string host;
    unsigned int port = 0;
    std::string user;
    std::string secret;
    bool useTLS = true;
    bool skipTLS = false;

    // 993 for implicit TLS, 143 otherwise, unless a port was configured.
    unsigned int effectivePort() const;
};

struct PushSettings {
    std::string projectId;
    std::string topic;
    std::string subscription;
    std::string credentialsPath;
    std::string tokenPath;
};

/*
 SyncConfiguration is produced once by the ConfigResolver and is read-only
 afterwards. Like the account model it wraps a JSON document, and missing
 optional keys resolve to the documented defaults in the accessors.
*/
class SyncConfiguration {
    nlohmann::json _data;

public:
    SyncConfiguration(nlohmann::json json);

    // Returns the names of missing required fields, or an empty vector.
    std::vector<std::string> missingRequiredFields() const;
    bool valid() const;

    EndpointSettings source() const;
    EndpointSettings destination() const;

    std::string folder() const;
    bool moveMode() const;
    int dateFilterDays() const;
    int maxEmailsPerSync() const;
    long long maxEmailSizeBytes() const;

    SyncMode mode() const;
    int pollIntervalSeconds() const;
    int idleRefreshSeconds() const;

    std::string engineBinary() const;
    int engineTimeoutSeconds() const;
    bool engineDebug() const;
    bool connectionTest() const;

    PushSettings push() const;

    // Secrets are replaced with [HIDDEN].
    nlohmann::json toJSON() const;

private:
    EndpointSettings endpointAt(const char * key) const;
    int positiveIntAt(const char * key, int fallback) const;
};

#endif /* SyncConfiguration_hpp */
