/** HealthRecord [MailBridge]
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

#ifndef HealthRecord_hpp
#define HealthRecord_hpp

#include <string>
#include <time.h>

enum class HealthStatus {
    Healthy,
    Unhealthy,
    Unknown
};

std::string HealthStatusToken(HealthStatus status);
HealthStatus HealthStatusFromToken(std::string token);

/*
 On-disk format, shared with anything that probes the container:

   healthy
   1700000000

 Line one is the status token, line two the unix time of the last update.
*/
struct HealthRecord {
    HealthStatus status = HealthStatus::Unknown;
    time_t lastUpdateTimestamp = 0;

    std::string serialize() const;
    static bool parse(const std::string & contents, HealthRecord & out);
};

#endif /* HealthRecord_hpp */
