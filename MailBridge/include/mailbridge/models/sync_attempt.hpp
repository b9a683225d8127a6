/** SyncAttempt [MailBridge]
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

#ifndef SyncAttempt_hpp
#define SyncAttempt_hpp

#include <string>
#include <time.h>
#include "nlohmann/json.hpp"

struct TransferStatistics {
    long long messagesTransferred = 0;
    long long messagesSkipped = 0;
    long long bytesTransferred = 0;
};

// Counters missing from the engine output are left at zero.
TransferStatistics ParseTransferStatistics(const std::string & output);

class SyncAttempt {
    time_t _startTime;
    time_t _endTime;
    int _exitCode;
    bool _timedOut;
    bool _cancelled;
    TransferStatistics _stats;

public:
    SyncAttempt(time_t startTime, time_t endTime, int exitCode, bool timedOut, bool cancelled, TransferStatistics stats);

    time_t startTime() const;
    time_t endTime() const;
    long long durationSeconds() const;

    bool succeeded() const;
    int exitCode() const;
    bool timedOut() const;
    bool cancelled() const;

    long long messagesTransferred() const;
    long long messagesSkipped() const;
    long long bytesTransferred() const;

    nlohmann::json toJSON() const;
};

#endif /* SyncAttempt_hpp */
