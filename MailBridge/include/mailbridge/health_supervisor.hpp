/** HealthSupervisor [MailBridge]
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

#ifndef HealthSupervisor_hpp
#define HealthSupervisor_hpp

#include <memory>
#include <mutex>
#include <string>
#include <time.h>

#include "spdlog/spdlog.h"

#include "mailbridge/runtime_context.hpp"
#include "mailbridge/models/health_record.hpp"
#include "mailbridge/models/sync_attempt.hpp"

struct HealthReport {
    bool healthy = false;
    std::string reason;
};

class HealthSupervisor {
    RuntimeContext context;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex writeMtx;
    time_t lastWrittenTimestamp;

public:
    HealthSupervisor(RuntimeContext context);

    void recordHeartbeat(time_t now = time(0));
    void recordAttempt(const SyncAttempt & attempt);

    // Returns false if the record was not written, either because the disk
    // write failed or because a newer record is already on disk.
    bool write(HealthRecord record);

    bool read(HealthRecord & out) const;
    HealthReport evaluate(time_t now = time(0)) const;

    void clear();
};

#endif /* HealthSupervisor_hpp */
