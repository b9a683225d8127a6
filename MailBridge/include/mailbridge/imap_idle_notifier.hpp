/** ImapIdleNotifier [MailBridge]
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

#ifndef ImapIdleNotifier_hpp
#define ImapIdleNotifier_hpp

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "mailbridge/change_notifier.hpp"
#include "mailbridge/models/sync_configuration.hpp"

/*
 Holds an IMAP IDLE session open on the source folder. Each waitForChange
 enters IDLE and a watchdog thread interrupts it when the timeout expires, so
 the strategy regains control at least once per timeout.
*/
class ImapIdleNotifier : public ChangeNotifier {
    EndpointSettings endpoint;
    std::string folder;
    int refreshSeconds;

    mailcore::IMAPSession session;
    std::shared_ptr<spdlog::logger> logger;

    std::mutex idleMtx;
    std::condition_variable idleCv;
    bool idling;
    bool interruptRequested;
    bool deadlineReached;

    void connect();

public:
    ImapIdleNotifier(const SyncConfiguration & config);
    ~ImapIdleNotifier();

    std::string name() override;
    bool isAvailable() override;

    void start() override;
    NotifierEvent waitForChange(std::chrono::seconds timeout) override;
    void refresh() override;
    void interrupt() override;
    void stop() override;

    int refreshIntervalSeconds() override;
    int retryDelaySeconds(int consecutiveFailures) override;
};

#endif /* ImapIdleNotifier_hpp */
