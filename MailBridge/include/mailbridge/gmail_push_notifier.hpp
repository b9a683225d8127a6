/** GmailPushNotifier [MailBridge]
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

#ifndef GmailPushNotifier_hpp
#define GmailPushNotifier_hpp

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailbridge/change_notifier.hpp"
#include "mailbridge/google_token_manager.hpp"
#include "mailbridge/models/sync_configuration.hpp"

#define GMAIL_API_ROOT   "https://gmail.googleapis.com/gmail/v1"
#define PUBSUB_API_ROOT  "https://pubsub.googleapis.com/v1"

/*
 Registers a Gmail watch that publishes mailbox changes to a Pub/Sub topic,
 then synchronously pulls the subscription. The topic and subscription must
 already exist. Gmail expires watches after seven days, refresh() renews it.
*/
class GmailPushNotifier : public ChangeNotifier {
    PushSettings settings;
    std::string folder;
    GoogleTokenManager tokens;
    std::shared_ptr<spdlog::logger> logger;

    std::atomic<bool> interruptRequested;
    std::mutex waitMtx;
    std::condition_variable waitCv;

    void watch();
    std::vector<std::string> pull(int timeoutSeconds, bool & timedOut);
    void acknowledge(const std::vector<std::string> & ackIds);
    std::string subscriptionURL(const std::string & action);

public:
    GmailPushNotifier(const SyncConfiguration & config);

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

#endif /* GmailPushNotifier_hpp */
