/** ChangeNotifier [MailBridge]
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

#ifndef ChangeNotifier_hpp
#define ChangeNotifier_hpp

#include <chrono>
#include <string>

enum class NotifierEvent {
    Changed,
    TimedOut,
    Interrupted
};

/*
 A source of "something changed on the source mailbox" events. Implementations
 throw SyncException from start / waitForChange / refresh; the strategy decides
 whether to retry based on isRetryable().

 Everything except interrupt() is called from the strategy thread only.
 interrupt() may be called from any thread and must make a pending
 waitForChange return promptly.
*/
class ChangeNotifier {
public:
    virtual ~ChangeNotifier() {}

    virtual std::string name() = 0;

    // Capability negotiation. False means the strategy should fall back to polling.
    virtual bool isAvailable() = 0;

    virtual void start() = 0;
    virtual NotifierEvent waitForChange(std::chrono::seconds timeout) = 0;
    virtual void refresh() = 0;
    virtual void interrupt() = 0;
    virtual void stop() = 0;

    virtual int refreshIntervalSeconds() = 0;
    virtual int retryDelaySeconds(int consecutiveFailures) = 0;
};

#endif /* ChangeNotifier_hpp */
