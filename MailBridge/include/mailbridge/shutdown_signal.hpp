/** ShutdownSignal [MailBridge]
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

#ifndef ShutdownSignal_hpp
#define ShutdownSignal_hpp

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

/*
 ShutdownSignal is the single cancellation token shared by the strategy loops,
 the configuration wait loop and the engine invoker. Requesting shutdown wakes
 every sleeper and runs the registered handlers (used to interrupt blocking
 collaborator calls such as IMAP IDLE) exactly once.
*/
class ShutdownSignal {
    std::atomic<bool> requested;
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::function<void()>> handlers;

public:
    ShutdownSignal();

    void requestShutdown();
    bool isShutdownRequested() const;

    // Returns false if shutdown was requested before the duration elapsed.
    bool sleepFor(std::chrono::milliseconds duration);

    // Runs immediately if shutdown has already been requested.
    void addShutdownHandler(std::function<void()> handler);
};

#endif /* ShutdownSignal_hpp */
