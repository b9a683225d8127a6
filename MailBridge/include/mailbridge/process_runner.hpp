/** ProcessRunner [MailBridge]
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

#ifndef ProcessRunner_hpp
#define ProcessRunner_hpp

#include <chrono>
#include <functional>
#include <string>

#include <sys/types.h>

#include "mailbridge/command_builder.hpp"

struct ProcessResult {
    int exitCode = -1;
    bool timedOut = false;
    bool aborted = false;
    int termSignal = 0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() {}

    // Runs params[0] with the remaining arguments, writing stdout and stderr to
    // outputPath. shouldAbort is polled while the child runs.
    virtual ProcessResult run(const ParameterSet & params, const std::string & outputPath, std::chrono::seconds timeout, std::function<bool()> shouldAbort) = 0;
};

/*
 fork / execvp runner. The child gets its own process group so the whole
 engine tree can be signalled at once, and a clean signal mask so it responds
 to SIGTERM even though the daemon blocks it.
*/
class ForkExecProcessRunner : public ProcessRunner {
    void terminateGroup(pid_t pid, int & status);

public:
    ProcessResult run(const ParameterSet & params, const std::string & outputPath, std::chrono::seconds timeout, std::function<bool()> shouldAbort) override;
};

#endif /* ProcessRunner_hpp */
