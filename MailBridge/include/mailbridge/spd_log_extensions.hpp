/** SPDLogExtensions [MailBridge]
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

#ifndef SPDLogExtensions_hpp
#define SPDLogExtensions_hpp

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/base_sink.h"

#include "mailbridge/runtime_context.hpp"

// [2024-01-01 12:00:00] [INFO] message
#define LOG_PATTERN          "[%Y-%m-%d %H:%M:%S] [%*] %v"
#define LOG_PATTERN_VERBOSE  "[%Y-%m-%d %H:%M:%S] [%*] [%&] %v"

// %* renders the level as INFO, WARN, ERROR...
class UppercaseLevelFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm & tm_time, spdlog::memory_buf_t & dest) override;
    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
};

// %& renders the name given to the thread with SetThreadName
class ThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm & tm_time, spdlog::memory_buf_t & dest) override;
    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
};

std::unique_ptr<spdlog::formatter> MakeLogFormatter(bool verbose);

/*
 The rotating file sink buffers writes. This sink never writes anything itself,
 it just makes sure the "logger" is flushed about a second after the last burst
 of messages so the log file stays current without flushing on every line.
*/
class LogFlusherSink : public spdlog::sinks::base_sink<std::mutex> {
    std::mutex flushMtx;
    std::condition_variable flushCV;
    int unflushed = 0;
    bool exiting = false;
    std::thread flushThread;

    void runFlushLoop();

protected:
    void sink_it_(const spdlog::details::log_msg & msg) override;
    void flush_() override;

public:
    LogFlusherSink();
    ~LogFlusherSink();
};

spdlog::level::level_enum LogLevelFromString(std::string name);

/*
 Creates and registers the "logger" used by every component. Always logs to
 stdout; also logs to the rotating log file unless `fileLoggingAllowed` is false
 or the file cannot be opened. Returns true if the file sink is active.
*/
bool ConfigureLogging(const RuntimeContext & context, bool fileLoggingAllowed, bool verbose, std::string levelName);

#endif /* SPDLogExtensions_hpp */
