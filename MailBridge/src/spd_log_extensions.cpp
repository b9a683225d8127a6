#include "mailbridge/spd_log_extensions.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/thread_utils.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <chrono>
#include <vector>

static const size_t LOG_FILE_MAX_BYTES = 1048576 * 10;
static const size_t LOG_FILE_MAX_FILES = 5;

void UppercaseLevelFlag::format(const spdlog::details::log_msg & msg, const std::tm &, spdlog::memory_buf_t & dest) {
    std::string name;
    switch (msg.level) {
        case spdlog::level::trace:
            name = "TRACE";
            break;
        case spdlog::level::debug:
            name = "DEBUG";
            break;
        case spdlog::level::info:
            name = "INFO";
            break;
        case spdlog::level::warn:
            name = "WARN";
            break;
        case spdlog::level::err:
            name = "ERROR";
            break;
        case spdlog::level::critical:
            name = "CRITICAL";
            break;
        default:
            name = "OFF";
            break;
    }
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> UppercaseLevelFlag::clone() const {
    return spdlog::details::make_unique<UppercaseLevelFlag>();
}

void ThreadNameFlag::format(const spdlog::details::log_msg & msg, const std::tm &, spdlog::memory_buf_t & dest) {
    std::string name = *GetThreadName(msg.thread_id);
    if (name == "") {
        name = std::to_string(msg.thread_id);
    }
    dest.append(name.data(), name.data() + name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> ThreadNameFlag::clone() const {
    return spdlog::details::make_unique<ThreadNameFlag>();
}

std::unique_ptr<spdlog::formatter> MakeLogFormatter(bool verbose) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<UppercaseLevelFlag>('*');
    formatter->add_flag<ThreadNameFlag>('&');
    formatter->set_pattern(verbose ? LOG_PATTERN_VERBOSE : LOG_PATTERN);
    return formatter;
}

LogFlusherSink::LogFlusherSink() {
    flushThread = std::thread([this]() {
        SetThreadName("log-flusher");
        runFlushLoop();
    });
}

LogFlusherSink::~LogFlusherSink() {
    {
        std::lock_guard<std::mutex> lck(flushMtx);
        exiting = true;
        flushCV.notify_one();
    }
    if (!flushThread.joinable()) {
        return;
    }
    // The flush loop may hold the last reference to the logger.
    if (flushThread.get_id() == std::this_thread::get_id()) {
        flushThread.detach();
    } else {
        flushThread.join();
    }
}

void LogFlusherSink::runFlushLoop() {
    while (true) {
        {
            // Wait for a message, or for 30 seconds, whichever happens first
            std::unique_lock<std::mutex> lck(flushMtx);
            flushCV.wait_for(lck, std::chrono::seconds(30), [this]() { return exiting || unflushed > 0; });
            if (exiting) {
                return;
            }
            if (unflushed == 0) {
                continue;
            }

            // Debounce 1sec for more messages to arrive
            flushCV.wait_for(lck, std::chrono::milliseconds(1000), [this]() { return exiting; });
            if (exiting) {
                return;
            }
            unflushed = 0;
        }

        auto logger = spdlog::get("logger");
        if (logger) {
            logger->flush();
        }
    }
}

void LogFlusherSink::sink_it_(const spdlog::details::log_msg &) {
    // ensure we have a flush queued
    std::lock_guard<std::mutex> lck(flushMtx);
    unflushed += 1;
    flushCV.notify_one();
}

void LogFlusherSink::flush_() {
    // no-op
}

spdlog::level::level_enum LogLevelFromString(std::string name) {
    name = MailUtils::toLower(MailUtils::trim(name));
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "warn" || name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error" || name == "err") {
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

bool ConfigureLogging(const RuntimeContext & context, bool fileLoggingAllowed, bool verbose, std::string levelName) {
    std::vector<spdlog::sink_ptr> sinks;
    std::string fileError = "";

    // Always log to stdout so `docker logs` shows the same output as the log file.
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (fileLoggingAllowed) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(context.logPath, LOG_FILE_MAX_BYTES, LOG_FILE_MAX_FILES));
            sinks.push_back(std::make_shared<LogFlusherSink>());
        } catch (spdlog::spdlog_ex & ex) {
            fileError = ex.what();
            fileLoggingAllowed = false;
        }
    }

    spdlog::drop("logger");
    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_formatter(MakeLogFormatter(verbose));
    logger->set_level(verbose ? spdlog::level::debug : LogLevelFromString(levelName));
    logger->flush_on(spdlog::level::err);
    spdlog::register_logger(logger);

    if (fileError != "") {
        logger->warn("Could not open log file {} ({}), logging to stdout only", context.logPath, fileError);
    }
    return fileLoggingAllowed;
}
