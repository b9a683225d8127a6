#ifndef TESTHELPERS_HPP
#define TESTHELPERS_HPP

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/ostream_sink.h"

#include "mailbridge/constants.hpp"
#include "mailbridge/spd_log_extensions.hpp"

// Registers a fresh "logger" that writes into the returned stream. Streams are
// kept alive for the whole test run because components hold on to the logger.
inline std::shared_ptr<std::ostringstream> InstallTestLogger() {
    static std::vector<std::shared_ptr<std::ostringstream>> keepAlive;
    auto stream = std::make_shared<std::ostringstream>();
    keepAlive.push_back(stream);

    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
    spdlog::drop("logger");
    auto logger = std::make_shared<spdlog::logger>("logger", sink);
    logger->set_formatter(MakeLogFormatter(false));
    logger->set_level(spdlog::level::debug);
    spdlog::register_logger(logger);
    return stream;
}

inline std::string LogText(const std::shared_ptr<std::ostringstream> & stream) {
    spdlog::get("logger")->flush();
    return stream->str();
}

inline int CountOccurrences(const std::string & haystack, const std::string & needle) {
    int count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        count++;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

// Clears every variable the configuration resolver reads.
inline void ClearMailBridgeEnvironment() {
    for (const auto & name : REQUIRED_ENV_VARS) {
        unsetenv(name.c_str());
    }
    for (const auto & pair : ENV_ALIASES) {
        unsetenv(pair.first.c_str());
        for (const auto & alias : pair.second) {
            unsetenv(alias.c_str());
        }
    }
    for (const char * name : {"PORT_1", "PORT_2", "SSL1", "SSL2", "NOTLS1", "NOTLS2", "FOLDER", "MOVE",
                              "SYNC_MODE", "POLL_SECONDS", "DATE_FILTER_DAYS", "MAX_EMAILS_PER_SYNC",
                              "IMAPSYNC_BIN", "ENGINE_TIMEOUT_SECONDS", "ENGINE_DEBUG", "CONNECTION_TEST",
                              "GOOGLE_CLOUD_PROJECT", "PUBSUB_TOPIC", "PUBSUB_SUBSCRIPTION",
                              "GOOGLE_CREDENTIALS", "GOOGLE_TOKEN"}) {
        unsetenv(name);
    }
}

inline nlohmann::json CompleteConfigurationJSON() {
    return {
        {"source", {{"host", "imap.source.test"}, {"user", "alice@source.test"}, {"password", "source-secret"}, {"ssl", true}, {"notls", false}}},
        {"destination", {{"host", "imap.dest.test"}, {"user", "alice@dest.test"}, {"password", "dest-secret"}, {"ssl", true}, {"notls", false}}},
        {"folder", "INBOX"},
        {"move", false},
        {"mode", "poll"},
    };
}

#endif // TESTHELPERS_HPP
