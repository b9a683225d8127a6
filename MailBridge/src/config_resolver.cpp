#include "mailbridge/config_resolver.hpp"
#include "mailbridge/mail_utils.hpp"

#include <fstream>

#include <unistd.h>

extern char ** environ;

#define FS_PATH_SEP "/"

// Strips one level of matching single or double quotes.
static std::string unquote(const std::string & value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::string EnvFileLoader::loadFirstAvailable(const std::string & dir) {
    for (const auto & name : ENV_FILE_CANDIDATES) {
        std::string path = dir + FS_PATH_SEP + name;
        if (access(path.c_str(), R_OK) != 0) {
            continue;
        }
        if (loadFile(path)) {
            return path;
        }
    }
    return "";
}

bool EnvFileLoader::loadFile(const std::string & path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = MailUtils::trim(line);
        if (line == "" || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = MailUtils::trim(line.substr(7));
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string key = MailUtils::trim(line.substr(0, eq));
        std::string value = unquote(MailUtils::trim(line.substr(eq + 1)));
        MailUtils::setEnvUTF8(key, value, false);
    }
    return true;
}

ConfigResolver::ConfigResolver(std::string appDir, ShutdownSignal & shutdownSignal, std::chrono::milliseconds recheckInterval) :
    appDir(appDir),
    shutdownSignal(shutdownSignal),
    recheckInterval(recheckInterval),
    logger(spdlog::get("logger")),
    diagnosticsLogged(false)
{
}

void ConfigResolver::applyAliases() {
    for (const auto & pair : ENV_ALIASES) {
        if (MailUtils::getEnvUTF8(pair.first) != "") {
            continue;
        }
        for (const auto & alias : pair.second) {
            std::string value = MailUtils::getEnvUTF8(alias);
            if (value != "") {
                MailUtils::setEnvUTF8(pair.first, value, true);
                break;
            }
        }
    }
}

int ConfigResolver::intFromEnv(const std::string & name, int fallback) {
    bool usedFallback = false;
    std::string raw = MailUtils::getEnvUTF8(name);
    int val = MailUtils::parsePositiveInt(raw, fallback, &usedFallback);
    if (usedFallback) {
        logger->warn("Invalid value for {}: '{}', using default {}", name, raw, fallback);
    }
    return val;
}

nlohmann::json ConfigResolver::endpointFromEnv(const std::string & suffix) {
    nlohmann::json e = {
        {"host", MailUtils::getEnvUTF8("HOST_" + suffix)},
        {"user", MailUtils::getEnvUTF8("USER_" + suffix)},
        {"password", MailUtils::getEnvUTF8("PASSWORD_" + suffix)},
        {"ssl", MailUtils::parseBool(MailUtils::getEnvUTF8("SSL" + suffix), true)},
        {"notls", MailUtils::parseBool(MailUtils::getEnvUTF8("NOTLS" + suffix), false)},
    };
    int port = intFromEnv("PORT_" + suffix, 0);
    if (port > 0) {
        e["port"] = port;
    }
    return e;
}

nlohmann::json ConfigResolver::buildConfiguration() {
    nlohmann::json j = {
        {"source", endpointFromEnv("1")},
        {"destination", endpointFromEnv("2")},
        {"folder", MailUtils::getEnvUTF8("FOLDER")},
        {"move", MailUtils::parseBool(MailUtils::getEnvUTF8("MOVE"), false)},
        {"date_filter_days", intFromEnv("DATE_FILTER_DAYS", DEFAULT_DATE_FILTER_DAYS)},
        {"max_emails_per_sync", intFromEnv("MAX_EMAILS_PER_SYNC", DEFAULT_MAX_EMAILS_PER_SYNC)},
        {"poll_seconds", intFromEnv("POLL_SECONDS", DEFAULT_POLL_SECONDS)},
        {"idle_refresh_seconds", intFromEnv("IDLE_TIMEOUT", DEFAULT_IDLE_REFRESH_SECONDS)},
        {"engine_binary", MailUtils::getEnvUTF8("IMAPSYNC_BIN")},
        {"engine_timeout_seconds", intFromEnv("ENGINE_TIMEOUT_SECONDS", DEFAULT_ENGINE_TIMEOUT_SECONDS)},
        {"engine_debug", MailUtils::parseBool(MailUtils::getEnvUTF8("ENGINE_DEBUG"), false)},
        {"connection_test", MailUtils::parseBool(MailUtils::getEnvUTF8("CONNECTION_TEST"), true)},
    };

    std::string modeString = MailUtils::getEnvUTF8("SYNC_MODE");
    bool recognized = true;
    SyncMode mode = SyncModeFromString(modeString, &recognized);
    if (modeString != "" && !recognized) {
        logger->warn("Unknown SYNC_MODE '{}', using poll", modeString);
    }
    j["mode"] = SyncModeName(mode);

    std::string credentials = MailUtils::getEnvUTF8("GOOGLE_CREDENTIALS");
    std::string token = MailUtils::getEnvUTF8("GOOGLE_TOKEN");
    std::string topic = MailUtils::getEnvUTF8("PUBSUB_TOPIC");
    std::string subscription = MailUtils::getEnvUTF8("PUBSUB_SUBSCRIPTION");
    j["push"] = {
        {"project_id", MailUtils::getEnvUTF8("GOOGLE_CLOUD_PROJECT")},
        {"topic", topic != "" ? topic : DEFAULT_PUBSUB_TOPIC},
        {"subscription", subscription != "" ? subscription : DEFAULT_PUBSUB_SUBSCRIPTION},
        {"credentials_path", credentials != "" ? credentials : appDir + FS_PATH_SEP + "credentials.json"},
        {"token_path", token != "" ? token : appDir + FS_PATH_SEP + "token.json"},
    };
    return j;
}

void ConfigResolver::logEnvironmentDiagnostics() {
    for (const auto & prefix : ENV_DIAGNOSTIC_PREFIXES) {
        logger->info("Environment variables matching {}*:", prefix);
        int found = 0;
        for (char ** env = environ; env && *env; env++) {
            std::string entry(*env);
            if (entry.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            size_t eq = entry.find('=');
            std::string name = entry.substr(0, eq);
            std::string value = eq == std::string::npos ? "" : entry.substr(eq + 1);
            if (name.find("PASS") != std::string::npos || name.find("SECRET") != std::string::npos) {
                value = MailUtils::maskSecret(value);
            } else if (value == "") {
                value = "(empty)";
            }
            logger->info("  {}: {}", name, value);
            found++;
        }
        if (found == 0) {
            logger->info("  (none)");
        }
    }
}

std::shared_ptr<const SyncConfiguration> ConfigResolver::resolve() {
    while (true) {
        std::string envFile = EnvFileLoader::loadFirstAvailable(appDir);
        if (envFile != "") {
            logger->info("Loaded environment from {}", envFile);
        } else {
            logger->info("No environment file found in {}, using system environment variables", appDir);
        }
        applyAliases();

        auto config = std::make_shared<const SyncConfiguration>(buildConfiguration());
        auto missing = config->missingRequiredFields();
        if (missing.empty()) {
            logger->info("Configuration validation passed");
            return config;
        }

        std::string names = "";
        for (const auto & name : missing) {
            names += (names == "" ? "" : " ") + name;
        }
        logger->error("Missing required environment variables: {}", names);
        if (!diagnosticsLogged) {
            logEnvironmentDiagnostics();
            diagnosticsLogged = true;
        }

        logger->info("Waiting {} seconds for configuration before re-checking...", std::chrono::duration_cast<std::chrono::seconds>(recheckInterval).count());
        if (!shutdownSignal.sleepFor(recheckInterval)) {
            logger->info("Shutdown requested while waiting for configuration");
            return nullptr;
        }
        logger->info("Re-checking configuration...");
    }
}
