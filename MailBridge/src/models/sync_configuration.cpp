#include "mailbridge/models/sync_configuration.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"

std::string SyncModeName(SyncMode mode) {
    switch (mode) {
        case SyncMode::Idle:
            return "idle";
        case SyncMode::Push:
            return "push";
        default:
            return "poll";
    }
}

SyncMode SyncModeFromString(std::string value, bool * recognized) {
    std::string v = MailUtils::toLower(MailUtils::trim(value));
    if (recognized) {
        *recognized = true;
    }
    if (v == "idle") {
        return SyncMode::Idle;
    }
    if (v == "push") {
        return SyncMode::Push;
    }
    if (v != "poll" && recognized) {
        *recognized = false;
    }
    return SyncMode::Poll;
}

unsigned int EndpointSettings::effectivePort() const {
    if (port > 0) {
        return port;
    }
    return useTLS ? 993 : 143;
}

SyncConfiguration::SyncConfiguration(nlohmann::json json) : _data(json) {
}

std::vector<std::string> SyncConfiguration::missingRequiredFields() const {
    std::vector<std::string> missing;
    EndpointSettings s = source();
    EndpointSettings d = destination();
    if (s.host == "") missing.push_back("HOST_1");
    if (s.user == "") missing.push_back("USER_1");
    if (s.secret == "") missing.push_back("PASSWORD_1");
    if (d.host == "") missing.push_back("HOST_2");
    if (d.user == "") missing.push_back("USER_2");
    if (d.secret == "") missing.push_back("PASSWORD_2");
    return missing;
}

bool SyncConfiguration::valid() const {
    return missingRequiredFields().empty();
}

EndpointSettings SyncConfiguration::endpointAt(const char * key) const {
    EndpointSettings e;
    if (!_data.count(key) || !_data[key].is_object()) {
        return e;
    }
    const nlohmann::json & j = _data[key];
    e.host = j.value("host", "");
    e.port = j.value("port", 0u);
    e.user = j.value("user", "");
    e.secret = j.value("password", "");
    e.useTLS = j.value("ssl", true);
    e.skipTLS = j.value("notls", false);
    return e;
}

int SyncConfiguration::positiveIntAt(const char * key, int fallback) const {
    if (!_data.count(key) || !_data[key].is_number_integer()) {
        return fallback;
    }
    int val = _data[key].get<int>();
    return val > 0 ? val : fallback;
}

EndpointSettings SyncConfiguration::source() const {
    return endpointAt("source");
}

EndpointSettings SyncConfiguration::destination() const {
    return endpointAt("destination");
}

std::string SyncConfiguration::folder() const {
    std::string f = _data.value("folder", DEFAULT_FOLDER);
    return f == "" ? DEFAULT_FOLDER : f;
}

bool SyncConfiguration::moveMode() const {
    return _data.value("move", false);
}

int SyncConfiguration::dateFilterDays() const {
    return positiveIntAt("date_filter_days", DEFAULT_DATE_FILTER_DAYS);
}

int SyncConfiguration::maxEmailsPerSync() const {
    return positiveIntAt("max_emails_per_sync", DEFAULT_MAX_EMAILS_PER_SYNC);
}

long long SyncConfiguration::maxEmailSizeBytes() const {
    // not user-configurable, the size bound is fixed.
    return MAX_EMAIL_SIZE_BYTES;
}

SyncMode SyncConfiguration::mode() const {
    return SyncModeFromString(_data.value("mode", "poll"));
}

int SyncConfiguration::pollIntervalSeconds() const {
    return positiveIntAt("poll_seconds", DEFAULT_POLL_SECONDS);
}

int SyncConfiguration::idleRefreshSeconds() const {
    return positiveIntAt("idle_refresh_seconds", DEFAULT_IDLE_REFRESH_SECONDS);
}

std::string SyncConfiguration::engineBinary() const {
    std::string bin = _data.value("engine_binary", DEFAULT_ENGINE_BINARY);
    return bin == "" ? DEFAULT_ENGINE_BINARY : bin;
}

int SyncConfiguration::engineTimeoutSeconds() const {
    return positiveIntAt("engine_timeout_seconds", DEFAULT_ENGINE_TIMEOUT_SECONDS);
}

bool SyncConfiguration::engineDebug() const {
    return _data.value("engine_debug", false);
}

bool SyncConfiguration::connectionTest() const {
    return _data.value("connection_test", true);
}

PushSettings SyncConfiguration::push() const {
    PushSettings p;
    p.topic = DEFAULT_PUBSUB_TOPIC;
    p.subscription = DEFAULT_PUBSUB_SUBSCRIPTION;
    if (!_data.count("push") || !_data["push"].is_object()) {
        return p;
    }
    const nlohmann::json & j = _data["push"];
    p.projectId = j.value("project_id", "");
    p.topic = j.value("topic", DEFAULT_PUBSUB_TOPIC);
    p.subscription = j.value("subscription", DEFAULT_PUBSUB_SUBSCRIPTION);
    p.credentialsPath = j.value("credentials_path", "");
    p.tokenPath = j.value("token_path", "");
    return p;
}

nlohmann::json SyncConfiguration::toJSON() const {
    nlohmann::json j = _data;
    for (const char * side : {"source", "destination"}) {
        if (j.count(side) && j[side].is_object() && j[side].count("password")) {
            j[side]["password"] = MailUtils::maskSecret(j[side]["password"].get<std::string>());
        }
    }
    j["date_filter_days"] = dateFilterDays();
    j["max_emails_per_sync"] = maxEmailsPerSync();
    j["max_email_size_bytes"] = maxEmailSizeBytes();
    j["mode"] = SyncModeName(mode());
    return j;
}
