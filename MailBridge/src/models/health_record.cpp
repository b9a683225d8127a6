#include "mailbridge/models/health_record.hpp"
#include "mailbridge/mail_utils.hpp"

#include <cstdlib>

std::string HealthStatusToken(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Unhealthy:
            return "unhealthy";
        default:
            return "unknown";
    }
}

HealthStatus HealthStatusFromToken(std::string token) {
    token = MailUtils::toLower(MailUtils::trim(token));
    if (token == "healthy") {
        return HealthStatus::Healthy;
    }
    if (token == "unhealthy") {
        return HealthStatus::Unhealthy;
    }
    return HealthStatus::Unknown;
}

std::string HealthRecord::serialize() const {
    return HealthStatusToken(status) + "\n" + std::to_string((long long)lastUpdateTimestamp) + "\n";
}

bool HealthRecord::parse(const std::string & contents, HealthRecord & out) {
    auto lines = MailUtils::splitLines(contents);
    if (lines.size() == 0 || MailUtils::trim(lines[0]) == "") {
        return false;
    }
    out.status = HealthStatusFromToken(lines[0]);
    out.lastUpdateTimestamp = 0;

    // A record without a usable timestamp is kept, but reads as infinitely old.
    if (lines.size() > 1) {
        std::string ts = MailUtils::trim(lines[1]);
        char * end = nullptr;
        long long val = strtoll(ts.c_str(), &end, 10);
        if (ts != "" && end != nullptr && *end == '\0') {
            out.lastUpdateTimestamp = (time_t)val;
        }
    }
    return true;
}
