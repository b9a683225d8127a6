#include "mailbridge/mail_utils.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/models/sync_configuration.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

void MailUtils::setEnvUTF8(std::string key, std::string value, bool overwrite) {
    setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0);
}

bool MailUtils::parseBool(std::string value, bool fallback) {
    std::string v = toLower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return fallback;
}

int MailUtils::parsePositiveInt(std::string value, int fallback, bool * usedFallback) {
    if (usedFallback) {
        *usedFallback = false;
    }
    std::string v = trim(value);
    if (v == "") {
        return fallback;
    }
    char * end = nullptr;
    errno = 0;
    long parsed = strtol(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0' || parsed <= 0 || parsed > 0x7FFFFFFF) {
        if (usedFallback) {
            *usedFallback = true;
        }
        return fallback;
    }
    return (int)parsed;
}

std::string MailUtils::trim(const std::string & s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string MailUtils::toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

std::string MailUtils::maskSecret(const std::string & value) {
    if (value == "") {
        return "(not set)";
    }
    return "[HIDDEN]";
}

std::string MailUtils::localTimestampForTime(time_t time) {
    struct tm ptm;
    localtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &ptm);
    return std::string(buffer);
}

std::vector<std::string> MailUtils::splitLines(const std::string & text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.size() > 0 && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> MailUtils::lastLines(const std::string & text, size_t count) {
    std::vector<std::string> lines = splitLines(text);
    if (lines.size() <= count) {
        return lines;
    }
    return std::vector<std::string>(lines.end() - count, lines.end());
}

bool MailUtils::readFile(const std::string & path, std::string & contents) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    contents = ss.str();
    return true;
}

bool MailUtils::writeFileAtomically(const std::string & path, const std::string & contents) {
    // readers must never see a half written file, so write beside it and rename over.
    std::string tmpPath = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            return false;
        }
        out << contents;
        out.flush();
        if (!out.good()) {
            out.close();
            unlink(tmpPath.c_str());
            return false;
        }
    }
    if (rename(tmpPath.c_str(), path.c_str()) != 0) {
        unlink(tmpPath.c_str());
        return false;
    }
    return true;
}

bool MailUtils::isDirectoryWritable(const std::string & path) {
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0 || !S_ISDIR(buffer.st_mode)) {
        return false;
    }
    return access(path.c_str(), W_OK | X_OK) == 0;
}

bool MailUtils::ensureDirectory(const std::string & path) {
    if (path == "") {
        return false;
    }
    struct stat buffer;
    if (stat(path.c_str(), &buffer) == 0) {
        return S_ISDIR(buffer.st_mode);
    }
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!ensureDirectory(path.substr(0, slash))) {
            return false;
        }
    }
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        return false;
    }
    return true;
}

void MailUtils::configureSessionForEndpoint(mailcore::IMAPSession & session, const EndpointSettings & endpoint) {
    session.setHostname(AS_MCSTR(endpoint.host));
    session.setUsername(AS_MCSTR(endpoint.user));
    session.setPassword(AS_MCSTR(endpoint.secret));

    if (endpoint.useTLS) {
        session.setConnectionType(mailcore::ConnectionTypeTLS);
    } else if (endpoint.skipTLS) {
        session.setConnectionType(mailcore::ConnectionTypeClear);
    } else {
        session.setConnectionType(mailcore::ConnectionTypeStartTLS);
    }
    session.setPort(endpoint.effectivePort());
    session.setCheckCertificateEnabled(true);
    session.setTimeout(60);
}
