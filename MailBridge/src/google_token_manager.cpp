#include "mailbridge/google_token_manager.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/network_request_utils.hpp"
#include "mailbridge/sync_exception.hpp"

GoogleTokenManager::GoogleTokenManager(const PushSettings & settings) :
    credentialsPath(settings.credentialsPath),
    tokenPath(settings.tokenPath),
    logger(spdlog::get("logger")),
    _expiryDate(0)
{
}

static nlohmann::json readJSONFile(const std::string & path) {
    std::string contents;
    if (!MailUtils::readFile(path, contents)) {
        throw SyncException("invalid-google-credentials", "Could not read " + path, false);
    }
    try {
        return nlohmann::json::parse(contents);
    } catch (nlohmann::json::exception & ex) {
        throw SyncException("invalid-google-credentials", path + " is not valid JSON: " + ex.what(), false);
    }
}

GoogleTokenParts GoogleTokenManager::loadParts() {
    nlohmann::json token = readJSONFile(tokenPath);
    if (!token.is_object()) {
        throw SyncException("invalid-google-credentials", tokenPath + " is not a JSON object", false);
    }

    GoogleTokenParts parts;
    parts.refreshToken = token.value("refresh_token", "");
    parts.clientId = token.value("client_id", "");
    parts.clientSecret = token.value("client_secret", "");
    parts.tokenURL = token.value("token_uri", GOOGLE_DEFAULT_TOKEN_URL);

    if (parts.clientId == "") {
        // Client secrets downloaded from the console nest everything under
        // "installed" or "web".
        nlohmann::json credentials = readJSONFile(credentialsPath);
        for (const char * section : {"installed", "web"}) {
            if (credentials.is_object() && credentials.count(section) && credentials[section].is_object()) {
                credentials = credentials[section];
                break;
            }
        }
        if (credentials.is_object()) {
            parts.clientId = credentials.value("client_id", "");
            parts.clientSecret = credentials.value("client_secret", "");
            if (!token.count("token_uri")) {
                parts.tokenURL = credentials.value("token_uri", GOOGLE_DEFAULT_TOKEN_URL);
            }
        }
    }

    if (parts.refreshToken == "") {
        throw SyncException("invalid-google-credentials", tokenPath + " has no refresh_token", false);
    }
    if (parts.clientId == "") {
        throw SyncException("invalid-google-credentials", "No client_id in " + tokenPath + " or " + credentialsPath, false);
    }
    return parts;
}

bool GoogleTokenManager::hasRefreshCredentials(std::string * reason) {
    try {
        loadParts();
        return true;
    } catch (SyncException & ex) {
        if (reason) {
            *reason = ex.debuginfo;
        }
        return false;
    }
}

std::string GoogleTokenManager::accessToken() {
    std::lock_guard<std::mutex> guard(_cacheLock);

    // buffer of 60 sec since we actually need time to use the token
    if (_accessToken != "" && _expiryDate > time(0) + 60) {
        return _accessToken;
    }

    GoogleTokenParts parts = loadParts();
    logger->info("Fetching Google access token for the push subscription");
    nlohmann::json updated = MakeOAuthRefreshRequest(parts.tokenURL, parts.clientId, parts.clientSecret, parts.refreshToken);

    if (!updated.count("access_token") || !updated["access_token"].is_string()) {
        throw SyncException("invalid-oauth-resp", updated.dump(), false);
    }
    int expiresIn = 3600;
    if (updated.count("expires_in") && updated["expires_in"].is_number_integer()) {
        expiresIn = updated["expires_in"].get<int>();
    }

    if (updated.count("refresh_token") && updated["refresh_token"].is_string()) {
        auto updatedRefreshToken = updated["refresh_token"].get<std::string>();
        if (updatedRefreshToken != parts.refreshToken) {
            logger->info("Saving updated Google refresh token to {}", tokenPath);
            persistRefreshToken(updatedRefreshToken);
        }
    }

    _accessToken = updated["access_token"].get<std::string>();
    _expiryDate = time(0) + expiresIn;
    return _accessToken;
}

void GoogleTokenManager::invalidate() {
    std::lock_guard<std::mutex> guard(_cacheLock);
    _accessToken = "";
    _expiryDate = 0;
}

void GoogleTokenManager::persistRefreshToken(const std::string & refreshToken) {
    nlohmann::json token = readJSONFile(tokenPath);
    token["refresh_token"] = refreshToken;
    if (!MailUtils::writeFileAtomically(tokenPath, token.dump(2))) {
        logger->warn("Could not save updated refresh token to {}", tokenPath);
    }
}
