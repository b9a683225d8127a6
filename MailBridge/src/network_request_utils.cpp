#include "mailbridge/network_request_utils.hpp"
#include "mailbridge/sync_exception.hpp"

#include <algorithm>
#include <cstring>
#include <sys/stat.h>

std::string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch: maintained by update-ca-certificates
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat 5+, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        // Red Hat 4
        "/usr/share/ssl/certs/ca-bundle.crt",
        // Alpine
        "/etc/ssl/cert.pem",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto & path : certificatePaths) {
        struct stat buffer;
        if (stat(path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

static int _onTransferProgress(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const std::atomic<bool> * abortFlag = (const std::atomic<bool> *)clientp;
    return (abortFlag && abortFlag->load()) ? 1 : 0;
}

static CURL * CreateRequestWithHeaders(std::string url, struct curl_slist * headers) {
    CURL * curl_handle = curl_easy_init();
    if (curl_handle == nullptr) {
        curl_slist_free_all(headers);
        throw SyncException(CURLE_FAILED_INIT, url);
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_PRIVATE, (void *)headers);

    // Ensure /all/ curl code paths run this code for RHEL 7.6 and other linux distros
    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }
    return curl_handle;
}

CURL * CreateJSONRequest(std::string url, std::string method, std::string authorization, const char * payloadChars) {
    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (authorization != "") {
        headers = curl_slist_append(headers, ("Authorization: " + authorization).c_str());
    }
    bool hasPayload = payloadChars != nullptr && strlen(payloadChars) > 0;
    if (hasPayload) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }

    CURL * curl_handle = CreateRequestWithHeaders(url, headers);
    if (hasPayload) {
        curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payloadChars);
    }
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    return curl_handle;
}

void SetRequestAbortFlag(CURL * curl_handle, const std::atomic<bool> * abortFlag) {
    curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, _onTransferProgress);
    curl_easy_setopt(curl_handle, CURLOPT_XFERINFODATA, (void *)abortFlag);
    curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
}

void CleanupRequest(CURL * curl_handle) {
    struct curl_slist * headers = nullptr;
    curl_easy_getinfo(curl_handle, CURLINFO_PRIVATE, (char **)&headers);
    curl_easy_cleanup(curl_handle);
    if (headers) {
        curl_slist_free_all(headers);
    }
}

const std::string PerformRequest(CURL * curl_handle) {
    std::string result;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&result);
    CURLcode res = curl_easy_perform(curl_handle);
    ValidateRequestResp(res, curl_handle, result);
    return result;
}

const nlohmann::json PerformJSONRequest(CURL * curl_handle) {
    std::string result = PerformRequest(curl_handle);
    nlohmann::json resultJSON = nullptr;
    try {
        resultJSON = nlohmann::json::parse(result);
    } catch (nlohmann::json::exception &) {
        resultJSON = {{"text", result}};
    }
    CleanupRequest(curl_handle);
    return resultJSON;
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp) {
    char * _url = nullptr;
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) != CURLE_OK || _url == nullptr) {
        CleanupRequest(curl_handle);
        throw SyncException(res, "Unable to get URL");
    }
    std::string url { _url };

    if (res != CURLE_OK) {
        CleanupRequest(curl_handle);
        throw SyncException(res, url);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code > 209) {
        CleanupRequest(curl_handle); // note: cleans up _url;

        bool retryable = ((http_code != 403) && (http_code != 401) && (http_code != 404));
        if (resp.find("invalid_grant") != std::string::npos) {
            retryable = false;
        }

        std::string debuginfo = url + " RETURNED " + resp;
        throw SyncException("Invalid Response Code: " + std::to_string(http_code), debuginfo, retryable);
    }
}

const nlohmann::json MakeOAuthRefreshRequest(std::string tokenURL, std::string clientId, std::string clientSecret, std::string refreshToken) {
    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    CURL * curl_handle = CreateRequestWithHeaders(tokenURL, headers);

    auto c = curl_easy_escape(curl_handle, clientId.c_str(), 0);
    auto s = curl_easy_escape(curl_handle, clientSecret.c_str(), 0);
    auto r = curl_easy_escape(curl_handle, refreshToken.c_str(), 0);
    std::string payload = "grant_type=refresh_token&client_id=" + std::string(c) + "&refresh_token=" + std::string(r);
    if (clientSecret != "") {
        payload += "&client_secret=" + std::string(s);
    }
    curl_free(c);
    curl_free(s);
    curl_free(r);

    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, "POST");
    curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payload.c_str());

    return PerformJSONRequest(curl_handle);
}
