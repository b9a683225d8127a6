#include "mailbridge/sync_exception.hpp"
#include "mailbridge/constants.hpp"

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(), retryable(retryable), key(key), debuginfo(di)
{

}

SyncException::SyncException(CURLcode c, std::string di) :
    GenericException(), key(curl_easy_strerror(c)), debuginfo(di)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_HTTP_RETURNED_ERROR) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_HTTP_POST_ERROR) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_PEER_FAILED_VERIFICATION) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
        offline = true;
    }
    if (c == CURLE_ABORTED_BY_CALLBACK) {
        // we aborted a long pull ourselves, usually because we're shutting down
        retryable = true;
    }
}

SyncException::SyncException(mailcore::ErrorCode c, std::string di) :
    GenericException(), key(""), debuginfo(di)
{
    if (ErrorCodeToTypeMap.count(c)) {
        key = ErrorCodeToTypeMap[c];
    } else {
        key = "ErrorCode" + std::to_string((int)c);
    }
    if (c == mailcore::ErrorConnection || c == mailcore::ErrorYahooUnavailable ||
        c == mailcore::ErrorGmailTooManySimultaneousConnections || c == mailcore::ErrorGmailExceededBandwidthLimit) {
        retryable = true;
        offline = (c == mailcore::ErrorConnection);
    }
    if (c == mailcore::ErrorParse || c == mailcore::ErrorIdle) {
        // Usually caused by the server dropping the connection mid-response.
        retryable = true;
    }
}

bool SyncException::isRetryable() {
    return retryable;
}

bool SyncException::isOffline() {
    return offline;
}

const char * SyncException::what() const noexcept {
    return key.c_str();
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}
