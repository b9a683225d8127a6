#include "mailbridge/gmail_push_notifier.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/network_request_utils.hpp"
#include "mailbridge/sync_exception.hpp"

#include <algorithm>

GmailPushNotifier::GmailPushNotifier(const SyncConfiguration & config) :
    settings(config.push()),
    folder(config.folder()),
    tokens(config.push()),
    logger(spdlog::get("logger")),
    interruptRequested(false)
{
}

std::string GmailPushNotifier::name() {
    return "Gmail push";
}

bool GmailPushNotifier::isAvailable() {
    if (settings.projectId == "") {
        logger->warn("GOOGLE_CLOUD_PROJECT is not set");
        return false;
    }
    std::string reason;
    if (!tokens.hasRefreshCredentials(&reason)) {
        logger->warn("Google credentials are not usable: {}", reason);
        return false;
    }
    return true;
}

std::string GmailPushNotifier::subscriptionURL(const std::string & action) {
    return std::string(PUBSUB_API_ROOT) + "/projects/" + settings.projectId + "/subscriptions/" + settings.subscription + ":" + action;
}

void GmailPushNotifier::watch() {
    nlohmann::json body = {
        {"topicName", "projects/" + settings.projectId + "/topics/" + settings.topic},
        {"labelIds", nlohmann::json::array({folder})},
        {"labelFilterBehavior", "include"},
    };
    std::string payload = body.dump();
    CURL * curl = CreateJSONRequest(std::string(GMAIL_API_ROOT) + "/users/me/watch", "POST", "Bearer " + tokens.accessToken(), payload.c_str());
    nlohmann::json result = PerformJSONRequest(curl);
    logger->info("Gmail watch set up: {}", result.dump());
}

std::vector<std::string> GmailPushNotifier::pull(int timeoutSeconds, bool & timedOut) {
    timedOut = false;
    nlohmann::json body = {{"maxMessages", 100}};
    std::string payload = body.dump();

    CURL * curl = CreateJSONRequest(subscriptionURL("pull"), "POST", "Bearer " + tokens.accessToken(), payload.c_str());
    SetRequestAbortFlag(curl, &interruptRequested);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)std::max(timeoutSeconds, 1));

    std::string result;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void *)&result);
    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        CleanupRequest(curl);
        timedOut = true;
        return {};
    }
    if (res == CURLE_ABORTED_BY_CALLBACK && interruptRequested) {
        CleanupRequest(curl);
        return {};
    }
    ValidateRequestResp(res, curl, result);
    CleanupRequest(curl);

    nlohmann::json json = nullptr;
    try {
        json = nlohmann::json::parse(result);
    } catch (nlohmann::json::exception &) {
        throw SyncException("invalid-pubsub-resp", result, true);
    }

    std::vector<std::string> ackIds;
    if (json.is_object() && json.count("receivedMessages") && json["receivedMessages"].is_array()) {
        for (const auto & received : json["receivedMessages"]) {
            if (received.count("ackId") && received["ackId"].is_string()) {
                ackIds.push_back(received["ackId"].get<std::string>());
            }
            if (received.count("message") && received["message"].is_object()) {
                logger->info("Received Gmail notification: {}", received["message"].value("messageId", "?"));
            }
        }
    }
    return ackIds;
}

void GmailPushNotifier::acknowledge(const std::vector<std::string> & ackIds) {
    nlohmann::json body = {{"ackIds", ackIds}};
    std::string payload = body.dump();
    CURL * curl = CreateJSONRequest(subscriptionURL("acknowledge"), "POST", "Bearer " + tokens.accessToken(), payload.c_str());
    PerformJSONRequest(curl);
}

void GmailPushNotifier::start() {
    logger->info("Listening for Gmail push notifications on projects/{}/subscriptions/{}", settings.projectId, settings.subscription);
    watch();
}

NotifierEvent GmailPushNotifier::waitForChange(std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (interruptRequested.exchange(false)) {
            return NotifierEvent::Interrupted;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return NotifierEvent::TimedOut;
        }

        bool timedOut = false;
        std::vector<std::string> ackIds = pull((int)remaining.count(), timedOut);
        if (interruptRequested.exchange(false)) {
            return NotifierEvent::Interrupted;
        }
        if (!ackIds.empty()) {
            acknowledge(ackIds);
            return NotifierEvent::Changed;
        }
        if (timedOut) {
            return NotifierEvent::TimedOut;
        }

        // Pub/Sub may answer an empty pull right away. Pause briefly before asking again.
        auto pause = std::min(std::chrono::seconds(PUSH_EMPTY_PULL_PAUSE_SECONDS), remaining);
        std::unique_lock<std::mutex> lck(waitMtx);
        waitCv.wait_for(lck, pause, [this]() { return interruptRequested.load(); });
    }
}

void GmailPushNotifier::refresh() {
    logger->info("Renewing Gmail watch");
    watch();
}

void GmailPushNotifier::interrupt() {
    std::lock_guard<std::mutex> lck(waitMtx);
    interruptRequested = true;
    waitCv.notify_all();
}

void GmailPushNotifier::stop() {
    // The watch expires on its own. Nothing to release locally.
    logger->info("Stopped listening for Gmail push notifications");
}

int GmailPushNotifier::refreshIntervalSeconds() {
    return PUSH_WATCH_RENEW_SECONDS;
}

int GmailPushNotifier::retryDelaySeconds(int consecutiveFailures) {
    int delay = PUSH_RETRY_BASE_SECONDS;
    for (int i = 1; i < consecutiveFailures && delay < PUSH_RETRY_MAX_SECONDS; i++) {
        delay *= 2;
    }
    return std::min(delay, PUSH_RETRY_MAX_SECONDS);
}
