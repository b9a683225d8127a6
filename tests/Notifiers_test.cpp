#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mailbridge/connection_tester.hpp"
#include "mailbridge/gmail_push_notifier.hpp"
#include "mailbridge/google_token_manager.hpp"
#include "mailbridge/imap_idle_notifier.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/sync_exception.hpp"
#include "mailbridge/models/sync_configuration.hpp"
#include "TestHelpers.hpp"

using ::testing::HasSubstr;

#define TEST_APP_DIR "/tmp/mailbridge_notifier_test"

class NotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        system("rm -rf " TEST_APP_DIR " && mkdir -p " TEST_APP_DIR);
        log = InstallTestLogger();
        data = CompleteConfigurationJSON();
        data["push"] = {
            {"project_id", "bridge-project"},
            {"topic", "gmail-sync-topic"},
            {"subscription", "gmail-sync-subscription"},
            {"credentials_path", TEST_APP_DIR "/credentials.json"},
            {"token_path", TEST_APP_DIR "/token.json"},
        };
    }

    void TearDown() override {
        system("rm -rf " TEST_APP_DIR);
    }

    void writeJSON(const std::string & name, nlohmann::json contents) {
        ASSERT_TRUE(MailUtils::writeFileAtomically(std::string(TEST_APP_DIR) + "/" + name, contents.dump()));
    }

    std::shared_ptr<std::ostringstream> log;
    nlohmann::json data;
};

TEST_F(NotifierTest, IdleUsesConfiguredRefreshAndFixedRetry) {
    data["idle_refresh_seconds"] = 600;
    ImapIdleNotifier idle{SyncConfiguration(data)};
    EXPECT_EQ(idle.name(), "IMAP IDLE");
    EXPECT_EQ(idle.refreshIntervalSeconds(), 600);
    EXPECT_EQ(idle.retryDelaySeconds(1), 30);
    EXPECT_EQ(idle.retryDelaySeconds(9), 30);
}

TEST_F(NotifierTest, PushRetryDelayDoublesUpToCap) {
    GmailPushNotifier push{SyncConfiguration(data)};
    EXPECT_EQ(push.name(), "Gmail push");
    EXPECT_EQ(push.refreshIntervalSeconds(), 24 * 60 * 60);
    EXPECT_EQ(push.retryDelaySeconds(1), 30);
    EXPECT_EQ(push.retryDelaySeconds(2), 60);
    EXPECT_EQ(push.retryDelaySeconds(3), 120);
    EXPECT_EQ(push.retryDelaySeconds(4), 240);
    EXPECT_EQ(push.retryDelaySeconds(5), 300);
    EXPECT_EQ(push.retryDelaySeconds(20), 300);
}

TEST_F(NotifierTest, PushUnavailableWithoutProject) {
    data["push"]["project_id"] = "";
    GmailPushNotifier push{SyncConfiguration(data)};
    EXPECT_FALSE(push.isAvailable());
    EXPECT_THAT(LogText(log), HasSubstr("GOOGLE_CLOUD_PROJECT is not set"));
}

TEST_F(NotifierTest, PushUnavailableWithoutToken) {
    GmailPushNotifier push{SyncConfiguration(data)};
    EXPECT_FALSE(push.isAvailable());
    EXPECT_THAT(LogText(log), HasSubstr("Google credentials are not usable"));
}

TEST_F(NotifierTest, TokenFileWithClientDetailsIsSufficient) {
    writeJSON("token.json", {
        {"refresh_token", "1//refresh"},
        {"client_id", "client.apps.googleusercontent.com"},
        {"client_secret", "shh"},
    });
    GoogleTokenManager tokens(SyncConfiguration(data).push());
    GoogleTokenParts parts = tokens.loadParts();
    EXPECT_EQ(parts.refreshToken, "1//refresh");
    EXPECT_EQ(parts.clientId, "client.apps.googleusercontent.com");
    EXPECT_EQ(parts.clientSecret, "shh");
    EXPECT_EQ(parts.tokenURL, GOOGLE_DEFAULT_TOKEN_URL);

    GmailPushNotifier push{SyncConfiguration(data)};
    EXPECT_TRUE(push.isAvailable());
}

TEST_F(NotifierTest, ClientDetailsFallBackToCredentialsFile) {
    writeJSON("token.json", {{"refresh_token", "1//refresh"}});
    writeJSON("credentials.json", {
        {"installed", {
            {"client_id", "installed-client"},
            {"client_secret", "installed-secret"},
            {"token_uri", "https://oauth2.example.test/token"},
        }},
    });
    GoogleTokenManager tokens(SyncConfiguration(data).push());
    GoogleTokenParts parts = tokens.loadParts();
    EXPECT_EQ(parts.clientId, "installed-client");
    EXPECT_EQ(parts.clientSecret, "installed-secret");
    EXPECT_EQ(parts.tokenURL, "https://oauth2.example.test/token");
}

TEST_F(NotifierTest, MissingRefreshTokenIsNotRetryable) {
    writeJSON("token.json", {{"client_id", "client"}});
    GoogleTokenManager tokens(SyncConfiguration(data).push());
    try {
        tokens.loadParts();
        FAIL() << "loadParts should have thrown";
    } catch (SyncException & ex) {
        EXPECT_EQ(ex.key, "invalid-google-credentials");
        EXPECT_FALSE(ex.isRetryable());
    }

    std::string reason;
    EXPECT_FALSE(tokens.hasRefreshCredentials(&reason));
    EXPECT_THAT(reason, HasSubstr("refresh_token"));
}

TEST_F(NotifierTest, InterruptedIdleNeverConnects) {
    ImapIdleNotifier idle{SyncConfiguration(data)};
    idle.interrupt();
    EXPECT_NO_THROW(idle.start());
    EXPECT_EQ(idle.waitForChange(std::chrono::seconds(5)), NotifierEvent::Interrupted);
}

TEST_F(NotifierTest, ConnectionTestStopsWhenAborted) {
    ConnectionTester tester(std::make_shared<const SyncConfiguration>(data));
    nlohmann::json resp = tester.run([]() { return true; });
    EXPECT_EQ(resp["error"], "Cancelled");
    EXPECT_EQ(resp["error_service"], "source");
    EXPECT_EQ(resp["log"], "");
}
