/** Constants [MailBridge]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef Constants_hpp
#define Constants_hpp

#include <map>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#define MAILBRIDGE_VERSION  "1.0.0"

// Defaults applied by the configuration resolver

static const std::string DEFAULT_FOLDER = "INBOX";
static const std::string DEFAULT_ENGINE_BINARY = "imapsync";

static const int DEFAULT_DATE_FILTER_DAYS = 30;
static const int DEFAULT_MAX_EMAILS_PER_SYNC = 1000;
static const long long MAX_EMAIL_SIZE_BYTES = 50000000;
static const int DEFAULT_POLL_SECONDS = 15;
static const int DEFAULT_IDLE_REFRESH_SECONDS = 1740; // 29 minutes, Gmail drops IDLE at 30
static const int DEFAULT_ENGINE_TIMEOUT_SECONDS = 300;

static const int CONFIG_RECHECK_SECONDS = 30;

// mailcore waits 60 seconds by default, too long for a startup check
static const int CONNECTION_TEST_TIMEOUT_SECONDS = 15;

// Health / liveness

static const int HEALTH_MAX_AGE_SECONDS = 300;
static const int HEARTBEAT_INTERVAL_SECONDS = 60;

static const int ENGINE_ERROR_TAIL_LINES = 20;
static const int ENGINE_KILL_GRACE_MS = 1000;
static const int ENGINE_POLL_INTERVAL_MS = 100;
static const int ENGINE_EXEC_FAILED_CODE = 127;

// Engine throttle. Keeps bursts against the destination server small.
static const int ENGINE_MAX_MESSAGES_PER_SECOND = 5;

// Notification collaborators

static const int IDLE_RETRY_SECONDS = 30;
static const int PUSH_RETRY_BASE_SECONDS = 30;
static const int PUSH_RETRY_MAX_SECONDS = 300;
static const int PUSH_WATCH_RENEW_SECONDS = 24 * 60 * 60;
static const int PUSH_EMPTY_PULL_PAUSE_SECONDS = 5;

static const std::string DEFAULT_PUBSUB_TOPIC = "gmail-sync-topic";
static const std::string DEFAULT_PUBSUB_SUBSCRIPTION = "gmail-sync-subscription";

// Runtime layout, relative to the application directory

static const std::string LOG_DIR_NAME = "logs";
static const std::string DATA_DIR_NAME = "data";
static const std::string LOG_FILE_NAME = "imapsync.log";
static const std::string PID_FILE_NAME = "imapsync.pid";
static const std::string HEALTH_FILE_NAME = "health";
static const std::string ENGINE_OUTPUT_FILE_NAME = "engine-output.tmp";

static const std::vector<std::string> ENV_FILE_CANDIDATES = {".env.test", ".env", ".env.example"};

static const std::vector<std::string> REQUIRED_ENV_VARS = {
    "HOST_1", "USER_1", "PASSWORD_1",
    "HOST_2", "USER_2", "PASSWORD_2",
};

// Legacy and alternate names. An alias only populates the canonical variable
// when the canonical variable is unset or empty. Earlier aliases win.
static const std::vector<std::pair<std::string, std::vector<std::string>>> ENV_ALIASES = {
    {"HOST_1",      {"SOURCE_HOST", "SOURCE_IMAP_HOST", "IMAP_SOURCE_HOST"}},
    {"USER_1",      {"SOURCE_USER", "SOURCE_USERNAME", "IMAP_SOURCE_USER"}},
    {"PASSWORD_1",  {"SOURCE_PASSWORD", "SOURCE_PASS", "IMAP_SOURCE_PASSWORD"}},
    {"HOST_2",      {"DEST_HOST", "DESTINATION_HOST", "IMAP_DEST_HOST"}},
    {"USER_2",      {"DEST_USER", "DEST_USERNAME", "DESTINATION_USER", "IMAP_DEST_USER"}},
    {"PASSWORD_2",  {"DEST_PASSWORD", "DEST_PASS", "DESTINATION_PASSWORD", "IMAP_DEST_PASSWORD"}},
    {"IDLE_TIMEOUT", {"IDLE_REFRESH_SECONDS"}},
};

// Prefixes used to group the environment snapshot printed while waiting for configuration
static const std::vector<std::string> ENV_DIAGNOSTIC_PREFIXES = {"HOST_", "USER_", "PASSWORD_", "SOURCE_", "DEST_", "IMAP_"};

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"},
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorOutlookLoginViaWebBrowser, "ErrorOutlookLoginViaWebBrowser"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
    {mailcore::ErrorIdle, "ErrorIdle"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorFetch, "ErrorFetch"},
};

#endif /* Constants_hpp */
