#include "mailbridge/connection_tester.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"

using namespace mailcore;

void AccumulatorLogger::log(std::string str) {
    accumulated = accumulated + str;
}

void AccumulatorLogger::log(void * sender, ConnectionLogType logType, Data * buffer) {
    if (logType == ConnectionLogTypeSentPrivate) {
        accumulated = accumulated + "[credentials hidden]\n";
        return;
    }
    if (buffer) {
        accumulated = accumulated + std::string(buffer->bytes(), buffer->length());
    }
}

ConnectionTester::ConnectionTester(std::shared_ptr<const SyncConfiguration> config) : config(config) {
}

ErrorCode ConnectionTester::testEndpoint(const EndpointSettings & endpoint, const std::string & folder, AccumulatorLogger & logger) {
    IMAPSession session;
    ErrorCode err = ErrorNone;

    MailUtils::configureSessionForEndpoint(session, endpoint);
    session.setConnectionLogger(&logger);
    session.setTimeout(CONNECTION_TEST_TIMEOUT_SECONDS);

    session.connect(&err);
    if (err == ErrorNone) {
        session.login(&err);
    }
    if (err == ErrorNone && folder != "") {
        String path = AS_MCSTR(folder);
        session.folderStatus(&path, &err);
        if (err != ErrorNone) {
            logger.log("\n\nFolder `" + folder + "` could not be opened on " + endpoint.host + ".\n");
        }
    }
    session.disconnect();
    return err;
}

nlohmann::json ConnectionTester::run(std::function<bool()> shouldAbort) {
    AutoreleasePool pool;
    AccumulatorLogger logger;
    std::string errorService = "source";
    std::string errorName = "";

    if (shouldAbort && shouldAbort()) {
        errorName = "Cancelled";
    } else {
        logger.log("----------SOURCE----------\n");
        ErrorCode err = testEndpoint(config->source(), config->folder(), logger);

        if (err == ErrorNone) {
            errorService = "destination";
            if (shouldAbort && shouldAbort()) {
                errorName = "Cancelled";
            } else {
                logger.log("\n\n----------DESTINATION----------\n");
                err = testEndpoint(config->destination(), "", logger);
            }
        }
        if (err != ErrorNone) {
            errorName = ErrorCodeToTypeMap.count(err) ? ErrorCodeToTypeMap[err] : "Unknown";
        }
    }

    nlohmann::json resp = {
        {"error", nullptr},
        {"error_service", errorService},
        {"log", logger.accumulated},
    };
    if (errorName != "") {
        resp["error"] = errorName;
    }
    return resp;
}
