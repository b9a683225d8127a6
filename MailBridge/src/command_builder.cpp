#include "mailbridge/command_builder.hpp"
#include "mailbridge/constants.hpp"

static void appendEndpoint(ParameterSet & params, const std::string & n, const EndpointSettings & endpoint) {
    params.push_back("--host" + n);
    params.push_back(endpoint.host);
    params.push_back("--user" + n);
    params.push_back(endpoint.user);
    params.push_back("--password" + n);
    params.push_back(endpoint.secret);
    if (endpoint.port > 0) {
        params.push_back("--port" + n);
        params.push_back(std::to_string(endpoint.port));
    }
}

ParameterSet BuildSyncCommand(const SyncConfiguration & config) {
    EndpointSettings source = config.source();
    EndpointSettings destination = config.destination();

    ParameterSet params{config.engineBinary()};
    appendEndpoint(params, "1", source);
    appendEndpoint(params, "2", destination);

    params.push_back("--folder");
    params.push_back(config.folder());

    if (source.useTLS) {
        params.push_back("--ssl1");
    }
    if (destination.useTLS) {
        params.push_back("--ssl2");
    }
    if (source.skipTLS) {
        params.push_back("--notls1");
    }
    if (destination.skipTLS) {
        params.push_back("--notls2");
    }

    // Safety bounds. The accessors never return a non-positive value.
    params.push_back("--maxage");
    params.push_back(std::to_string(config.dateFilterDays()));
    params.push_back("--maxmessages");
    params.push_back(std::to_string(config.maxEmailsPerSync()));
    params.push_back("--maxsize");
    params.push_back(std::to_string(config.maxEmailSizeBytes()));

    if (config.moveMode()) {
        params.push_back("--delete1");
    }

    for (const char * flag : {"--useuid", "--automap", "--skipcrossduplicates", "--syncinternaldates"}) {
        params.push_back(flag);
    }

    params.push_back("--maxmessagespersecond");
    params.push_back(std::to_string(ENGINE_MAX_MESSAGES_PER_SECOND));

    if (config.engineDebug()) {
        params.push_back("--debug");
        params.push_back("--debugimap");
    }
    return params;
}

std::string RedactedCommand(const ParameterSet & params) {
    std::string result = "";
    bool hideNext = false;
    for (const auto & param : params) {
        if (result != "") {
            result += " ";
        }
        if (hideNext) {
            result += "[hidden]";
            hideNext = false;
            continue;
        }
        result += param;
        hideNext = (param == "--password1" || param == "--password2");
    }
    return result;
}
