/** main [MailBridge]
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

#include <iostream>
#include <memory>
#include <string>

#include <MailCore/MailCore.h>
#include <StanfordCPPLib/exceptions.h>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "optionparser.h"

#include "mailbridge/config_resolver.hpp"
#include "mailbridge/connection_tester.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/daemon.hpp"
#include "mailbridge/health_supervisor.hpp"
#include "mailbridge/mail_utils.hpp"
#include "mailbridge/runtime_context.hpp"
#include "mailbridge/shutdown_signal.hpp"
#include "mailbridge/spd_log_extensions.hpp"
#include "mailbridge/thread_utils.hpp"

using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: HOST_1=... USER_1=... PASSWORD_1=... HOST_2=... USER_2=... PASSWORD_2=... mailbridge [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, MODE, DIR, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tOptional: sync (default), health, or test." },
    {DIR,     0,"d", "dir",     CArg::Required,  "  --dir, -d  \tOptional: application directory holding .env, logs/ and data/. Defaults to $APP_DIR or the working directory." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log at debug level, including the redacted engine command." },
    {0,0,0,0,0,0}
};

int runHealthProbe(RuntimeContext context) {
    HealthSupervisor health(context);
    HealthReport report = health.evaluate();
    if (report.healthy) {
        std::cout << "OK: Service is healthy" << std::endl;
        return 0;
    }
    std::cout << "CRITICAL: " << report.reason << std::endl;
    return 1;
}

int runTestConnections(RuntimeContext context, bool verbose) {
    // stdout is reserved for the JSON result
    auto logger = spdlog::stderr_color_mt("logger");
    logger->set_formatter(MakeLogFormatter(verbose));
    logger->set_level(verbose ? spdlog::level::debug : LogLevelFromString(MailUtils::getEnvUTF8("LOG_LEVEL")));

    std::string envFile = EnvFileLoader::loadFirstAvailable(context.appDir);
    if (envFile != "") {
        logger->info("Loaded environment from {}", envFile);
    }
    ShutdownSignal unused;
    ConfigResolver resolver(context.appDir, unused);
    ConfigResolver::applyAliases();
    auto config = std::make_shared<const SyncConfiguration>(resolver.buildConfiguration());

    auto missing = config->missingRequiredFields();
    if (!missing.empty()) {
        std::string names = "";
        for (const auto & name : missing) {
            names += " " + name;
        }
        nlohmann::json resp = {{"error", "Configuration is missing required fields:" + names}};
        std::cout << resp.dump() << std::endl;
        return 1;
    }

    ConnectionTester tester(config);
    nlohmann::json resp = tester.run();
    std::cout << resp.dump() << std::endl;
    return resp["error"].is_null() ? 0 : 1;
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || options[UNKNOWN]) {
        option::printUsage(std::cout, usage);
        return options[HELP] ? 0 : 1;
    }

    std::string mode = options[MODE] ? std::string(options[MODE].arg) : "sync";
    std::string dir = options[DIR] ? std::string(options[DIR].arg) : "";
    bool verbose = options[VERBOSE] ? true : false;

    RuntimeContext context = RuntimeContext::ForApplicationDirectory(dir);

    if (mode == "health") {
        return runHealthProbe(context);
    }
    if (mode == "test") {
        return runTestConnections(context, verbose);
    }
    if (mode == "sync") {
        int code = Daemon(context, verbose).run();
        curl_global_cleanup();
        spdlog::shutdown();
        return code;
    }

    option::printUsage(std::cout, usage);
    return 1;
}
