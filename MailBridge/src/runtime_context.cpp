#include "mailbridge/runtime_context.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/mail_utils.hpp"

#include <limits.h>
#include <unistd.h>

#define FS_PATH_SEP "/"

RuntimeContext RuntimeContext::ForApplicationDirectory(std::string dir) {
    if (dir == "") {
        dir = MailUtils::getEnvUTF8("APP_DIR");
    }
    if (dir == "") {
        char cwd[PATH_MAX];
        dir = getcwd(cwd, sizeof(cwd)) ? std::string(cwd) : ".";
    }
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }

    RuntimeContext ctx;
    ctx.appDir = dir;
    ctx.logDir = dir + FS_PATH_SEP + LOG_DIR_NAME;
    ctx.logPath = ctx.logDir + FS_PATH_SEP + LOG_FILE_NAME;
    ctx.dataDir = dir + FS_PATH_SEP + DATA_DIR_NAME;
    ctx.healthPath = ctx.dataDir + FS_PATH_SEP + HEALTH_FILE_NAME;
    ctx.pidPath = ctx.dataDir + FS_PATH_SEP + PID_FILE_NAME;
    ctx.engineOutputPath = ctx.dataDir + FS_PATH_SEP + ENGINE_OUTPUT_FILE_NAME;
    return ctx;
}
