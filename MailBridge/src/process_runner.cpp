#include "mailbridge/process_runner.hpp"
#include "mailbridge/constants.hpp"
#include "mailbridge/sync_exception.hpp"

#include <cstring>
#include <thread>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

ProcessResult ForkExecProcessRunner::run(const ParameterSet & params, const std::string & outputPath, std::chrono::seconds timeout, std::function<bool()> shouldAbort) {
    if (params.empty()) {
        throw SyncException("invalid-command", "empty parameter set", false);
    }

    // Everything the child needs is prepared before fork, the child may only
    // make async-signal-safe calls.
    std::vector<char *> argv;
    argv.reserve(params.size() + 1);
    for (const auto & param : params) {
        argv.push_back(const_cast<char *>(param.c_str()));
    }
    argv.push_back(nullptr);

    int outFd = open(outputPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (outFd < 0) {
        throw SyncException("engine-output", "could not open " + outputPath + ": " + strerror(errno), true);
    }

    sigset_t emptyMask;
    sigemptyset(&emptyMask);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(outFd);
        throw SyncException("engine-spawn", std::string("fork failed: ") + strerror(err), true);
    }

    if (pid == 0) {
        setpgid(0, 0);
        sigprocmask(SIG_SETMASK, &emptyMask, nullptr);
        signal(SIGTERM, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGHUP, SIG_DFL);

        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outFd, STDOUT_FILENO);
        dup2(outFd, STDERR_FILENO);

        execvp(argv[0], argv.data());
        const char * msg = "exec failed\n";
        ssize_t written = write(STDERR_FILENO, msg, strlen(msg));
        (void)written;
        _exit(ENGINE_EXEC_FAILED_CODE);
    }

    // set from both sides, whichever runs first wins
    setpgid(pid, pid);
    close(outFd);

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;

    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            // without a working waitpid the group can't be supervised, don't leave it running
            int err = errno;
            kill(-pid, SIGKILL);
            waitpid(pid, &status, WNOHANG);
            throw SyncException("engine-wait", std::string("waitpid failed: ") + strerror(err), true);
        }
        if (shouldAbort && shouldAbort()) {
            result.aborted = true;
            terminateGroup(pid, status);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            terminateGroup(pid, status);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(ENGINE_POLL_INTERVAL_MS));
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
        result.exitCode = 128 + result.termSignal;
    }
    return result;
}

void ForkExecProcessRunner::terminateGroup(pid_t pid, int & status) {
    kill(-pid, SIGTERM);

    auto grace = std::chrono::steady_clock::now() + std::chrono::milliseconds(ENGINE_KILL_GRACE_MS);
    while (std::chrono::steady_clock::now() < grace) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            // the leader is gone, make sure nothing it spawned lingers
            kill(-pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    kill(-pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}
