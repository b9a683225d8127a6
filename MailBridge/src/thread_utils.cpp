#include "mailbridge/thread_utils.hpp"
#include <spdlog/details/os.h>
#include <map>
#include <mutex>
#include <thread>

#include <pthread.h>

static std::map<size_t, std::string> names{};
static std::mutex namesMtx;

void SetThreadName(const char * threadName)
{
    {
        std::lock_guard<std::mutex> lock(namesMtx);
        names[spdlog::details::os::thread_id()] = threadName;
    }
    // linux limits thread names to 15 characters plus the terminator
    std::string truncated = std::string(threadName).substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

std::string * GetThreadName(size_t spdlog_thread_id) {
    std::lock_guard<std::mutex> lock(namesMtx);
    return &names[spdlog_thread_id];
}
