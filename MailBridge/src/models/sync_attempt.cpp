#include "mailbridge/models/sync_attempt.hpp"
#include "mailbridge/mail_utils.hpp"

#include <cstdlib>
#include <regex>

// imapsync prints a summary block at the end of a run, e.g.
//   Messages transferred       : 12
//   Messages skipped           : 3
//   Total bytes transferred    : 4096
static const std::regex TRANSFERRED_RE("^\\s*(messages\\s+)?transferred\\s*:\\s*([0-9]+)", std::regex::icase);
static const std::regex SKIPPED_RE("^\\s*(messages\\s+)?skipped\\s*:\\s*([0-9]+)", std::regex::icase);
static const std::regex BYTES_RE("^\\s*total\\s+bytes\\s+transferred\\s*:\\s*([0-9]+)", std::regex::icase);

TransferStatistics ParseTransferStatistics(const std::string & output) {
    TransferStatistics stats;
    std::smatch match;

    for (const auto & line : MailUtils::splitLines(output)) {
        if (std::regex_search(line, match, TRANSFERRED_RE)) {
            stats.messagesTransferred = strtoll(match[2].str().c_str(), nullptr, 10);
        } else if (std::regex_search(line, match, SKIPPED_RE)) {
            stats.messagesSkipped = strtoll(match[2].str().c_str(), nullptr, 10);
        } else if (std::regex_search(line, match, BYTES_RE)) {
            stats.bytesTransferred = strtoll(match[1].str().c_str(), nullptr, 10);
        }
    }
    return stats;
}

SyncAttempt::SyncAttempt(time_t startTime, time_t endTime, int exitCode, bool timedOut, bool cancelled, TransferStatistics stats) :
    _startTime(startTime),
    _endTime(endTime),
    _exitCode(exitCode),
    _timedOut(timedOut),
    _cancelled(cancelled),
    _stats(stats)
{
}

time_t SyncAttempt::startTime() const {
    return _startTime;
}

time_t SyncAttempt::endTime() const {
    return _endTime;
}

long long SyncAttempt::durationSeconds() const {
    return (long long)(_endTime - _startTime);
}

bool SyncAttempt::succeeded() const {
    return _exitCode == 0 && !_timedOut && !_cancelled;
}

int SyncAttempt::exitCode() const {
    return _exitCode;
}

bool SyncAttempt::timedOut() const {
    return _timedOut;
}

bool SyncAttempt::cancelled() const {
    return _cancelled;
}

long long SyncAttempt::messagesTransferred() const {
    return _stats.messagesTransferred;
}

long long SyncAttempt::messagesSkipped() const {
    return _stats.messagesSkipped;
}

long long SyncAttempt::bytesTransferred() const {
    return _stats.bytesTransferred;
}

nlohmann::json SyncAttempt::toJSON() const {
    return {
        {"started", MailUtils::localTimestampForTime(_startTime)},
        {"duration", durationSeconds()},
        {"success", succeeded()},
        {"exit_code", _exitCode},
        {"timed_out", _timedOut},
        {"cancelled", _cancelled},
        {"transferred", _stats.messagesTransferred},
        {"skipped", _stats.messagesSkipped},
        {"bytes", _stats.bytesTransferred},
    };
}
