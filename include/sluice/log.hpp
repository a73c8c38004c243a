#ifndef SLUICE_LOG_HEADER
#define SLUICE_LOG_HEADER

#include <string>

namespace sluice {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

// Each scheduler instance may identify itself in its log lines with an id, so that
// several concurrently streamed files can share a log file.
void log_scheduler(const int id, const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_priority_table(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_session(const int id, const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // log
} // sluice

#endif // SLUICE_LOG_HEADER
