#include "log.hpp"

#include <cassert>
#include <fstream>
#include <map>
#include <mutex>
#ifdef SLUICE_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // SLUICE_ENABLE_STREAM_DEBUGGING

namespace sluice {
namespace log {
namespace detail {

#define SLUICE_FLUSH(f)                                                                  \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

/**
 * Schedulers are invoked from the player and the transfer engine threads, so all
 * loggers are thread-safe.
 */
class scheduler_logger
{
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    void log(const int id, const std::string& header, const std::string& log,
            const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        SLUICE_FLUSH(file_);
    }
};

class priority_table_logger
{
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    void log(const std::string& header, const std::string& log, const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        SLUICE_FLUSH(file_);
    }
};

class session_logger
{
    // Each session gets its own file, keyed by the session's id.
    std::map<int, std::ofstream> files_;
    std::mutex files_mutex_;

public:
    void log(const int id, const std::string& header, const std::string& log,
            const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(files_mutex_);
        for(auto& e : files_) {
            SLUICE_FLUSH(e.second);
        }
    }
};

// global logger instances

scheduler_logger scheduler_logger;
priority_table_logger priority_table_logger;
session_logger session_logger;

#ifndef SLUICE_MIN_LOG_PRIORITY
#define SLUICE_MIN_LOG_PRIORITY priority::low
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

#ifdef SLUICE_ENABLE_LOGGING

#ifndef SLUICE_LOG_PATH
#error "SLUICE_LOG_PATH must be defined when logging is enabled"
#endif

template <typename String>
std::string make_log_path(const String& name)
{
    return std::string(SLUICE_LOG_PATH) + '/' + name + "-log.txt";
}

#define SLUICE_PRIORITY_CHAR(p)                                                          \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define SLUICE_LOG(priority, stream, header, log)                                        \
    stream << '[' << SLUICE_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

#ifdef SLUICE_ENABLE_STREAM_DEBUGGING
#define SLUICE_STREAM std::clog
#define SLUICE_CLOG(priority, file, header, log)                                         \
    do {                                                                                 \
        assert(file.is_open());                                                          \
        SLUICE_LOG(priority, file, header, log);                                         \
        SLUICE_LOG(priority, SLUICE_STREAM, header, log);                                \
    } while(0)
#else // SLUICE_ENABLE_STREAM_DEBUGGING
#define SLUICE_CLOG(p, f, h, l) SLUICE_LOG(p, f, h, l)
#endif // SLUICE_ENABLE_STREAM_DEBUGGING

#endif // SLUICE_ENABLE_LOGGING

void scheduler_logger::log(const int id, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef SLUICE_ENABLE_LOGGING
    if(priority < SLUICE_MIN_LOG_PRIORITY) {
        return;
    }
    const auto new_header = "scheduler#" + std::to_string(id) + '|' + header;
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path("scheduler"), g_open_mode);
    }
    SLUICE_CLOG(priority, file_, new_header, log);
#endif // SLUICE_ENABLE_LOGGING
}

void priority_table_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef SLUICE_ENABLE_LOGGING
    if(priority < SLUICE_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path("priority_table"), g_open_mode);
    }
    SLUICE_CLOG(priority, file_, header, log);
#endif // SLUICE_ENABLE_LOGGING
}

void session_logger::log(const int id, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef SLUICE_ENABLE_LOGGING
    if(priority < SLUICE_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(files_mutex_);
    auto it = files_.find(id);
    if(it == files_.end()) {
        const auto path = make_log_path("session#" + std::to_string(id));
        it = files_.emplace(id, std::ofstream(path.c_str(), g_open_mode)).first;
    }
    SLUICE_CLOG(priority, it->second, header, log);
#endif // SLUICE_ENABLE_LOGGING
}

} // detail

void log_scheduler(const int id, const std::string& header, const std::string& log,
        const priority priority)
{
    detail::scheduler_logger.log(id, header, log, priority);
}

void log_priority_table(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::priority_table_logger.log(header, log, priority);
}

void log_session(const int id, const std::string& header, const std::string& log,
        const priority priority)
{
    detail::session_logger.log(id, header, log, priority);
}

void flush()
{
    detail::scheduler_logger.flush();
    detail::priority_table_logger.flush();
    detail::session_logger.flush();
}

} // log
} // sluice
