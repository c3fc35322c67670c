#pragma once

#include <iostream>
#include <mutex>
#include <sstream>

namespace log_detail {

// Capture, io and merge threads all log; one line at a time.
inline std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace log_detail

#define LOG_TO_STREAM(stream, x)                                              \
    do {                                                                      \
        std::ostringstream _log_line;                                         \
        _log_line << x;                                                       \
        std::lock_guard<std::mutex> _log_lock(log_detail::OutputMutex());     \
        stream << _log_line.str() << std::endl;                               \
    } while (0)

#define LOG_INFO(x) LOG_TO_STREAM(std::cout, x)
#define LOG_WARN(x) LOG_TO_STREAM(std::cerr, "WARNING: " << x)
#define LOG_ERROR(x) LOG_TO_STREAM(std::cerr, "ERROR: " << x)

#ifndef NDEBUG
    #define DEBUG_LOG(x) LOG_TO_STREAM(std::cout, x)
#else
    #define DEBUG_LOG(x) ((void)0)
#endif
