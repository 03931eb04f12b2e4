#pragma once

#include <ctime>

#ifdef _WIN32
    #define HSYNC_PLATFORM_WINDOWS
#else
    #define HSYNC_PLATFORM_LINUX
#endif

namespace hsync::core {

/// Convert broken-down UTC time to epoch seconds (inverse of gmtime).
inline std::time_t utc_mktime(std::tm* tm) {
#ifdef HSYNC_PLATFORM_WINDOWS
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

inline bool utc_breakdown(std::time_t seconds, std::tm* out) {
#ifdef HSYNC_PLATFORM_WINDOWS
    return gmtime_s(out, &seconds) == 0;
#else
    return gmtime_r(&seconds, out) != nullptr;
#endif
}

} // namespace hsync::core
