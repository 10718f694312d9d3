#pragma once
#include <ctime>

namespace hybrid_agent {

// Thread-safe broken-down time on both POSIX and Windows CRTs
inline std::tm local_tm(std::time_t t) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

inline std::tm utc_tm(std::time_t t) {
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

}
