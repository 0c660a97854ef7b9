#ifndef LOGQ_LOG_COMMON_HPP
#define LOGQ_LOG_COMMON_HPP

#include <chrono>
#include <cstdio>
#include <ctime>
#include <memory>
#include <string>
#include <utility>

namespace logq {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
        size_t end = s.size();
        while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t')) --end;
        return s.substr(start, end - start);
    }

    /// Split a time point into the threadtime "MM-DD" and "HH:MM:SS.mmm" fields.
    inline void formatThreadtime(const std::chrono::system_clock::time_point& time,
                                 std::string& date, std::string& clock) {
        std::time_t t = std::chrono::system_clock::to_time_t(time);
        long long ms = static_cast<long long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                time.time_since_epoch()).count() % 1000);
        std::tm tmBuf;
        localtime_r(&t, &tmBuf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%m-%d", &tmBuf);
        date = buf;
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tmBuf);
        char msBuf[8];
        std::snprintf(msBuf, sizeof(msBuf), ".%03lld", ms);
        clock = std::string(buf) + msBuf;
    }
} // namespace detail
} // namespace logq

#endif // LOGQ_LOG_COMMON_HPP
