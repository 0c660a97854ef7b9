#ifndef LOGQ_LOG_RECORD_HPP
#define LOGQ_LOG_RECORD_HPP

#include "level.hpp"
#include <cstdint>
#include <string>

namespace logq {
    enum class ParseStatus {
        Ok,
        Unparsed
    };

    /// One log line. Unparsed records keep the raw text as their message,
    /// an empty tag and Level::Unknown so they stay visible and filterable.
    struct LogRecord {
        std::uint64_t sequence;
        std::string raw;
        ParseStatus status;
        std::string date;
        std::string time;
        int pid;
        int tid;
        Level level;
        std::string tag;
        std::string message;
        std::string process;    ///< Owner of pid when known (ProcessTracker)

        LogRecord()
            : sequence(0)
            , status(ParseStatus::Unparsed)
            , pid(0)
            , tid(0)
            , level(Level::Unknown) {}

        bool ok() const { return status == ParseStatus::Ok; }
    };
} // namespace logq

#endif // LOGQ_LOG_RECORD_HPP
