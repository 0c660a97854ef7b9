#ifndef LOGQ_THREADTIME_FORMATTER_HPP
#define LOGQ_THREADTIME_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <cstdio>
#include <string>

namespace logq {
    /// Renders a record in logcat's threadtime layout:
    /// "MM-DD HH:MM:SS.mmm  PID  TID L TAG     : message".
    /// Unparsed records are emitted as their raw text.
    class ThreadtimeFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            if (!record.ok()) return record.raw;

            char ids[32];
            std::snprintf(ids, sizeof(ids), "%5d %5d %c ", record.pid, record.tid,
                          levelToChar(record.level));

            std::string out;
            out.reserve(record.date.size() + record.time.size() + record.tag.size() +
                        record.message.size() + 32);
            out += record.date;
            out += ' ';
            out += record.time;
            out += ' ';
            out += ids;
            out += record.tag;
            for (size_t i = record.tag.size(); i < 8; ++i) out += ' ';
            out += ": ";
            out += record.message;
            return out;
        }
    };

    /// Compact layout for narrow terminals: "L/TAG( PID): message".
    class BriefFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            if (!record.ok()) return record.raw;
            char pid[16];
            std::snprintf(pid, sizeof(pid), "(%5d)", record.pid);
            std::string out(1, levelToChar(record.level));
            out += '/';
            out += record.tag;
            out += pid;
            out += ": ";
            out += record.message;
            return out;
        }
    };
} // namespace logq

#endif // LOGQ_THREADTIME_FORMATTER_HPP
