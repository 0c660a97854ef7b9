#ifndef LOGQ_LINE_PARSER_HPP
#define LOGQ_LINE_PARSER_HPP

#include "log_record.hpp"
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

namespace logq {

    /// Parser for logcat "threadtime" lines:
    ///
    ///   MM-DD HH:MM:SS.mmm   PID   TID L TAG     : message
    ///
    /// The `-v year` date form (YYYY-MM-DD) is accepted as well. The tag
    /// ends at the first ':' after the level token that is followed by a
    /// space or the end of the line; anything after it belongs to the message,
    /// including further ": " sequences.
    ///
    /// Lines that do not fit are returned as Unparsed records carrying the raw
    /// text, never dropped.
    class LineParser {
    public:
        static LogRecord parse(const std::string& line) {
            LogRecord record;
            record.raw = stripCarriageReturn(line);
            if (!parseThreadtime(record)) {
                record.status = ParseStatus::Unparsed;
                record.date.clear();
                record.time.clear();
                record.pid = 0;
                record.tid = 0;
                record.level = Level::Unknown;
                record.tag.clear();
                record.message = record.raw;
            }
            return record;
        }

    private:
        static std::string stripCarriageReturn(const std::string& line) {
            size_t end = line.size();
            while (end > 0 && (line[end - 1] == '\r' || line[end - 1] == '\n')) --end;
            return line.substr(0, end);
        }

        static bool isDigit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        static bool digitsAt(const std::string& s, size_t pos, size_t count) {
            if (pos + count > s.size()) return false;
            for (size_t i = 0; i < count; ++i) {
                if (!isDigit(s[pos + i])) return false;
            }
            return true;
        }

        static size_t skipSpaces(const std::string& s, size_t pos) {
            while (pos < s.size() && s[pos] == ' ') ++pos;
            return pos;
        }

        /// Accepts "MM-DD" or "YYYY-MM-DD". Returns the position after the
        /// date, or npos.
        static size_t parseDate(const std::string& s, size_t pos) {
            if (digitsAt(s, pos, 4) && pos + 10 <= s.size() && s[pos + 4] == '-' &&
                digitsAt(s, pos + 5, 2) && s[pos + 7] == '-' && digitsAt(s, pos + 8, 2)) {
                return pos + 10;
            }
            if (digitsAt(s, pos, 2) && pos + 5 <= s.size() && s[pos + 2] == '-' &&
                digitsAt(s, pos + 3, 2)) {
                return pos + 5;
            }
            return std::string::npos;
        }

        static size_t parseClock(const std::string& s, size_t pos) {
            if (!(digitsAt(s, pos, 2) && pos + 8 <= s.size() && s[pos + 2] == ':' &&
                  digitsAt(s, pos + 3, 2) && s[pos + 5] == ':' && digitsAt(s, pos + 6, 2))) {
                return std::string::npos;
            }
            pos += 8;
            if (pos < s.size() && s[pos] == '.') {
                size_t frac = pos + 1;
                while (frac < s.size() && isDigit(s[frac])) ++frac;
                if (frac == pos + 1) return std::string::npos;
                pos = frac;
            }
            return pos;
        }

        static size_t parseNumber(const std::string& s, size_t pos, int& out) {
            size_t end = pos;
            while (end < s.size() && isDigit(s[end])) ++end;
            if (end == pos || end - pos > 9) return std::string::npos;
            out = std::atoi(s.substr(pos, end - pos).c_str());
            return end;
        }

        static bool parseThreadtime(LogRecord& record) {
            const std::string& s = record.raw;

            size_t pos = parseDate(s, 0);
            if (pos == std::string::npos || pos >= s.size() || s[pos] != ' ') return false;
            record.date = s.substr(0, pos);

            size_t clockStart = skipSpaces(s, pos);
            pos = parseClock(s, clockStart);
            if (pos == std::string::npos || pos >= s.size() || s[pos] != ' ') return false;
            record.time = s.substr(clockStart, pos - clockStart);

            pos = parseNumber(s, skipSpaces(s, pos), record.pid);
            if (pos == std::string::npos || pos >= s.size() || s[pos] != ' ') return false;

            pos = parseNumber(s, skipSpaces(s, pos), record.tid);
            if (pos == std::string::npos || pos >= s.size() || s[pos] != ' ') return false;

            pos = skipSpaces(s, pos);
            if (pos >= s.size()) return false;
            char levelChar = s[pos];
            if (pos + 1 < s.size() && s[pos + 1] != ' ') return false;
            record.level = levelFromChar(levelChar);
            if (record.level == Level::Unknown) return false;

            size_t tagStart = skipSpaces(s, pos + 1);
            size_t colon = tagStart;
            for (;;) {
                colon = s.find(':', colon);
                if (colon == std::string::npos) return false;
                if (colon + 1 == s.size() || s[colon + 1] == ' ') break;
                ++colon;
            }

            size_t tagEnd = colon;
            while (tagEnd > tagStart && s[tagEnd - 1] == ' ') --tagEnd;
            record.tag = s.substr(tagStart, tagEnd - tagStart);

            size_t msgStart = colon + 1;
            if (msgStart < s.size()) ++msgStart;
            record.message = s.substr(msgStart);
            record.status = ParseStatus::Ok;
            return true;
        }
    };

    /// Reassembles lines from arbitrary byte chunks. Only newline-terminated
    /// lines are released; the trailing fragment waits for the next chunk.
    class LineSplitter {
    public:
        explicit LineSplitter(size_t maxLineLength = 64 * 1024)
            : m_maxLineLength(maxLineLength > 0 ? maxLineLength : 1) {}

        /// Append a chunk and move every completed line into `out`.
        /// Returns the number of lines produced.
        size_t feed(const char* data, size_t len, std::vector<std::string>& out) {
            size_t produced = 0;
            size_t start = 0;
            for (size_t i = 0; i < len; ++i) {
                if (data[i] != '\n') continue;
                m_pending.append(data + start, i - start);
                out.push_back(std::move(m_pending));
                m_pending.clear();
                ++produced;
                start = i + 1;
            }
            if (start < len) {
                m_pending.append(data + start, len - start);
            }
            // A writer that never emits a newline must not grow us without bound.
            while (m_pending.size() > m_maxLineLength) {
                out.push_back(m_pending.substr(0, m_maxLineLength));
                m_pending.erase(0, m_maxLineLength);
                ++produced;
            }
            return produced;
        }

        bool hasPending() const { return !m_pending.empty(); }

        const std::string& pending() const { return m_pending; }

        void reset() { m_pending.clear(); }

    private:
        std::string m_pending;
        size_t m_maxLineLength;
    };

} // namespace logq

#endif // LOGQ_LINE_PARSER_HPP
