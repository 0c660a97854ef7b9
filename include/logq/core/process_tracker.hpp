#ifndef LOGQ_PROCESS_TRACKER_HPP
#define LOGQ_PROCESS_TRACKER_HPP

#include "log_record.hpp"
#include <cctype>
#include <map>
#include <string>

namespace logq {

    /// Learns which process owns each pid from ActivityManager's lifecycle
    /// lines and stamps records with that process name.
    ///
    ///   Start proc 4321:com.example.app/u0a123 for activity ...   4321 -> com.example.app
    ///   Start proc com.example.app for activity ...: pid=4321 ...  (older releases)
    ///   Process com.example.app (pid 4321) has died ...            forget 4321
    ///   Killing 4321:com.example.app/u0a123 (adj 900): ...         forget 4321
    ///
    /// Not thread-safe. Feed it every record in file order.
    class ProcessTracker {
    public:
        /// Update the table if `record` is a lifecycle line, then set
        /// record.process for its pid. The lifecycle line itself is stamped
        /// with the emitting process (system_server), not the subject.
        void annotate(LogRecord& record) {
            if (!record.ok()) return;
            std::map<int, std::string>::const_iterator it = m_names.find(record.pid);
            if (it != m_names.end()) record.process = it->second;
            if (record.tag == "ActivityManager") learn(record.message);
        }

        /// Process name for `pid`, or empty when unknown.
        std::string processOf(int pid) const {
            std::map<int, std::string>::const_iterator it = m_names.find(pid);
            return it == m_names.end() ? std::string() : it->second;
        }

        size_t size() const { return m_names.size(); }

        void clear() { m_names.clear(); }

    private:
        void learn(const std::string& message) {
            int pid = 0;
            std::string name;
            size_t at = message.find("Start proc ");
            if (at != std::string::npos) {
                if (parsePidColonName(message, at + 11, pid, name) ||
                    parseNameThenPidEquals(message, at + 11, pid, name)) {
                    m_names[pid] = name;
                }
                return;
            }
            at = message.find("Killing ");
            if (at != std::string::npos) {
                if (parsePidColonName(message, at + 8, pid, name)) m_names.erase(pid);
                return;
            }
            at = message.find("Process ");
            if (at != std::string::npos && message.find(") has died") != std::string::npos) {
                size_t open = message.find(" (pid ", at);
                if (open != std::string::npos && parseNumber(message, open + 6, pid)) {
                    m_names.erase(pid);
                }
            }
        }

        /// "4321:com.example.app/u0a123"
        static bool parsePidColonName(const std::string& s, size_t pos, int& pid, std::string& name) {
            size_t colon = s.find(':', pos);
            if (colon == std::string::npos || !parseNumber(s, pos, pid) ||
                colon != pos + digitCount(s, pos)) {
                return false;
            }
            size_t end = s.find_first_of("/ ", colon + 1);
            name = s.substr(colon + 1, end == std::string::npos ? std::string::npos : end - colon - 1);
            return !name.empty();
        }

        /// "com.example.app for activity ...: pid=4321 uid=..."
        static bool parseNameThenPidEquals(const std::string& s, size_t pos, int& pid, std::string& name) {
            size_t end = s.find(' ', pos);
            if (end == std::string::npos || end == pos) return false;
            size_t key = s.find("pid=", end);
            if (key == std::string::npos || !parseNumber(s, key + 4, pid)) return false;
            name = s.substr(pos, end - pos);
            return true;
        }

        static size_t digitCount(const std::string& s, size_t pos) {
            size_t n = 0;
            while (pos + n < s.size() && std::isdigit(static_cast<unsigned char>(s[pos + n]))) ++n;
            return n;
        }

        static bool parseNumber(const std::string& s, size_t pos, int& out) {
            size_t n = digitCount(s, pos);
            if (n == 0 || n > 9) return false;
            out = 0;
            for (size_t i = 0; i < n; ++i) out = out * 10 + (s[pos + i] - '0');
            return out > 0;
        }

        std::map<int, std::string> m_names;
    };

} // namespace logq

#endif // LOGQ_PROCESS_TRACKER_HPP
