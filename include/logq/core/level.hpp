#ifndef LOGQ_LEVEL_HPP
#define LOGQ_LEVEL_HPP

namespace logq {
    /// Logcat priority. Declaration order is the severity order V < D < I < W < E < F.
    /// Unknown is outside that order and never compares as "at or above" anything.
    enum class Level {
        Verbose,
        Debug,
        Info,
        Warn,
        Error,
        Fatal,
        Unknown
    };

    inline const char *getLevelString(Level level) {
        switch (level) {
            case Level::Verbose: return "VERBOSE";
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO";
            case Level::Warn: return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    inline char levelToChar(Level level) {
        switch (level) {
            case Level::Verbose: return 'V';
            case Level::Debug: return 'D';
            case Level::Info: return 'I';
            case Level::Warn: return 'W';
            case Level::Error: return 'E';
            case Level::Fatal: return 'F';
            default: return '?';
        }
    }

    /// 'A' (assert) is what older logcat prints for fatal.
    inline Level levelFromChar(char c) {
        switch (c) {
            case 'V': case 'v': return Level::Verbose;
            case 'D': case 'd': return Level::Debug;
            case 'I': case 'i': return Level::Info;
            case 'W': case 'w': return Level::Warn;
            case 'E': case 'e': return Level::Error;
            case 'F': case 'f':
            case 'A': case 'a': return Level::Fatal;
            default: return Level::Unknown;
        }
    }

    inline bool isOrderedLevel(Level level) {
        return level != Level::Unknown;
    }
} // namespace logq

#endif // LOGQ_LEVEL_HPP
