#ifndef LOGQ_COMMAND_LINE_HPP
#define LOGQ_COMMAND_LINE_HPP

#include "viewer_options.hpp"
#include "../core/level.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <getopt.h>

namespace logq {

    struct CommandLine {
        ViewerConfiguration config;
        bool helpRequested;

        CommandLine() : helpRequested(false) {}
    };

    namespace detail {
        enum LongOnlyOption {
            kOptPollMs = 0x100,
            kOptProducerPid,
            kOptNoColor,
            kOptCapacity,
            kOptDebugLog,
            kOptDebugLevel
        };

        inline long parseNumberArg(const char* name, const char* value, long min, long max) {
            if (!value || !*value) {
                throw std::invalid_argument(std::string("Missing value for --") + name);
            }
            errno = 0;
            char* end = nullptr;
            long n = std::strtol(value, &end, 10);
            if (errno != 0 || *end != '\0' || n < min || n > max) {
                throw std::invalid_argument(std::string("Invalid value for --") + name + ": " + value);
            }
            return n;
        }

        inline Level parseLevelName(const std::string& name) {
            if (name.size() == 1) {
                Level level = levelFromChar(name[0]);
                if (level != Level::Unknown) return level;
            }
            std::string upper;
            for (size_t i = 0; i < name.size(); ++i) {
                upper += static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));
            }
            if (upper == "WARNING") return Level::Warn;
            for (int l = static_cast<int>(Level::Verbose); l <= static_cast<int>(Level::Fatal); ++l) {
                if (upper == getLevelString(static_cast<Level>(l))) return static_cast<Level>(l);
            }
            throw std::invalid_argument("Unknown level: " + name);
        }
    } // namespace detail

    inline std::string usage(const std::string& program) {
        return "Usage: " + program + " [options] [LOGFILE]\n"
            "\n"
            "Interactive viewer for a logcat (threadtime) file that is still being written.\n"
            "Without LOGFILE the newest file under <project>/.logq/logs is followed.\n"
            "\n"
            "Options:\n"
            "  -p, --project DIR       project root (default: current directory)\n"
            "  -P, --package NAME      package filter value (default: applicationId from Gradle)\n"
            "  -n, --no-package        start with the package filter off\n"
            "  -t, --tag TAG           initial tag filter (\"quoted\" for exact match)\n"
            "  -l, --level SPEC        initial level filter: W, W+, VDI, ?\n"
            "  -g, --grep TEXT         initial text filter on the message\n"
            "  -f, --follow-only       skip existing content, show new lines only\n"
            "  -d, --dump              print the filtered content once and exit\n"
            "  -b, --brief             brief line format (L/TAG(PID): message)\n"
            "      --poll-ms N         file polling interval in milliseconds (default 100)\n"
            "      --capacity N        records kept in memory (default 10000)\n"
            "      --producer-pid PID  stop following when this process exits\n"
            "      --no-color          disable colors (also NO_COLOR, LOGQ_NO_COLOR)\n"
            "      --debug-log FILE    write the viewer's own diagnostics to FILE\n"
            "      --debug-level LVL   minimum diagnostic level (default info)\n"
            "  -h, --help              show this help\n"
            "\n"
            "Keys: q quit, space pause, p/P package, t tag, l level, / text,\n"
            "      c clear filters (keep package), C clear all, ? help\n";
    }

    /// Parse argv into an unresolved configuration.
    /// @throws std::invalid_argument on unknown options or bad values.
    inline CommandLine parseCommandLine(int argc, char* const argv[]) {
        static const struct option longOptions[] = {
            {"project",      required_argument, nullptr, 'p'},
            {"package",      required_argument, nullptr, 'P'},
            {"no-package",   no_argument,       nullptr, 'n'},
            {"tag",          required_argument, nullptr, 't'},
            {"level",        required_argument, nullptr, 'l'},
            {"grep",         required_argument, nullptr, 'g'},
            {"follow-only",  no_argument,       nullptr, 'f'},
            {"dump",         no_argument,       nullptr, 'd'},
            {"brief",        no_argument,       nullptr, 'b'},
            {"help",         no_argument,       nullptr, 'h'},
            {"poll-ms",      required_argument, nullptr, detail::kOptPollMs},
            {"producer-pid", required_argument, nullptr, detail::kOptProducerPid},
            {"no-color",     no_argument,       nullptr, detail::kOptNoColor},
            {"capacity",     required_argument, nullptr, detail::kOptCapacity},
            {"debug-log",    required_argument, nullptr, detail::kOptDebugLog},
            {"debug-level",  required_argument, nullptr, detail::kOptDebugLevel},
            {nullptr,        0,                 nullptr, 0}
        };

        CommandLine cmd;
        ViewerConfiguration& cfg = cmd.config;
        std::string debugLog;
        Level debugLevel = Level::Info;

        // getopt keeps global state; 0 forces a full rescan.
        optind = 0;
        opterr = 0;
        for (;;) {
            int index = 0;
            int c = getopt_long(argc, argv, ":p:P:nt:l:g:fdbh", longOptions, &index);
            if (c == -1) break;
            switch (c) {
                case 'p': cfg.project(optarg); break;
                case 'P': cfg.appId(optarg); break;
                case 'n': cfg.packageFilter(false); break;
                case 't': cfg.tag(optarg); break;
                case 'l': cfg.level(optarg); break;
                case 'g': cfg.text(optarg); break;
                case 'f': cfg.followOnly(true); break;
                case 'd': cfg.dump(true); break;
                case 'b': cfg.brief(true); break;
                case 'h': cmd.helpRequested = true; break;
                case detail::kOptPollMs:
                    cfg.pollInterval(static_cast<unsigned>(
                        detail::parseNumberArg("poll-ms", optarg, 1, 60000)));
                    break;
                case detail::kOptProducerPid:
                    cfg.producerPid(static_cast<int>(
                        detail::parseNumberArg("producer-pid", optarg, 1, INT_MAX)));
                    break;
                case detail::kOptNoColor: cfg.color(false); break;
                case detail::kOptCapacity:
                    cfg.capacity(static_cast<size_t>(
                        detail::parseNumberArg("capacity", optarg, 1, 10000000)));
                    break;
                case detail::kOptDebugLog: debugLog = optarg; break;
                case detail::kOptDebugLevel: debugLevel = detail::parseLevelName(optarg); break;
                case ':':
                    throw std::invalid_argument(std::string("Missing value for ") + argv[optind - 1]);
                default:
                    if (optopt > 0 && optopt < 0x100) {
                        throw std::invalid_argument(std::string("Unknown option: -") + static_cast<char>(optopt));
                    }
                    throw std::invalid_argument(std::string("Unknown option: ") + argv[optind - 1]);
            }
        }

        if (!debugLog.empty()) {
            cfg.diagnosticLog(debugLog, debugLevel);
        }

        if (optind < argc) {
            cfg.logFile(argv[optind++]);
        }
        if (optind < argc) {
            throw std::invalid_argument(std::string("Unexpected argument: ") + argv[optind]);
        }
        if (!cfg.options().levelFilter.empty()) {
            LevelFilter::parse(cfg.options().levelFilter);
        }
        return cmd;
    }

} // namespace logq

#endif // LOGQ_COMMAND_LINE_HPP
