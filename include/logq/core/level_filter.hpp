#ifndef LOGQ_LEVEL_FILTER_HPP
#define LOGQ_LEVEL_FILTER_HPP

#include "level.hpp"
#include "log_common.hpp"
#include <stdexcept>
#include <string>

namespace logq {

    /// Level constraint in one of two explicit forms:
    ///
    ///   X+     at-or-above: X and every more severe level ("W+" = W, E, F)
    ///   XYZ    exact set: only the listed letters ("VDI", or "E" alone)
    ///
    /// Letters are V D I W E F (case-insensitive). '?' may appear in a set to
    /// admit unparsed/unknown records; it is not valid with '+'.
    class LevelFilter {
    public:
        enum class Mode {
            Set,
            AtOrAbove
        };

        LevelFilter() : m_mode(Mode::Set), m_mask(0), m_threshold(Level::Verbose) {}

        /// @throws std::invalid_argument on anything outside the two forms.
        static LevelFilter parse(const std::string& spec) {
            std::string s = detail::trim(spec);
            if (s.empty()) {
                throw std::invalid_argument("Empty level filter");
            }

            LevelFilter f;
            if (s.size() >= 2 && s[s.size() - 1] == '+') {
                if (s.size() != 2) {
                    throw std::invalid_argument("'+' takes exactly one level letter: " + spec);
                }
                Level level = levelFromChar(s[0]);
                if (level == Level::Unknown || s[0] == 'A' || s[0] == 'a') {
                    throw std::invalid_argument("Unknown level in filter: " + spec);
                }
                f.m_mode = Mode::AtOrAbove;
                f.m_threshold = level;
                return f;
            }

            f.m_mode = Mode::Set;
            for (size_t i = 0; i < s.size(); ++i) {
                char c = s[i];
                if (c == '?') {
                    f.m_mask |= bit(Level::Unknown);
                    continue;
                }
                Level level = levelFromChar(c);
                if (level == Level::Unknown || c == 'A' || c == 'a') {
                    throw std::invalid_argument("Unknown level in filter: " + spec);
                }
                f.m_mask |= bit(level);
            }
            return f;
        }

        static LevelFilter atOrAbove(Level threshold) {
            LevelFilter f;
            f.m_mode = Mode::AtOrAbove;
            f.m_threshold = threshold;
            return f;
        }

        bool matches(Level level) const {
            if (m_mode == Mode::AtOrAbove) {
                return isOrderedLevel(level) &&
                       static_cast<int>(level) >= static_cast<int>(m_threshold);
            }
            return (m_mask & bit(level)) != 0;
        }

        Mode mode() const { return m_mode; }

        Level threshold() const { return m_threshold; }

        /// Canonical spelling, e.g. "W+" or "VDI".
        std::string toString() const {
            if (m_mode == Mode::AtOrAbove) {
                return std::string(1, levelToChar(m_threshold)) + "+";
            }
            std::string out;
            for (int l = static_cast<int>(Level::Verbose); l <= static_cast<int>(Level::Unknown); ++l) {
                if (m_mask & (1u << l)) out += levelToChar(static_cast<Level>(l));
            }
            return out;
        }

        bool operator==(const LevelFilter& other) const {
            if (m_mode != other.m_mode) return false;
            return m_mode == Mode::AtOrAbove ? m_threshold == other.m_threshold
                                             : m_mask == other.m_mask;
        }

        bool operator!=(const LevelFilter& other) const { return !(*this == other); }

    private:
        static unsigned bit(Level level) {
            return 1u << static_cast<int>(level);
        }

        Mode m_mode;
        unsigned m_mask;
        Level m_threshold;
    };

} // namespace logq

#endif // LOGQ_LEVEL_FILTER_HPP
