#ifndef LOGQ_RENDERER_HPP
#define LOGQ_RENDERER_HPP

#include "../core/filter_state.hpp"
#include "../core/log_common.hpp"
#include "../core/ring_buffer.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../formatter/threadtime_formatter.hpp"
#include "../transport/transport_interface.hpp"
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace logq {

    /// Paints the filtered projection of the ring buffer.
    ///
    /// The bottom row is the status/prompt line; the rows above hold the
    /// newest records that pass the filter. Two paths:
    ///   - redraw(): recompute the projection from a snapshot and repaint
    ///     everything (filter change, help toggle, resize, catch-up);
    ///   - drawNew(): append records newer than the last one painted.
    /// When more new lines arrived than fit on screen, drawNew() falls back
    /// to a full redraw, so intermediate frames may be skipped but the screen
    /// always ends up matching the current filter.
    ///
    /// Not thread-safe: owned and driven by the interactive controller.
    class Renderer {
    public:
        Renderer(ITransport& out, bool color, size_t rows = 24, size_t columns = 80,
                 std::unique_ptr<IFormatter> formatter = nullptr)
            : m_out(out)
            , m_formatter(formatter ? std::move(formatter)
                                    : std::unique_ptr<IFormatter>(new ThreadtimeFormatter()))
            , m_color(color)
            , m_rows(rows)
            , m_columns(columns)
            , m_lastSequence(0)
            , m_helpShown(false) {
            if (m_rows < 2) m_rows = 2;
            if (m_columns < 1) m_columns = 1;
        }

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        void setColor(bool enabled) { m_color = enabled; }

        bool isColorEnabled() const { return m_color; }

        void resize(size_t rows, size_t columns) {
            m_rows = rows < 2 ? 2 : rows;
            m_columns = columns < 1 ? 1 : columns;
            while (m_window.size() > bodyRows()) m_window.pop_front();
        }

        size_t rows() const { return m_rows; }

        size_t columns() const { return m_columns; }

        /// Every record of `snapshot` that passes `filter`, in buffer order.
        /// Pure: the same snapshot and filter always give the same result.
        static std::vector<RecordPtr> project(const Snapshot& snapshot, const FilterState& filter) {
            std::vector<RecordPtr> out;
            for (Snapshot::const_iterator it = snapshot.begin(); it != snapshot.end(); ++it) {
                if (filter.matches(**it)) out.push_back(*it);
            }
            return out;
        }

        /// Rebuild the visible window from scratch and repaint.
        void redraw(const Snapshot& snapshot, const FilterState& filter, bool helpVisible) {
            std::vector<RecordPtr> matching = project(snapshot, filter);
            m_window.clear();
            size_t body = bodyRows();
            size_t first = matching.size() > body ? matching.size() - body : 0;
            for (size_t i = first; i < matching.size(); ++i) m_window.push_back(matching[i]);
            if (!snapshot.empty()) {
                m_lastSequence = snapshot[snapshot.size() - 1].sequence;
            }
            m_helpShown = helpVisible;
            paintAll();
        }

        /// Paint records appended since the last paint. Returns how many new
        /// lines became visible.
        size_t drawNew(const RingBuffer& buffer, const FilterState& filter) {
            Snapshot fresh = buffer.snapshotAfter(m_lastSequence);
            if (fresh.empty()) return 0;
            std::vector<RecordPtr> matching = project(fresh, filter);
            m_lastSequence = fresh[fresh.size() - 1].sequence;
            if (matching.empty()) return 0;

            if (m_helpShown || matching.size() >= bodyRows()) {
                // More than a screenful: one full repaint instead of scrolling.
                for (size_t i = 0; i < matching.size(); ++i) m_window.push_back(matching[i]);
                while (m_window.size() > bodyRows()) m_window.pop_front();
                if (!m_helpShown) paintAll();
                return matching.size();
            }

            std::string frame = "\r\033[K";
            for (size_t i = 0; i < matching.size(); ++i) {
                m_window.push_back(matching[i]);
                frame += renderLine(*matching[i]);
                frame += "\n";
            }
            while (m_window.size() > bodyRows()) m_window.pop_front();
            frame += renderStatus();
            m_out.writeRaw(frame);
            m_out.flush();
            return matching.size();
        }

        void setStatus(const std::string& status) { m_status = status; }

        const std::string& status() const { return m_status; }

        /// Repaint only the bottom line with the current status.
        void drawStatus() {
            m_out.writeRaw("\r\033[K" + renderStatus());
            m_out.flush();
        }

        /// Replace the bottom line with an input prompt.
        void drawPrompt(const std::string& label, const std::string& input) {
            std::string line = truncate(label + input, m_columns > 1 ? m_columns - 1 : 1);
            m_out.writeRaw("\r\033[K\033[?25h" + line);
            m_out.flush();
        }

        /// Hide the cursor again after a prompt and restore the status line.
        void endPrompt() {
            m_out.writeRaw("\033[?25l");
            drawStatus();
        }

        /// Records currently on screen, oldest first.
        std::vector<RecordPtr> visible() const {
            return std::vector<RecordPtr>(m_window.begin(), m_window.end());
        }

        std::uint64_t lastSequence() const { return m_lastSequence; }

        /// Format one record for display, made terminal-safe and clipped to
        /// the terminal width.
        std::string renderLine(const LogRecord& record) const {
            std::string text = truncate(sanitize(m_formatter->format(record)), m_columns);
            return m_color ? colorize(text, record.level) : text;
        }

        /// Wrap the whole line in the level's color. Unknown stays plain.
        static std::string colorize(const std::string& text, Level level) {
            const char* color = getColorCode(level);
            if (color[0] == '\0') return text;
            std::string result;
            result.reserve(text.size() + 12);
            result += color;
            result += text;
            result += "\033[0m";
            return result;
        }

        /// Return the ANSI escape code for a level.
        static const char* getColorCode(Level level) {
            switch (level) {
                case Level::Verbose: return "\033[2m";      // dim
                case Level::Debug:   return "\033[36m";     // cyan
                case Level::Info:    return "\033[32m";     // green
                case Level::Warn:    return "\033[33m";     // yellow
                case Level::Error:   return "\033[31m";     // red
                case Level::Fatal:   return "\033[1;31m";   // bold red
                default: return "";
            }
        }

        /// Color auto-detection: off when the output is not a TTY, when
        /// NO_COLOR is set (any value, https://no-color.org/), or when
        /// LOGQ_NO_COLOR is non-empty.
        static bool detectColorSupport(int fd) {
            if (std::getenv("NO_COLOR") != nullptr) return false;
            const char* noColor = std::getenv("LOGQ_NO_COLOR");
            if (noColor && noColor[0] != '\0') return false;
            return ::isatty(fd) != 0;
        }

        /// Replace bytes a terminal would act on: tabs expand to the next
        /// multiple of 8 columns, C0 controls and DEL become caret notation
        /// (ESC is "^["), C1 controls (U+0080..U+009F) become '?'. Afterwards
        /// every code point occupies one column.
        static std::string sanitize(const std::string& text) {
            std::string out;
            out.reserve(text.size());
            size_t columns = 0;
            size_t i = 0;
            while (i < text.size()) {
                unsigned char c = static_cast<unsigned char>(text[i]);
                if (c == '\t') {
                    do {
                        out += ' ';
                        ++columns;
                    } while (columns % kTabWidth != 0);
                    ++i;
                    continue;
                }
                if (c < 0x20 || c == 0x7F) {
                    out += '^';
                    out += static_cast<char>(c == 0x7F ? '?' : c + '@');
                    columns += 2;
                    ++i;
                    continue;
                }
                if (c == 0xC2 && i + 1 < text.size()) {
                    unsigned char next = static_cast<unsigned char>(text[i + 1]);
                    if (next >= 0x80 && next <= 0x9F) {
                        out += '?';
                        ++columns;
                        i += 2;
                        continue;
                    }
                }
                out += text[i];
                if ((c & 0xC0) != 0x80) ++columns;
                ++i;
            }
            return out;
        }

        /// Clip to at most `width` code points without splitting a UTF-8
        /// sequence.
        static std::string truncate(const std::string& text, size_t width) {
            size_t columns = 0;
            size_t i = 0;
            while (i < text.size()) {
                unsigned char c = static_cast<unsigned char>(text[i]);
                size_t len = 1;
                if (c >= 0xF0) len = 4;
                else if (c >= 0xE0) len = 3;
                else if (c >= 0xC0) len = 2;
                if (columns == width) return text.substr(0, i);
                ++columns;
                i += len;
            }
            return text;
        }

        static const std::vector<std::string>& helpLines() {
            static const std::vector<std::string> s_lines = {
                "logq keys",
                "",
                "  q        quit",
                "  space    pause / resume the live view",
                "  p        toggle the package filter",
                "  P        set the package name (enables the package filter)",
                "  t        set the tag filter (empty clears)",
                "  l        set the level filter: W, E, I+, VDI (empty clears)",
                "  /        set the text filter (empty clears)",
                "  c        clear all filters except package",
                "  C        clear every filter, including package",
                "  ?        toggle this help",
                "",
                "  Wrap a value in double quotes for an exact match: \"MyTag\"",
                "  In prompts: Enter accepts, Esc cancels, Ctrl-U clears",
            };
            return s_lines;
        }

    private:
        enum { kTabWidth = 8 };

        size_t bodyRows() const { return m_rows - 1; }

        std::string renderStatus() const {
            std::string text = truncate(m_status, m_columns > 1 ? m_columns - 1 : 1);
            return m_color ? "\033[7m" + text + "\033[0m" : text;
        }

        void paintAll() {
            std::string frame = "\033[H\033[2J";
            if (m_helpShown) {
                const std::vector<std::string>& help = helpLines();
                for (size_t i = 0; i < help.size() && i < bodyRows(); ++i) {
                    frame += truncate(help[i], m_columns);
                    frame += "\n";
                }
            } else {
                for (size_t i = 0; i < m_window.size(); ++i) {
                    frame += renderLine(*m_window[i]);
                    frame += "\n";
                }
            }
            frame += renderStatus();
            m_out.writeRaw(frame);
            m_out.flush();
        }

        ITransport& m_out;
        std::unique_ptr<IFormatter> m_formatter;
        bool m_color;
        size_t m_rows;
        size_t m_columns;
        std::deque<RecordPtr> m_window;
        std::uint64_t m_lastSequence;
        bool m_helpShown;
        std::string m_status;
    };

} // namespace logq

#endif // LOGQ_RENDERER_HPP
