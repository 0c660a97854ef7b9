#ifndef LOGQ_INTERACTIVE_CONTROLLER_HPP
#define LOGQ_INTERACTIVE_CONTROLLER_HPP

#include "input_source.hpp"
#include "renderer.hpp"
#include "../core/level_filter.hpp"
#include "../core/live_filter.hpp"
#include "../core/ring_buffer.hpp"
#include "../core/view_state.hpp"
#include "../diag/diagnostic_log.hpp"
#include "../tail/tailer.hpp"
#include <functional>
#include <stdexcept>
#include <string>

namespace logq {

    /// Single-threaded command loop.
    ///
    /// Waits for whichever comes first, a key or a tailer notification, and
    /// applies it. Every filter mutation re-projects the whole ring buffer
    /// through the new filter so the screen never shows stale lines or hides
    /// lines that now match.
    ///
    /// Prompts block only this loop; the tailer keeps appending meanwhile and
    /// the screen catches up once the prompt closes.
    class InteractiveController {
    public:
        typedef std::function<TailStatus()> StatusProvider;

        InteractiveController(IInputSource& input, Renderer& renderer, RingBuffer& buffer,
                              LiveFilter& filter, ViewState& view,
                              StatusProvider tailStatus = StatusProvider(),
                              DiagnosticLog* diag = nullptr)
            : m_input(input)
            , m_renderer(renderer)
            , m_buffer(buffer)
            , m_filter(filter)
            , m_view(view)
            , m_tailStatus(std::move(tailStatus))
            , m_diag(diag)
            , m_quit(false)
            , m_pendingRefresh(false)
            , m_messageIsError(false) {}

        InteractiveController(const InteractiveController&) = delete;
        InteractiveController& operator=(const InteractiveController&) = delete;

        /// Runs until 'q', an interrupt, or end of input. Returns the exit status.
        int run() {
            fullRedraw();
            while (!m_quit) {
                dispatch(m_input.next());
            }
            diag().info("viewer quit");
            return 0;
        }

        void dispatch(const InputEvent& event) {
            switch (event.type) {
                case InputEvent::Type::Key:
                    handleKey(event.key);
                    break;
                case InputEvent::Type::Wake:
                    refresh();
                    break;
                case InputEvent::Type::Resize:
                    m_renderer.resize(event.rows, event.columns);
                    fullRedraw();
                    break;
                case InputEvent::Type::Interrupt:
                case InputEvent::Type::EndOfInput:
                    m_quit = true;
                    break;
            }
        }

        /// Apply one command key. Returns false once quitting.
        bool handleKey(int key) {
            switch (key) {
                case 'q':
                    m_quit = true;
                    break;
                case ' ':
                    if (m_view.togglePaused()) {
                        setMessage("paused", false);
                        m_renderer.setStatus(statusLine());
                        m_renderer.drawStatus();
                    } else {
                        setMessage("resumed", false);
                        fullRedraw();
                    }
                    break;
                case 'p':
                    togglePackage();
                    break;
                case 'P':
                    promptPackage();
                    break;
                case 't':
                    promptTag();
                    break;
                case 'l':
                    promptLevel();
                    break;
                case '/':
                    promptText();
                    break;
                case 'c':
                    m_filter.update([](FilterState& f) { f.clearAllButPackage(); });
                    setMessage("filters cleared (package kept)", false);
                    fullRedraw();
                    break;
                case 'C':
                    m_filter.update([](FilterState& f) { f.clearAll(); });
                    setMessage("all filters cleared", false);
                    fullRedraw();
                    break;
                case '?':
                    m_view.toggleHelp();
                    fullRedraw();
                    break;
                case keys::kCtrlL:
                    fullRedraw();
                    break;
                case keys::kCtrlC:
                case keys::kCtrlD:
                    m_quit = true;
                    break;
                default:
                    break;
            }
            return !m_quit;
        }

        /// Tailer notification: paint new arrivals unless paused, refresh status.
        void refresh() {
            if (m_view.paused() || m_view.helpVisible()) {
                m_renderer.setStatus(statusLine());
                m_renderer.drawStatus();
                return;
            }
            m_renderer.setStatus(statusLine());
            if (m_renderer.drawNew(m_buffer, m_filter.get()) == 0) {
                m_renderer.drawStatus();
            }
        }

        bool quitRequested() const { return m_quit; }

        const std::string& lastMessage() const { return m_message; }

        bool lastMessageIsError() const { return m_messageIsError; }

        std::string statusLine() const {
            std::string line = " logq";
            if (m_tailStatus) {
                TailStatus st = m_tailStatus();
                line += " | ";
                line += getTailStateString(st.state);
                if (st.state == TailState::Error && !st.message.empty()) {
                    line += " (" + st.message + ")";
                }
            }
            line += " | " + std::to_string(m_buffer.size()) + " lines";
            line += " | " + m_filter.get().describe();
            if (m_view.paused()) line += " | PAUSED";
            if (!m_message.empty()) {
                line += m_messageIsError ? " | error: " : " | ";
                line += m_message;
            }
            line += " | ? help";
            return line;
        }

    private:
        DiagnosticLog& diag() {
            static DiagnosticLog s_silent;
            return m_diag ? *m_diag : s_silent;
        }

        void setMessage(const std::string& message, bool isError) {
            m_message = message;
            m_messageIsError = isError;
        }

        void fullRedraw() {
            m_pendingRefresh = false;
            m_renderer.setStatus(statusLine());
            if (m_view.paused()) {
                // Frozen window: only the status line may change.
                m_renderer.drawStatus();
                return;
            }
            m_renderer.redraw(m_buffer.snapshot(), m_filter.get(), m_view.helpVisible());
        }

        /// Repaints the status line, or everything if records or a resize
        /// arrived while a prompt held the status row.
        void refreshStatus() {
            if (m_pendingRefresh) {
                fullRedraw();
                return;
            }
            m_renderer.setStatus(statusLine());
            m_renderer.drawStatus();
        }

        /// After a mutation the paused window is frozen too, but it must not
        /// keep showing lines the new filter rejects, so filter changes always
        /// repaint.
        void applyFilterChange() {
            diag().debug("filter: " + m_filter.get().describe());
            m_pendingRefresh = false;
            m_renderer.setStatus(statusLine());
            m_renderer.redraw(m_buffer.snapshot(), m_filter.get(), m_view.helpVisible());
        }

        void togglePackage() {
            FilterState next = m_filter.get();
            next.togglePackage();
            m_filter.set(next);
            if (next.packageEnabled() && !next.hasPackageName()) {
                setMessage("package filter on, but no package name is set (P to set one)", false);
            } else {
                setMessage(next.packageEnabled() ? "package filter on" : "package filter off", false);
            }
            applyFilterChange();
        }

        void promptPackage() {
            std::string value;
            if (!prompt("package: ", value)) return;
            if (value.empty()) {
                m_filter.update([](FilterState& f) {
                    f.clearPackageName();
                    f.setPackageEnabled(false);
                });
                setMessage("package filter cleared", false);
            } else {
                m_filter.update([&value](FilterState& f) {
                    f.setPackageName(value);
                    f.setPackageEnabled(true);
                });
                setMessage("package filter on", false);
            }
            applyFilterChange();
        }

        void promptTag() {
            std::string value;
            if (!prompt("tag: ", value)) return;
            if (value.empty()) {
                m_filter.update([](FilterState& f) { f.clearTag(); });
            } else {
                m_filter.update([&value](FilterState& f) { f.setTag(value); });
            }
            setMessage("", false);
            applyFilterChange();
        }

        void promptLevel() {
            std::string value;
            if (!prompt("level (W, E, I+, VDI): ", value)) return;
            if (detail::trim(value).empty()) {
                m_filter.update([](FilterState& f) { f.clearLevel(); });
                setMessage("", false);
                applyFilterChange();
                return;
            }
            try {
                LevelFilter level = LevelFilter::parse(value);
                m_filter.update([&level](FilterState& f) { f.setLevel(level); });
                setMessage("", false);
                applyFilterChange();
            } catch (const std::invalid_argument& e) {
                diag().debug(std::string("rejected level filter: ") + e.what());
                setMessage(e.what(), true);
                refreshStatus();
            }
        }

        void promptText() {
            std::string value;
            if (!prompt("text: ", value)) return;
            if (value.empty()) {
                m_filter.update([](FilterState& f) { f.clearText(); });
            } else {
                m_filter.update([&value](FilterState& f) { f.setText(value); });
            }
            setMessage("", false);
            applyFilterChange();
        }

        /// Line editor on the status row. Returns false when cancelled (Esc)
        /// or when the session is ending (interrupt, end of input); in the
        /// latter case m_quit is set.
        bool prompt(const std::string& label, std::string& out) {
            std::string input;
            bool accepted = false;
            bool done = false;
            while (!done) {
                m_renderer.drawPrompt(label, input);
                InputEvent event = m_input.next();
                switch (event.type) {
                    case InputEvent::Type::Key:
                        switch (event.key) {
                            case keys::kEnter:
                            case keys::kLineFeed:
                                accepted = true;
                                done = true;
                                break;
                            case keys::kEscape:
                                done = true;
                                break;
                            case keys::kCtrlC:
                            case keys::kCtrlD:
                                m_quit = true;
                                done = true;
                                break;
                            case keys::kBackspace:
                            case keys::kBackspaceAlt:
                                eraseLastCharacter(input);
                                break;
                            case keys::kCtrlU:
                                input.clear();
                                break;
                            default:
                                if (event.key >= 32 && event.key < 256 && event.key != keys::kBackspace) {
                                    input += static_cast<char>(event.key);
                                }
                                break;
                        }
                        break;
                    case InputEvent::Type::Wake:
                        m_pendingRefresh = true;
                        break;
                    case InputEvent::Type::Resize:
                        m_renderer.resize(event.rows, event.columns);
                        m_pendingRefresh = true;
                        break;
                    case InputEvent::Type::Interrupt:
                    case InputEvent::Type::EndOfInput:
                        m_quit = true;
                        done = true;
                        break;
                }
            }

            m_renderer.endPrompt();
            if (m_quit) return false;
            if (!accepted) {
                setMessage("cancelled", false);
                refreshStatus();
                return false;
            }
            out = input;
            return true;
        }

        static void eraseLastCharacter(std::string& s) {
            if (s.empty()) return;
            size_t i = s.size() - 1;
            while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) --i;
            s.erase(i);
        }

        IInputSource& m_input;
        Renderer& m_renderer;
        RingBuffer& m_buffer;
        LiveFilter& m_filter;
        ViewState& m_view;
        StatusProvider m_tailStatus;
        DiagnosticLog* m_diag;
        bool m_quit;
        bool m_pendingRefresh;
        std::string m_message;
        bool m_messageIsError;
    };

} // namespace logq

#endif // LOGQ_INTERACTIVE_CONTROLLER_HPP
