#ifndef LOGQ_VIEWER_HPP
#define LOGQ_VIEWER_HPP

#include "config/viewer_options.hpp"
#include "core/live_filter.hpp"
#include "core/log_common.hpp"
#include "core/ring_buffer.hpp"
#include "core/view_state.hpp"
#include "diag/diagnostic_log.hpp"
#include "formatter/threadtime_formatter.hpp"
#include "sink/file_sink.hpp"
#include "tail/tailer.hpp"
#include "transport/stdout_transport.hpp"
#include "ui/interactive_controller.hpp"
#include "ui/renderer.hpp"
#include "ui/terminal.hpp"
#include <chrono>
#include <memory>
#include <string>

#include <unistd.h>

namespace logq {

    /// Wires the tailer, buffer, filter, renderer and controller together
    /// for one session over a resolved ViewerOptions.
    class Viewer {
    public:
        explicit Viewer(const ViewerOptions& options)
            : m_options(options)
            , m_buffer(options.capacity)
            , m_filter(options.initialFilter())
            , m_diag(options.diagnosticLevel) {
            if (!m_options.diagnosticLogPath.empty()) {
                m_diag.addSink<FileSink>(m_options.diagnosticLogPath);
            }
        }

        Viewer(const Viewer&) = delete;
        Viewer& operator=(const Viewer&) = delete;

        /// Runs the session and returns the process exit status.
        /// @throws std::runtime_error if the log file cannot be opened.
        int run() {
            m_diag.info("viewing " + m_options.logPath + " with " +
                        m_filter.get().describe());
            Tailer tailer(tailOptions(), m_buffer, m_filter, m_view, &m_diag);
            tailer.open();

            if (m_options.dump) {
                return dump();
            }
            return interactive(tailer);
        }

        const RingBuffer& buffer() const { return m_buffer; }

        const LiveFilter& filter() const { return m_filter; }

        DiagnosticLog& diagnostics() { return m_diag; }

    private:
        TailOptions tailOptions() const {
            TailOptions t;
            t.path = m_options.logPath;
            // Dump mode prints what is already there.
            t.seedExisting = m_options.dump || !m_options.followOnly;
            t.pollInterval = std::chrono::milliseconds(m_options.pollIntervalMs);
            t.producerPid = m_options.producerPid;
            return t;
        }

        std::unique_ptr<IFormatter> makeFormatter() const {
            if (m_options.brief) {
                return std::unique_ptr<IFormatter>(new BriefFormatter());
            }
            return std::unique_ptr<IFormatter>(new ThreadtimeFormatter());
        }

        bool colorFor(int fd) const {
            return !m_options.noColor && Renderer::detectColorSupport(fd);
        }

        int dump() {
            StdoutTransport out(STDOUT_FILENO);
            std::unique_ptr<IFormatter> formatter = makeFormatter();
            bool color = colorFor(STDOUT_FILENO);
            FilterState filter = m_filter.get();
            Snapshot snapshot = m_buffer.snapshot();
            size_t shown = 0;
            for (size_t i = 0; i < snapshot.size(); ++i) {
                const LogRecord& record = snapshot[i];
                if (!filter.matches(record)) continue;
                std::string line = formatter->format(record);
                out.write(color ? Renderer::colorize(line, record.level) : line);
                ++shown;
            }
            out.flush();
            m_diag.debug("dumped " + std::to_string(shown) + " of " +
                         std::to_string(snapshot.size()) + " records");
            return 0;
        }

        int interactive(Tailer& tailer) {
            WakePipe wake;
            SignalGuard signals(wake);
            tailer.setNotifier([&wake]() { wake.notify(); });

            StdoutTransport out(STDOUT_FILENO);
            TerminalSize size = queryTerminalSize(STDOUT_FILENO);
            Renderer renderer(out, colorFor(STDOUT_FILENO), size.rows, size.columns, makeFormatter());

            int status = 0;
            {
                RawTerminal raw(STDIN_FILENO, STDOUT_FILENO);
                if (!raw.active()) {
                    m_diag.warn("stdin is not a terminal");
                }
                TerminalInput input(STDIN_FILENO, wake, STDOUT_FILENO);
                InteractiveController controller(input, renderer, m_buffer, m_filter, m_view,
                                                 [&tailer]() { return tailer.status(); }, &m_diag);
                tailer.start();
                try {
                    status = controller.run();
                } catch (...) {
                    // The notifier points at `wake`; the thread must be gone first.
                    tailer.stop();
                    throw;
                }
                tailer.stop();
            }
            m_diag.flush();
            return status;
        }

        ViewerOptions m_options;
        RingBuffer m_buffer;
        LiveFilter m_filter;
        ViewState m_view;
        DiagnosticLog m_diag;
    };

    /// Run one viewer session; see Viewer::run().
    inline int runViewer(const ViewerOptions& options) {
        Viewer viewer(options);
        return viewer.run();
    }

} // namespace logq

#endif // LOGQ_VIEWER_HPP
