#ifndef LOGQ_DIAGNOSTIC_LOG_HPP
#define LOGQ_DIAGNOSTIC_LOG_HPP

#include "../core/log_common.hpp"
#include "../core/log_record.hpp"
#include "../sink/sink_interface.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include <unistd.h>

namespace logq {

    /// The viewer's own log.
    ///
    /// Messages become LogRecords (tag "logq", this process's pid) and are
    /// fanned out to every attached sink. With no sinks attached everything
    /// is discarded; nothing is ever written to the terminal, which belongs
    /// to the renderer.
    ///
    /// Thread-safe: the tailer thread and the controller log concurrently.
    class DiagnosticLog {
    public:
        explicit DiagnosticLog(Level minLevel = Level::Info, const std::string& tag = "logq")
            : m_minLevel(minLevel)
            , m_tag(tag) {}

        DiagnosticLog(const DiagnosticLog&) = delete;
        DiagnosticLog& operator=(const DiagnosticLog&) = delete;

        void setMinLevel(Level level) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_minLevel = level;
        }

        Level getMinLevel() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_minLevel;
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<std::is_base_of<ISink, SinkType>::value>::type
        addSink(Args&&... args) {
            addCustomSink(detail::make_unique<SinkType>(std::forward<Args>(args)...));
        }

        void addCustomSink(std::unique_ptr<ISink> sink) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sinks.push_back(std::move(sink));
        }

        bool enabled(Level level) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return !m_sinks.empty() && isOrderedLevel(level) &&
                   static_cast<int>(level) >= static_cast<int>(m_minLevel);
        }

        void log(Level level, const std::string& message) {
            if (!enabled(level)) return;

            LogRecord record;
            record.status = ParseStatus::Ok;
            detail::formatThreadtime(std::chrono::system_clock::now(), record.date, record.time);
            record.pid = static_cast<int>(::getpid());
            record.tid = threadNumber();
            record.level = level;
            record.tag = m_tag;
            record.message = message;

            std::lock_guard<std::mutex> lock(m_mutex);
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                m_sinks[i]->write(record);
            }
        }

        void debug(const std::string& message) { log(Level::Debug, message); }
        void info(const std::string& message) { log(Level::Info, message); }
        void warn(const std::string& message) { log(Level::Warn, message); }
        void error(const std::string& message) { log(Level::Error, message); }

        void flush() {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (size_t i = 0; i < m_sinks.size(); ++i) {
                m_sinks[i]->flush();
            }
        }

    private:
        static int threadNumber() {
            return static_cast<int>(std::hash<std::thread::id>()(std::this_thread::get_id()) % 100000);
        }

        mutable std::mutex m_mutex;
        Level m_minLevel;
        std::string m_tag;
        std::vector<std::unique_ptr<ISink> > m_sinks;
    };

} // namespace logq

#endif // LOGQ_DIAGNOSTIC_LOG_HPP
