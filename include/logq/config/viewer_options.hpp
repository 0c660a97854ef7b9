#ifndef LOGQ_VIEWER_OPTIONS_HPP
#define LOGQ_VIEWER_OPTIONS_HPP

#include "project.hpp"
#include "../core/filter_state.hpp"
#include "../core/level.hpp"
#include "../core/level_filter.hpp"
#include "../core/ring_buffer.hpp"
#include <stdexcept>
#include <string>

namespace logq {

    /// Everything the viewer needs, passed explicitly into Viewer.
    struct ViewerOptions {
        std::string logPath;
        std::string projectRoot;
        bool packageFilter;           ///< Start with the package filter enabled
        std::string appId;            ///< Initial package name
        std::string tagFilter;
        std::string levelFilter;
        std::string textFilter;
        unsigned pollIntervalMs;
        bool followOnly;              ///< Skip loading existing content
        bool dump;                    ///< Print the filtered buffer once and exit
        int producerPid;
        bool noColor;
        bool brief;
        size_t capacity;
        std::string diagnosticLogPath;
        Level diagnosticLevel;

        ViewerOptions()
            : packageFilter(true)
            , pollIntervalMs(100)
            , followOnly(false)
            , dump(false)
            , producerPid(0)
            , noColor(false)
            , brief(false)
            , capacity(RingBuffer::kDefaultCapacity)
            , diagnosticLevel(Level::Info) {}

        /// Filter the viewer starts with.
        FilterState initialFilter() const {
            FilterState f;
            f.setPackageEnabled(packageFilter);
            if (!appId.empty()) f.setPackageName(appId);
            if (!tagFilter.empty()) f.setTag(tagFilter);
            if (!levelFilter.empty()) f.setLevel(LevelFilter::parse(levelFilter));
            if (!textFilter.empty()) f.setText(textFilter);
            return f;
        }
    };

    /// Fluent builder for ViewerOptions.
    ///
    /// Usage:
    /// @code
    ///   ViewerOptions opts = ViewerConfiguration()
    ///       .project("/src/myapp")
    ///       .level("W+")
    ///       .build();
    /// @endcode
    ///
    /// build() validates the filters, resolves the default log file (newest
    /// file under <project>/.logq/logs) when none was given, and reads the
    /// application id from the Gradle build when none was given and the
    /// package filter is on.
    class ViewerConfiguration {
    public:
        ViewerConfiguration() {}

        ViewerConfiguration& logFile(const std::string& path) {
            m_options.logPath = path;
            return *this;
        }

        ViewerConfiguration& project(const std::string& root) {
            m_options.projectRoot = root;
            return *this;
        }

        ViewerConfiguration& packageFilter(bool enabled) {
            m_options.packageFilter = enabled;
            return *this;
        }

        ViewerConfiguration& appId(const std::string& id) {
            m_options.appId = id;
            return *this;
        }

        ViewerConfiguration& tag(const std::string& tag) {
            m_options.tagFilter = tag;
            return *this;
        }

        ViewerConfiguration& level(const std::string& spec) {
            m_options.levelFilter = spec;
            return *this;
        }

        ViewerConfiguration& text(const std::string& text) {
            m_options.textFilter = text;
            return *this;
        }

        ViewerConfiguration& pollInterval(unsigned ms) {
            m_options.pollIntervalMs = ms;
            return *this;
        }

        ViewerConfiguration& followOnly(bool enabled) {
            m_options.followOnly = enabled;
            return *this;
        }

        ViewerConfiguration& dump(bool enabled) {
            m_options.dump = enabled;
            return *this;
        }

        ViewerConfiguration& producerPid(int pid) {
            m_options.producerPid = pid;
            return *this;
        }

        ViewerConfiguration& color(bool enabled) {
            m_options.noColor = !enabled;
            return *this;
        }

        ViewerConfiguration& brief(bool enabled) {
            m_options.brief = enabled;
            return *this;
        }

        ViewerConfiguration& capacity(size_t records) {
            m_options.capacity = records;
            return *this;
        }

        ViewerConfiguration& diagnosticLog(const std::string& path, Level minLevel = Level::Info) {
            m_options.diagnosticLogPath = path;
            m_options.diagnosticLevel = minLevel;
            return *this;
        }

        /// Options as configured so far, without validation or resolution.
        const ViewerOptions& options() const { return m_options; }

        /// @throws std::invalid_argument for bad filter or numeric values.
        /// @throws std::runtime_error if no log file was given and none can be found.
        ViewerOptions build() const {
            ViewerOptions out = m_options;
            if (out.pollIntervalMs == 0) {
                throw std::invalid_argument("Poll interval must be positive");
            }
            if (out.capacity == 0) {
                throw std::invalid_argument("Buffer capacity must be positive");
            }
            if (!out.levelFilter.empty()) {
                LevelFilter::parse(out.levelFilter);
            }
            if (out.logPath.empty()) {
                out.logPath = project::defaultLogFile(out.projectRoot);
            }
            if (out.packageFilter && out.appId.empty()) {
                out.appId = project::readApplicationId(out.projectRoot);
            }
            return out;
        }

    private:
        ViewerOptions m_options;
    };

} // namespace logq

#endif // LOGQ_VIEWER_OPTIONS_HPP
