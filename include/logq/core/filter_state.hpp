#ifndef LOGQ_FILTER_STATE_HPP
#define LOGQ_FILTER_STATE_HPP

#include "level_filter.hpp"
#include "log_common.hpp"
#include "log_record.hpp"
#include <string>

namespace logq {

    /// A user-supplied match value. Wrapping the value in double quotes
    /// ("MyTag") asks for exact equality; otherwise it is a case-sensitive
    /// substring.
    struct MatchValue {
        std::string text;
        bool exact;

        MatchValue() : exact(false) {}
        MatchValue(const std::string& t, bool e) : text(t), exact(e) {}

        static MatchValue parse(const std::string& input) {
            if (input.size() >= 2 && input[0] == '"' && input[input.size() - 1] == '"') {
                return MatchValue(input.substr(1, input.size() - 2), true);
            }
            return MatchValue(input, false);
        }

        bool matches(const std::string& subject) const {
            if (exact) return subject == text;
            return subject.find(text) != std::string::npos;
        }

        std::string toString() const {
            return exact ? "\"" + text + "\"" : text;
        }

        bool operator==(const MatchValue& other) const {
            return exact == other.exact && text == other.text;
        }
    };

    /// The active predicate. A record passes when every set filter matches;
    /// unset filters impose nothing. Evaluation runs cheapest first
    /// (level, tag, package, text) and stops at the first failure.
    class FilterState {
    public:
        FilterState()
            : m_packageEnabled(false)
            , m_hasPackageName(false)
            , m_hasTag(false)
            , m_hasLevel(false)
            , m_hasText(false) {}

        bool matches(const LogRecord& record) const {
            if (m_hasLevel && !m_level.matches(record.level)) return false;
            if (m_hasTag && !m_tag.matches(record.tag)) return false;
            if (packageActive() && !matchesPackage(record)) return false;
            if (m_hasText && !m_text.matches(record.message)) return false;
            return true;
        }

        // --- package ---

        /// A record belongs to the package when its pid was started as that
        /// package (or one of its ":suffix" processes), or failing that when
        /// the package id appears anywhere in the raw line.
        bool matchesPackage(const LogRecord& record) const {
            const std::string& name = m_package.text;
            if (!record.process.empty()) {
                if (m_package.exact) {
                    if (record.process == name) return true;
                    if (record.process.size() > name.size() &&
                        record.process.compare(0, name.size(), name) == 0 &&
                        record.process[name.size()] == ':') {
                        return true;
                    }
                } else if (record.process.find(name) != std::string::npos) {
                    return true;
                }
            }
            return record.raw.find(name) != std::string::npos;
        }

        /// True only when enabled *and* a name is configured; enabling
        /// without a name constrains nothing.
        bool packageActive() const { return m_packageEnabled && m_hasPackageName; }

        bool packageEnabled() const { return m_packageEnabled; }

        void setPackageEnabled(bool enabled) { m_packageEnabled = enabled; }

        void togglePackage() { m_packageEnabled = !m_packageEnabled; }

        bool hasPackageName() const { return m_hasPackageName; }

        const MatchValue& packageName() const { return m_package; }

        void setPackageName(const std::string& name) {
            m_package = MatchValue::parse(name);
            m_hasPackageName = !m_package.text.empty();
        }

        void clearPackageName() {
            m_package = MatchValue();
            m_hasPackageName = false;
        }

        // --- tag ---

        bool hasTag() const { return m_hasTag; }

        const MatchValue& tag() const { return m_tag; }

        void setTag(const std::string& tag) {
            m_tag = MatchValue::parse(tag);
            m_hasTag = true;
        }

        void clearTag() {
            m_tag = MatchValue();
            m_hasTag = false;
        }

        // --- level ---

        bool hasLevel() const { return m_hasLevel; }

        const LevelFilter& level() const { return m_level; }

        void setLevel(const LevelFilter& level) {
            m_level = level;
            m_hasLevel = true;
        }

        void clearLevel() {
            m_level = LevelFilter();
            m_hasLevel = false;
        }

        // --- text ---

        bool hasText() const { return m_hasText; }

        const MatchValue& text() const { return m_text; }

        void setText(const std::string& text) {
            m_text = MatchValue::parse(text);
            m_hasText = true;
        }

        void clearText() {
            m_text = MatchValue();
            m_hasText = false;
        }

        /// Clears tag, level and text; the package filter is left alone.
        void clearAllButPackage() {
            clearTag();
            clearLevel();
            clearText();
        }

        /// Clears everything and disables the package filter. The package
        /// name is kept so the filter can be toggled back on.
        void clearAll() {
            clearAllButPackage();
            m_packageEnabled = false;
        }

        /// Short human-readable summary for the status line.
        std::string describe() const {
            std::string out;
            if (m_hasLevel) append(out, "level=" + m_level.toString());
            if (m_hasTag) append(out, "tag=" + m_tag.toString());
            if (packageActive()) append(out, "pkg=" + m_package.toString());
            if (m_hasText) append(out, "text=" + m_text.toString());
            return out.empty() ? std::string("no filters") : out;
        }

    private:
        static void append(std::string& out, const std::string& part) {
            if (!out.empty()) out += ' ';
            out += part;
        }

        bool m_packageEnabled;
        bool m_hasPackageName;
        MatchValue m_package;
        bool m_hasTag;
        MatchValue m_tag;
        bool m_hasLevel;
        LevelFilter m_level;
        bool m_hasText;
        MatchValue m_text;
    };

} // namespace logq

#endif // LOGQ_FILTER_STATE_HPP
