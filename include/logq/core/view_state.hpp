#ifndef LOGQ_VIEW_STATE_HPP
#define LOGQ_VIEW_STATE_HPP

#include <atomic>

namespace logq {

    /// Presentation flags. While paused the tailer keeps filling the buffer
    /// but the visible window stays frozen.
    class ViewState {
    public:
        ViewState() : m_paused(false), m_helpVisible(false) {}

        ViewState(const ViewState&) = delete;
        ViewState& operator=(const ViewState&) = delete;

        bool paused() const { return m_paused.load(std::memory_order_acquire); }
        void setPaused(bool paused) { m_paused.store(paused, std::memory_order_release); }
        bool togglePaused() { return toggle(m_paused); }

        bool helpVisible() const { return m_helpVisible.load(std::memory_order_acquire); }
        void setHelpVisible(bool visible) { m_helpVisible.store(visible, std::memory_order_release); }
        bool toggleHelp() { return toggle(m_helpVisible); }

    private:
        /// Returns the new value.
        static bool toggle(std::atomic<bool>& flag) {
            bool current = flag.load(std::memory_order_acquire);
            while (!flag.compare_exchange_weak(current, !current, std::memory_order_acq_rel)) {}
            return !current;
        }

        std::atomic<bool> m_paused;
        std::atomic<bool> m_helpVisible;
    };

} // namespace logq

#endif // LOGQ_VIEW_STATE_HPP
