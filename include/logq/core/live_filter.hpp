#ifndef LOGQ_LIVE_FILTER_HPP
#define LOGQ_LIVE_FILTER_HPP

#include "filter_state.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace logq {

    /// Shared home of the current FilterState.
    ///
    /// One writer (the interactive controller) mutates through update();
    /// readers (tailer, renderer) take a copy with get() and evaluate it
    /// without holding the lock. version() increases on every mutation so a
    /// reader can tell its copy is stale.
    class LiveFilter {
    public:
        explicit LiveFilter(const FilterState& initial = FilterState())
            : m_state(initial)
            , m_version(0) {}

        LiveFilter(const LiveFilter&) = delete;
        LiveFilter& operator=(const LiveFilter&) = delete;

        FilterState get() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_state;
        }

        void set(const FilterState& state) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = state;
            m_version.fetch_add(1, std::memory_order_release);
        }

        /// Apply a mutation in place. If the mutator throws, the state is
        /// left untouched and the exception propagates.
        void update(const std::function<void(FilterState&)>& mutator) {
            std::lock_guard<std::mutex> lock(m_mutex);
            FilterState next = m_state;
            mutator(next);
            m_state = next;
            m_version.fetch_add(1, std::memory_order_release);
        }

        std::uint64_t version() const { return m_version.load(std::memory_order_acquire); }

    private:
        mutable std::mutex m_mutex;
        FilterState m_state;
        std::atomic<std::uint64_t> m_version;
    };

} // namespace logq

#endif // LOGQ_LIVE_FILTER_HPP
