#ifndef LOGQ_RING_BUFFER_HPP
#define LOGQ_RING_BUFFER_HPP

#include "log_record.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace logq {

    typedef std::shared_ptr<const LogRecord> RecordPtr;

    /// Consistent view of the buffer at one instant.
    ///
    /// Holds shared references to the immutable records, so it stays valid
    /// and unchanged while the producer keeps appending or evicting. It can
    /// be iterated any number of times.
    class Snapshot {
    public:
        typedef std::vector<RecordPtr>::const_iterator const_iterator;

        Snapshot() {}
        explicit Snapshot(std::vector<RecordPtr> records) : m_records(std::move(records)) {}

        const_iterator begin() const { return m_records.begin(); }
        const_iterator end() const { return m_records.end(); }
        size_t size() const { return m_records.size(); }
        bool empty() const { return m_records.empty(); }
        const LogRecord& operator[](size_t i) const { return *m_records[i]; }

    private:
        std::vector<RecordPtr> m_records;
    };

    /// Fixed-capacity FIFO store of the newest records.
    ///
    /// append() assigns the sequence number, so numbers are strictly
    /// increasing in storage order. When full, the oldest record is
    /// overwritten; appenders never wait for readers beyond the short
    /// critical section that copies pointers.
    class RingBuffer {
    public:
        enum { kDefaultCapacity = 10000 };

        explicit RingBuffer(size_t capacity = kDefaultCapacity)
            : m_capacity(capacity > 0 ? capacity : 1)
            , m_head(0)
            , m_size(0)
            , m_nextSequence(1)
            , m_evicted(0) {
            m_slots.resize(m_capacity);
        }

        RingBuffer(const RingBuffer&) = delete;
        RingBuffer& operator=(const RingBuffer&) = delete;

        /// Stores the record and returns its sequence number.
        std::uint64_t append(LogRecord record) {
            std::lock_guard<std::mutex> lock(m_mutex);
            record.sequence = m_nextSequence++;
            std::uint64_t seq = record.sequence;
            RecordPtr ptr = std::make_shared<const LogRecord>(std::move(record));

            size_t tail = (m_head + m_size) % m_capacity;
            m_slots[tail] = std::move(ptr);
            if (m_size < m_capacity) {
                ++m_size;
            } else {
                m_head = (m_head + 1) % m_capacity;
                ++m_evicted;
            }
            return seq;
        }

        /// All held records, oldest first.
        Snapshot snapshot() const {
            return snapshotAfter(0);
        }

        /// Held records whose sequence is greater than `sequence`, oldest first.
        Snapshot snapshotAfter(std::uint64_t sequence) const {
            std::vector<RecordPtr> out;
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_size == 0) return Snapshot();
            std::uint64_t first = m_nextSequence - m_size;
            size_t skip = 0;
            if (sequence >= first) {
                std::uint64_t diff = sequence - first + 1;
                skip = diff >= m_size ? m_size : static_cast<size_t>(diff);
            }
            out.reserve(m_size - skip);
            for (size_t i = skip; i < m_size; ++i) {
                out.push_back(m_slots[(m_head + i) % m_capacity]);
            }
            return Snapshot(std::move(out));
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_size;
        }

        size_t capacity() const { return m_capacity; }

        /// Sequence number of the newest record, 0 when nothing was appended.
        std::uint64_t lastSequence() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_nextSequence - 1;
        }

        /// Total number of records dropped by capacity eviction.
        std::uint64_t evictedCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_evicted;
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<RecordPtr> m_slots;
        size_t m_capacity;
        size_t m_head;
        size_t m_size;
        std::uint64_t m_nextSequence;
        std::uint64_t m_evicted;
    };

} // namespace logq

#endif // LOGQ_RING_BUFFER_HPP
