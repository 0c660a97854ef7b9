#ifndef LOGQ_STDOUT_TRANSPORT_HPP
#define LOGQ_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <cerrno>
#include <mutex>
#include <string>
#include <unistd.h>

namespace logq {
    /// Unbuffered writes to a terminal file descriptor (stdout by default).
    ///
    /// @note All instances share one mutex so that concurrent writers never
    ///       interleave inside an escape sequence.
    class StdoutTransport : public ITransport {
    public:
        explicit StdoutTransport(int fd = STDOUT_FILENO) : m_fd(fd) {}

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            writeAll(formattedEntry);
            writeAll("\n");
        }

        void writeRaw(const std::string &data) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            writeAll(data);
        }

        int fd() const { return m_fd; }

    private:
        /// Handles EINTR and partial writes. A closed terminal is not an
        /// error worth surfacing to the viewer; the bytes are dropped.
        void writeAll(const std::string &data) {
            size_t total = 0;
            while (total < data.size()) {
                ssize_t n = ::write(m_fd, data.data() + total, data.size() - total);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return;
                }
                if (n == 0) return;
                total += static_cast<size_t>(n);
            }
        }

        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }

        int m_fd;
    };
} // namespace logq

#endif // LOGQ_STDOUT_TRANSPORT_HPP
