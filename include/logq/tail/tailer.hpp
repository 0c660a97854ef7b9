#ifndef LOGQ_TAILER_HPP
#define LOGQ_TAILER_HPP

#include "../core/line_parser.hpp"
#include "../core/live_filter.hpp"
#include "../core/process_tracker.hpp"
#include "../core/ring_buffer.hpp"
#include "../core/view_state.hpp"
#include "../diag/diagnostic_log.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace logq {

    enum class TailState {
        Opening,
        Following,
        Rotated,
        Error
    };

    inline const char *getTailStateString(TailState state) {
        switch (state) {
            case TailState::Opening: return "opening";
            case TailState::Following: return "following";
            case TailState::Rotated: return "rotated";
            case TailState::Error: return "stopped";
            default: return "unknown";
        }
    }

    struct TailStatus {
        TailState state;
        std::string message;
        std::uint64_t rotations;

        TailStatus() : state(TailState::Opening), rotations(0) {}
    };

    struct TailOptions {
        std::string path;
        bool seedExisting;                       ///< Load the tail of the existing file at start
        size_t seedByteLimit;                    ///< How far back from the end seeding reads
        std::chrono::milliseconds pollInterval;  ///< Growth polling period
        int producerPid;                         ///< Upstream writer to watch (0 = none)
        size_t readChunkSize;
        size_t maxBytesPerPoll;                  ///< Bounds one poll so stop() stays responsive

        TailOptions()
            : seedExisting(true)
            , seedByteLimit(16 * 1024 * 1024)
            , pollInterval(100)
            , producerPid(0)
            , readChunkSize(64 * 1024)
            , maxBytesPerPoll(8 * 1024 * 1024) {}
    };

    /// Follows a growing log file and feeds complete lines through the
    /// parser into the ring buffer.
    ///
    /// States:
    ///   Opening   -> open(), optional seeding from the existing content
    ///   Following -> poll for growth, read whole lines only
    ///   Rotated   -> file replaced (inode change), truncated (size below
    ///                our offset) or rewritten (leading bytes differ);
    ///                reopen once from the start, then Following again.
    ///                A removed file stays Rotated until the path exists
    ///                again, then gets the same single reopen
    ///   Error     -> upstream producer gone or file unrecoverable; terminal
    ///
    /// The buffer is filled regardless of the filter. The notifier fires when
    /// a batch holds at least one record passing the current filter while the
    /// view is not paused, and on every state change.
    ///
    /// pollOnce() is not reentrant: call it either directly (tests, dump
    /// mode) or through start(), never both.
    class Tailer {
    public:
        typedef std::function<void()> Notifier;

        Tailer(const TailOptions& options, RingBuffer& buffer, const LiveFilter& filter,
               const ViewState& view, DiagnosticLog* diag = nullptr)
            : m_options(options)
            , m_buffer(buffer)
            , m_filter(filter)
            , m_view(view)
            , m_diag(diag)
            , m_fd(-1)
            , m_dev(0)
            , m_ino(0)
            , m_offset(0)
            , m_dropFirstLine(false)
            , m_linesRead(0)
            , m_running(false) {
            if (m_options.readChunkSize == 0) m_options.readChunkSize = 4096;
        }

        ~Tailer() {
            stop();
        }

        Tailer(const Tailer&) = delete;
        Tailer& operator=(const Tailer&) = delete;

        void setNotifier(Notifier notifier) {
            std::lock_guard<std::mutex> lock(m_notifierMutex);
            m_notifier = std::move(notifier);
        }

        /// Open the target and, unless disabled, seed the buffer with the
        /// newest part of the existing content.
        /// @throws std::runtime_error if the file cannot be opened or read.
        void open() {
            setState(TailState::Opening, "");
            if (!openPath()) {
                int err = errno;
                std::string reason = "cannot open " + m_options.path + ": " + std::strerror(err);
                setState(TailState::Error, reason);
                throw std::runtime_error(reason);
            }

            struct stat st;
            std::uint64_t size = 0;
            if (::fstat(m_fd, &st) == 0) size = static_cast<std::uint64_t>(st.st_size);

            if (m_options.seedExisting) {
                std::uint64_t start = 0;
                if (size > m_options.seedByteLimit) {
                    start = size - m_options.seedByteLimit;
                    m_dropFirstLine = !startsLine(start);
                }
                seekTo(start);
                bool visible = false;
                readAvailable(visible, size - start + m_options.readChunkSize);
                if (state() == TailState::Error) {
                    throw std::runtime_error("cannot read " + m_options.path + ": " + status().message);
                }
                diag().info("seeded " + std::to_string(m_buffer.size()) +
                            " records from " + m_options.path);
            } else {
                seekTo(size);
            }
            refreshFingerprint();
            setState(TailState::Following, "");
        }

        /// Run pollOnce() on a background thread every pollInterval.
        /// Opens the file first if open() was not called.
        void start() {
            if (m_running.load(std::memory_order_acquire)) return;
            if (m_fd < 0 && state() != TailState::Error) open();
            m_running.store(true, std::memory_order_release);
            m_thread = std::thread(&Tailer::run, this);
        }

        /// Stop polling and close the file handle. Safe to call repeatedly.
        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_waitMutex);
                m_running.store(false, std::memory_order_release);
            }
            m_wake.notify_all();
            if (m_thread.joinable()) {
                m_thread.join();
            }
            closeFile();
        }

        bool running() const { return m_running.load(std::memory_order_acquire); }

        /// One polling step. Returns true if any record was appended.
        bool pollOnce() {
            if (m_fd < 0) return false;
            TailState current = state();
            if (current == TailState::Error || current == TailState::Opening) return false;

            std::uint64_t before = m_buffer.lastSequence();
            bool visible = false;

            struct stat pathSt;
            bool pathOk = ::stat(m_options.path.c_str(), &pathSt) == 0;
            if (!pathOk) {
                // The old descriptor still reads whatever was written before
                // the unlink; keep it until the path comes back.
                readAvailable(visible, m_options.maxBytesPerPoll);
                if (state() == TailState::Following) {
                    setState(TailState::Rotated, "file removed, waiting for it to reappear");
                    diag().info(m_options.path + ": file removed, waiting");
                }
            } else if (pathSt.st_dev != m_dev || pathSt.st_ino != m_ino) {
                bool wasRemoved = current == TailState::Rotated;
                readAvailable(visible, m_options.maxBytesPerPoll);
                if (state() != TailState::Error) {
                    reopenAfterRotation(wasRemoved ? "file recreated" : "file replaced");
                }
            } else {
                if (current == TailState::Rotated) setState(TailState::Following, "");
                struct stat fdSt;
                if (::fstat(m_fd, &fdSt) != 0) {
                    fail(std::string("stat failed: ") + std::strerror(errno));
                    return m_buffer.lastSequence() != before;
                }
                std::uint64_t size = static_cast<std::uint64_t>(fdSt.st_size);
                if (size < m_offset) {
                    restartFromBeginning("file truncated");
                } else if (fingerprintChanged(size)) {
                    restartFromBeginning("file rewritten");
                }
            }

            if (m_fd >= 0 && state() != TailState::Error) {
                readAvailable(visible, m_options.maxBytesPerPoll);
                refreshFingerprint();
            }

            if (m_fd >= 0 && state() != TailState::Error && producerGone()) {
                readAvailable(visible, m_options.maxBytesPerPoll);
                fail("log producer (pid " + std::to_string(m_options.producerPid) + ") exited");
            }

            if (visible && !m_view.paused()) notify();
            return m_buffer.lastSequence() != before;
        }

        TailStatus status() const {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            return m_status;
        }

        TailState state() const {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            return m_status.state;
        }

        std::uint64_t linesRead() const { return m_linesRead.load(std::memory_order_relaxed); }

        const std::string& path() const { return m_options.path; }

        bool isOpen() const { return m_fd >= 0; }

    private:
        enum { kFingerprintBytes = 64 };

        DiagnosticLog& diag() {
            static DiagnosticLog s_silent;
            return m_diag ? *m_diag : s_silent;
        }

        void run() {
            while (m_running.load(std::memory_order_acquire)) {
                try {
                    pollOnce();
                } catch (const std::exception& e) {
                    fail(std::string("tailer fault: ") + e.what());
                }
                if (state() == TailState::Error) {
                    diag().info("tailer idle: " + status().message);
                }
                std::unique_lock<std::mutex> lock(m_waitMutex);
                m_wake.wait_for(lock, m_options.pollInterval, [this] {
                    return !m_running.load(std::memory_order_acquire);
                });
                if (state() == TailState::Error) {
                    // Frozen: nothing more will arrive; wait for stop().
                    m_wake.wait(lock, [this] {
                        return !m_running.load(std::memory_order_acquire);
                    });
                }
            }
        }

        bool openPath() {
            int fd = ::open(m_options.path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) return false;
            struct stat st;
            if (::fstat(fd, &st) != 0) {
                int err = errno;
                ::close(fd);
                errno = err;
                return false;
            }
            closeFile();
            m_fd = fd;
            m_dev = st.st_dev;
            m_ino = st.st_ino;
            m_offset = 0;
            m_fingerprint.clear();
            m_splitter.reset();
            m_dropFirstLine = false;
            return true;
        }

        void closeFile() {
            if (m_fd >= 0) {
                ::close(m_fd);
                m_fd = -1;
            }
        }

        void seekTo(std::uint64_t offset) {
            if (::lseek(m_fd, static_cast<off_t>(offset), SEEK_SET) >= 0) {
                m_offset = offset;
            }
        }

        /// Reads until EOF or `budget` bytes; complete lines go to the buffer.
        void readAvailable(bool& visible, std::uint64_t budget) {
            if (m_fd < 0) return;
            std::vector<char> chunk(m_options.readChunkSize);
            std::vector<std::string> lines;
            FilterState filter = m_filter.get();
            std::uint64_t consumed = 0;

            while (consumed < budget) {
                ssize_t n = ::read(m_fd, chunk.data(), chunk.size());
                if (n < 0) {
                    if (errno == EINTR) continue;
                    fail(std::string("read failed: ") + std::strerror(errno));
                    return;
                }
                if (n == 0) break;
                m_offset += static_cast<std::uint64_t>(n);
                consumed += static_cast<std::uint64_t>(n);

                lines.clear();
                m_splitter.feed(chunk.data(), static_cast<size_t>(n), lines);
                for (size_t i = 0; i < lines.size(); ++i) {
                    if (m_dropFirstLine) {
                        m_dropFirstLine = false;
                        continue;
                    }
                    if (lines[i].empty() || lines[i] == "\r") continue;
                    LogRecord record = LineParser::parse(lines[i]);
                    m_processes.annotate(record);
                    if (filter.matches(record)) visible = true;
                    m_buffer.append(std::move(record));
                    m_linesRead.fetch_add(1, std::memory_order_relaxed);
                }
            }
        }

        void restartFromBeginning(const std::string& why) {
            setState(TailState::Rotated, why);
            diag().info(m_options.path + ": " + why + ", reading from start");
            m_splitter.reset();
            m_dropFirstLine = false;
            m_fingerprint.clear();
            seekTo(0);
            bumpRotations();
            setState(TailState::Following, why);
        }

        /// One reconnection attempt; failure is terminal.
        void reopenAfterRotation(const std::string& why) {
            setState(TailState::Rotated, why);
            diag().info(m_options.path + ": " + why + ", reopening");
            bumpRotations();
            if (!openPath()) {
                closeFile();
                fail(why + "; reopen failed: " + std::strerror(errno));
                return;
            }
            setState(TailState::Following, why);
        }

        std::string readPrefix(size_t len) const {
            std::string out(len, '\0');
            size_t got = 0;
            while (got < len) {
                ssize_t n = ::pread(m_fd, &out[got], len - got, static_cast<off_t>(got));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) break;
                got += static_cast<size_t>(n);
            }
            out.resize(got);
            return out;
        }

        bool startsLine(std::uint64_t offset) const {
            char prev = 0;
            ssize_t n;
            do {
                n = ::pread(m_fd, &prev, 1, static_cast<off_t>(offset - 1));
            } while (n < 0 && errno == EINTR);
            return n == 1 && prev == '\n';
        }

        void refreshFingerprint() {
            if (m_fd < 0 || m_fingerprint.size() >= kFingerprintBytes) return;
            std::uint64_t want = m_offset;
            if (want > kFingerprintBytes) want = kFingerprintBytes;
            if (want > m_fingerprint.size()) {
                m_fingerprint = readPrefix(static_cast<size_t>(want));
            }
        }

        bool fingerprintChanged(std::uint64_t size) const {
            if (m_fingerprint.empty() || size < m_fingerprint.size()) return false;
            return readPrefix(m_fingerprint.size()) != m_fingerprint;
        }

        bool producerGone() const {
            if (m_options.producerPid <= 0) return false;
            return ::kill(static_cast<pid_t>(m_options.producerPid), 0) != 0 && errno == ESRCH;
        }

        void fail(const std::string& reason) {
            diag().warn(m_options.path + ": " + reason);
            closeFile();
            setState(TailState::Error, reason);
        }

        void bumpRotations() {
            std::lock_guard<std::mutex> lock(m_statusMutex);
            ++m_status.rotations;
        }

        void setState(TailState state, const std::string& message) {
            bool changed;
            {
                std::lock_guard<std::mutex> lock(m_statusMutex);
                changed = m_status.state != state || m_status.message != message;
                m_status.state = state;
                m_status.message = message;
            }
            if (changed) notify();
        }

        void notify() {
            Notifier notifier;
            {
                std::lock_guard<std::mutex> lock(m_notifierMutex);
                notifier = m_notifier;
            }
            if (notifier) notifier();
        }

        TailOptions m_options;
        RingBuffer& m_buffer;
        const LiveFilter& m_filter;
        const ViewState& m_view;
        DiagnosticLog* m_diag;

        int m_fd;
        dev_t m_dev;
        ino_t m_ino;
        std::uint64_t m_offset;
        std::string m_fingerprint;
        LineSplitter m_splitter;
        ProcessTracker m_processes;
        bool m_dropFirstLine;
        std::atomic<std::uint64_t> m_linesRead;

        mutable std::mutex m_statusMutex;
        TailStatus m_status;

        std::mutex m_notifierMutex;
        Notifier m_notifier;

        std::thread m_thread;
        std::atomic<bool> m_running;
        std::mutex m_waitMutex;
        std::condition_variable m_wake;
    };

} // namespace logq

#endif // LOGQ_TAILER_HPP
