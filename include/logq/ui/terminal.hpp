#ifndef LOGQ_TERMINAL_HPP
#define LOGQ_TERMINAL_HPP

#include "input_source.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace logq {

    struct TerminalSize {
        size_t rows;
        size_t columns;

        TerminalSize() : rows(24), columns(80) {}
    };

    /// Size of the terminal behind `fd`, falling back to $LINES/$COLUMNS
    /// and then 24x80.
    inline TerminalSize queryTerminalSize(int fd) {
        TerminalSize size;
        struct winsize ws;
        if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
            size.rows = ws.ws_row;
            size.columns = ws.ws_col;
            return size;
        }
        const char* lines = std::getenv("LINES");
        if (lines) {
            int r = std::atoi(lines);
            if (r > 0) size.rows = static_cast<size_t>(r);
        }
        const char* cols = std::getenv("COLUMNS");
        if (cols) {
            int c = std::atoi(cols);
            if (c > 0) size.columns = static_cast<size_t>(c);
        }
        return size;
    }

    /// Self-pipe used to interrupt a blocking poll() from another thread or
    /// from a signal handler. notify() is async-signal-safe.
    class WakePipe {
    public:
        WakePipe() {
            int fds[2];
            if (::pipe(fds) != 0) {
                throw std::runtime_error("Failed to create wake pipe");
            }
            for (int i = 0; i < 2; ++i) {
                ::fcntl(fds[i], F_SETFL, ::fcntl(fds[i], F_GETFL, 0) | O_NONBLOCK);
                ::fcntl(fds[i], F_SETFD, FD_CLOEXEC);
            }
            m_readFd = fds[0];
            m_writeFd = fds[1];
        }

        ~WakePipe() {
            ::close(m_readFd);
            ::close(m_writeFd);
        }

        WakePipe(const WakePipe&) = delete;
        WakePipe& operator=(const WakePipe&) = delete;

        /// A full pipe already guarantees a pending wakeup, so EAGAIN is fine.
        void notify() const {
            char b = 1;
            ssize_t n;
            do {
                n = ::write(m_writeFd, &b, 1);
            } while (n < 0 && errno == EINTR);
        }

        void drain() const {
            char buf[256];
            for (;;) {
                ssize_t n = ::read(m_readFd, buf, sizeof(buf));
                if (n > 0) continue;
                if (n < 0 && errno == EINTR) continue;
                break;
            }
        }

        int readFd() const { return m_readFd; }

        int writeFd() const { return m_writeFd; }

    private:
        int m_readFd;
        int m_writeFd;
    };

namespace detail {
    inline std::atomic<int>& signalWakeFd() {
        static std::atomic<int> s_fd(-1);
        return s_fd;
    }

    inline volatile std::sig_atomic_t& interruptFlag() {
        static volatile std::sig_atomic_t s_flag = 0;
        return s_flag;
    }

    inline volatile std::sig_atomic_t& resizeFlag() {
        static volatile std::sig_atomic_t s_flag = 0;
        return s_flag;
    }

    inline void onSignal(int sig) {
        int savedErrno = errno;
        if (sig == SIGWINCH) {
            resizeFlag() = 1;
        } else {
            interruptFlag() = 1;
        }
        int fd = signalWakeFd().load();
        if (fd >= 0) {
            char b = 1;
            ssize_t n = ::write(fd, &b, 1);
            (void)n;
        }
        errno = savedErrno;
    }
} // namespace detail

    /// Routes SIGINT, SIGTERM and SIGWINCH into a WakePipe for the lifetime
    /// of the guard; previous handlers are restored on destruction.
    class SignalGuard {
    public:
        explicit SignalGuard(const WakePipe& pipe) {
            detail::interruptFlag() = 0;
            detail::resizeFlag() = 0;
            detail::signalWakeFd().store(pipe.writeFd());

            struct sigaction sa;
            sa.sa_handler = &detail::onSignal;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            ::sigaction(SIGINT, &sa, &m_oldInt);
            ::sigaction(SIGTERM, &sa, &m_oldTerm);
            ::sigaction(SIGWINCH, &sa, &m_oldWinch);
        }

        ~SignalGuard() {
            ::sigaction(SIGINT, &m_oldInt, nullptr);
            ::sigaction(SIGTERM, &m_oldTerm, nullptr);
            ::sigaction(SIGWINCH, &m_oldWinch, nullptr);
            detail::signalWakeFd().store(-1);
            detail::interruptFlag() = 0;
            detail::resizeFlag() = 0;
        }

        SignalGuard(const SignalGuard&) = delete;
        SignalGuard& operator=(const SignalGuard&) = delete;

    private:
        struct sigaction m_oldInt;
        struct sigaction m_oldTerm;
        struct sigaction m_oldWinch;
    };

    /// Puts the terminal in non-canonical, no-echo mode and switches to the
    /// alternate screen; everything is restored on destruction. Inactive
    /// when `fd` is not a TTY.
    class RawTerminal {
    public:
        RawTerminal(int inputFd, int outputFd)
            : m_inputFd(inputFd)
            , m_outputFd(outputFd)
            , m_active(false) {
            if (::isatty(m_inputFd) != 1) return;
            if (::tcgetattr(m_inputFd, &m_saved) != 0) return;
            struct termios raw = m_saved;
            raw.c_lflag &= ~(ICANON | ECHO);
            raw.c_cc[VMIN] = 1;
            raw.c_cc[VTIME] = 0;
            if (::tcsetattr(m_inputFd, TCSANOW, &raw) != 0) return;
            m_active = true;
            emit("\033[?1049h\033[?25l\033[H\033[2J");
        }

        ~RawTerminal() {
            if (!m_active) return;
            emit("\033[0m\033[?25h\033[?1049l");
            ::tcsetattr(m_inputFd, TCSANOW, &m_saved);
        }

        RawTerminal(const RawTerminal&) = delete;
        RawTerminal& operator=(const RawTerminal&) = delete;

        bool active() const { return m_active; }

    private:
        void emit(const std::string& s) const {
            ssize_t n = ::write(m_outputFd, s.data(), s.size());
            (void)n;
        }

        int m_inputFd;
        int m_outputFd;
        bool m_active;
        struct termios m_saved;
    };

    /// Keyboard plus wake pipe, multiplexed with poll(2). Keys are checked
    /// first so a flood of log lines cannot starve the user.
    class TerminalInput : public IInputSource {
    public:
        TerminalInput(int inputFd, const WakePipe& wake, int sizeFd)
            : m_inputFd(inputFd)
            , m_wake(wake)
            , m_sizeFd(sizeFd) {}

        InputEvent next() override {
            for (;;) {
                if (detail::interruptFlag()) return InputEvent::make(InputEvent::Type::Interrupt);
                if (detail::resizeFlag()) {
                    detail::resizeFlag() = 0;
                    TerminalSize size = queryTerminalSize(m_sizeFd);
                    return InputEvent::makeResize(size.rows, size.columns);
                }

                struct pollfd fds[2];
                fds[0].fd = m_inputFd;
                fds[0].events = POLLIN;
                fds[0].revents = 0;
                fds[1].fd = m_wake.readFd();
                fds[1].events = POLLIN;
                fds[1].revents = 0;

                int rc = ::poll(fds, 2, -1);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    return InputEvent::make(InputEvent::Type::EndOfInput);
                }

                if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                    unsigned char c = 0;
                    ssize_t n = ::read(m_inputFd, &c, 1);
                    if (n == 1) return InputEvent::makeKey(c);
                    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
                    return InputEvent::make(InputEvent::Type::EndOfInput);
                }

                if (fds[1].revents & POLLIN) {
                    m_wake.drain();
                    if (detail::interruptFlag() || detail::resizeFlag()) continue;
                    return InputEvent::make(InputEvent::Type::Wake);
                }
            }
        }

    private:
        int m_inputFd;
        const WakePipe& m_wake;
        int m_sizeFd;
    };

} // namespace logq

#endif // LOGQ_TERMINAL_HPP
