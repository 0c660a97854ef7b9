#ifndef LOGQ_SINK_INTERFACE_HPP
#define LOGQ_SINK_INTERFACE_HPP

#include "../core/log_record.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace logq {
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogRecord &record) = 0;

        virtual void flush() {
            if (m_transport) m_transport->flush();
        }

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

    protected:
        IFormatter *formatter() const { return m_formatter.get(); }
        ITransport *transport() const { return m_transport.get(); }

    private:
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
    };

    /// Format, then hand to the transport. Most sinks need nothing more.
    class BaseSink : public ISink {
    public:
        void write(const LogRecord &record) override {
            IFormatter *fmt = formatter();
            ITransport *tp = transport();
            if (fmt && tp) {
                tp->write(fmt->format(record));
            }
        }
    };
} // namespace logq

#endif // LOGQ_SINK_INTERFACE_HPP
