#ifndef LOGQ_TRANSPORT_INTERFACE_HPP
#define LOGQ_TRANSPORT_INTERFACE_HPP

#include <string>

namespace logq {
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /// Write one formatted entry followed by a newline.
        virtual void write(const std::string &formattedEntry) = 0;

        /// Write bytes as-is (control sequences, partial lines).
        virtual void writeRaw(const std::string &data) = 0;

        virtual void flush() {}
    };
} // namespace logq

#endif // LOGQ_TRANSPORT_INTERFACE_HPP
