#ifndef LOGQ_FORMATTER_INTERFACE_HPP
#define LOGQ_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace logq {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace logq

#endif // LOGQ_FORMATTER_INTERFACE_HPP
