#ifndef LOGQ_FILE_SINK_HPP
#define LOGQ_FILE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/threadtime_formatter.hpp"
#include "../transport/file_transport.hpp"
#include <string>

namespace logq {
    /// Appends threadtime-formatted lines to a file, so the output can be
    /// opened with the viewer itself.
    class FileSink : public BaseSink {
    public:
        explicit FileSink(const std::string &filename) {
            setFormatter(detail::make_unique<ThreadtimeFormatter>());
            setTransport(detail::make_unique<FileTransport>(filename));
        }
    };
} // namespace logq

#endif // LOGQ_FILE_SINK_HPP
