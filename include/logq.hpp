#ifndef LOGQ_HPP
#define LOGQ_HPP

#include "logq/core/level.hpp"
#include "logq/core/log_record.hpp"
#include "logq/core/line_parser.hpp"
#include "logq/core/ring_buffer.hpp"
#include "logq/core/level_filter.hpp"
#include "logq/core/process_tracker.hpp"
#include "logq/core/filter_state.hpp"
#include "logq/core/live_filter.hpp"
#include "logq/core/view_state.hpp"
#include "logq/formatter/threadtime_formatter.hpp"
#include "logq/transport/stdout_transport.hpp"
#include "logq/transport/file_transport.hpp"
#include "logq/sink/file_sink.hpp"
#include "logq/diag/diagnostic_log.hpp"
#include "logq/diag/macros.hpp"
#include "logq/tail/tailer.hpp"
#include "logq/ui/renderer.hpp"
#include "logq/ui/terminal.hpp"
#include "logq/ui/interactive_controller.hpp"
#include "logq/config/project.hpp"
#include "logq/config/viewer_options.hpp"
#include "logq/config/command_line.hpp"
#include "logq/viewer.hpp"

#endif // LOGQ_HPP
