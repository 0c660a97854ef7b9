#ifndef LOGQ_MACROS_HPP
#define LOGQ_MACROS_HPP

#ifndef LOGQ_NO_MACROS

// Level check first so the message expression is not built when disabled.
#define LOGQ_LOG(diag, level, message) \
    do { \
        auto& logq_diag_ref_ = (diag); \
        auto  logq_diag_lvl_ = (level); \
        if (logq_diag_ref_.enabled(logq_diag_lvl_)) { \
            logq_diag_ref_.log(logq_diag_lvl_, (message)); \
        } \
    } while (0)

#define LOGQ_DEBUG(diag, message) LOGQ_LOG((diag), ::logq::Level::Debug, (message))
#define LOGQ_INFO(diag, message)  LOGQ_LOG((diag), ::logq::Level::Info,  (message))
#define LOGQ_WARN(diag, message)  LOGQ_LOG((diag), ::logq::Level::Warn,  (message))
#define LOGQ_ERROR(diag, message) LOGQ_LOG((diag), ::logq::Level::Error, (message))

#endif // LOGQ_NO_MACROS

#endif // LOGQ_MACROS_HPP
