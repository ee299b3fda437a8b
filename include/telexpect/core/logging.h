#pragma once

#include <cstdarg>
#include <string_view>

namespace telexpect::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

#if defined(TX_DEBUG)

// Real functions exist only in debug builds.
void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // TX_DEBUG

} // namespace telexpect::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(TX_DEBUG)

#define TX_LOGE(tag, fmt, ...) \
    ::telexpect::log::logf(::telexpect::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define TX_LOGW(tag, fmt, ...) \
    ::telexpect::log::logf(::telexpect::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define TX_LOGI(tag, fmt, ...) \
    ::telexpect::log::logf(::telexpect::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define TX_LOGD(tag, fmt, ...) \
    ::telexpect::log::logf(::telexpect::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define TX_LOGV(tag, fmt, ...) \
    ::telexpect::log::logf(::telexpect::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time.

#define TX_LOGE(tag, fmt, ...) ((void)0)
#define TX_LOGW(tag, fmt, ...) ((void)0)
#define TX_LOGI(tag, fmt, ...) ((void)0)
#define TX_LOGD(tag, fmt, ...) ((void)0)
#define TX_LOGV(tag, fmt, ...) ((void)0)

#endif // TX_DEBUG
