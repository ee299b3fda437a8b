#include "telexpect/core/logging.h"

#include <cstdarg>
#include <cstdio>

namespace telexpect::log {

#if defined(TX_DEBUG)

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

// Everything goes to stderr: stdout carries command output for the CLI.
static FILE* stream_for(Level)
{
    return stderr;
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    FILE* out = stream_for(level);

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    std::fprintf(stream_for(level), "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(TX_DEBUG)

} // namespace telexpect::log
