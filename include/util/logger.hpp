#pragma once

#include <cstdarg>
#include <string>
#include <string_view>

namespace arcnav {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
bool ParseLogLevel(std::string_view text, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Applies ARCNAV_LOG_LEVEL when set to a recognised level.
    void ApplyEnvironment();

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::arcnav::Logger::Instance().LogWithSource(::arcnav::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::arcnav::Logger::Instance().LogWithSource(::arcnav::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::arcnav::Logger::Instance().LogWithSource(::arcnav::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::arcnav::Logger::Instance().LogWithSource(::arcnav::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace arcnav
