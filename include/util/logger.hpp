#pragma once

#include <cstdarg>
#include <cstdio>

namespace selfupdate {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Defaults to stderr. The stream is not owned.
    void SetStream(std::FILE* stream);

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

#define LogDebug(...) ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::selfupdate::Logger::Instance().LogWithSource(::selfupdate::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace selfupdate
