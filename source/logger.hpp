#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <cstdio>
#include <mutex>
#include <print>
#include <string>
#include <string_view>

enum class LogLevel { INFO, WARNING, ERROR };

class Logger {
public:
    // Verbose messages are dropped unless verboseMode is set.
    static void log(LogLevel level, const std::string& message, bool verbose = false);

    // Defaults to stderr.
    static void setSink(std::FILE* stream);

    static bool verboseMode;

private:
    static std::mutex logMutex;
    static std::FILE* sink;

    static std::string_view levelTag(LogLevel level);
};

#endif
