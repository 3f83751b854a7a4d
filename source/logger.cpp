#include "logger.hpp"
#include <chrono>
#include <format>

bool Logger::verboseMode = false;
std::mutex Logger::logMutex;
std::FILE* Logger::sink = stderr;

std::string_view Logger::levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::INFO:
        return "\033[32m[INFO]\033[0m ";
    case LogLevel::WARNING:
        return "\033[33m[WARNING]\033[0m ";
    case LogLevel::ERROR:
        return "\033[31m[ERROR]\033[0m ";
    }
    return "";
}

void Logger::log(LogLevel level, const std::string& message, bool verbose) {
    if (!verbose || verboseMode) {
        std::lock_guard<std::mutex> lock(logMutex);
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        std::string timestamp = std::format("[{:%Y-%m-%d %H:%M:%S}] ", now);
        std::print(sink, "{}{}{}\n", timestamp, levelTag(level), message);
        std::fflush(sink);
    }
}

void Logger::setSink(std::FILE* stream) {
    std::lock_guard<std::mutex> lock(logMutex);
    sink = stream ? stream : stderr;
}
