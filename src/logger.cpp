#include "docchunk/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
    // In-memory history is bounded so a long-lived worker does not grow without limit
    constexpr size_t kMaxStoredEntries = 10000;
}

PipelineLogger::PipelineLogger() : minLevel(LogLevel::PIPELINE_INFO), quietMode(false), consoleOutput(true)
{
}

PipelineLogger::~PipelineLogger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

PipelineLogger &PipelineLogger::instance()
{
    static PipelineLogger instance;
    return instance;
}

void PipelineLogger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel PipelineLogger::level() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return minLevel;
}

LogLevel PipelineLogger::levelFromString(const std::string &name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });

    if (upper == "ERROR")
        return LogLevel::PIPELINE_ERROR;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::PIPELINE_WARNING;
    if (upper == "DEBUG")
        return LogLevel::PIPELINE_DEBUG;
    return LogLevel::PIPELINE_INFO;
}

void PipelineLogger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

void PipelineLogger::setConsoleOutput(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    consoleOutput = enabled;
}

bool PipelineLogger::setLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (logFile.is_open())
    {
        logFile.close();
    }

    logFilePath = filePath;
    logFile.open(filePath, std::ios::app);

    if (!logFile.is_open())
    {
        std::cerr << "Failed to open log file: " << filePath << std::endl;
        return false;
    }

    return true;
}

void PipelineLogger::error(const std::string &message)
{
    log(LogLevel::PIPELINE_ERROR, message);
}

void PipelineLogger::warning(const std::string &message)
{
    log(LogLevel::PIPELINE_WARNING, message);
}

void PipelineLogger::info(const std::string &message)
{
    log(LogLevel::PIPELINE_INFO, message);
}

void PipelineLogger::debug(const std::string &message)
{
    log(LogLevel::PIPELINE_DEBUG, message);
}

void PipelineLogger::error(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::PIPELINE_ERROR, format, args);
    va_end(args);
}

void PipelineLogger::warning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::PIPELINE_WARNING, format, args);
    va_end(args);
}

void PipelineLogger::info(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::PIPELINE_INFO, format, args);
    va_end(args);
}

void PipelineLogger::debug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::PIPELINE_DEBUG, format, args);
    va_end(args);
}

void PipelineLogger::logError(const std::string &message)
{
    instance().error(message);
}

void PipelineLogger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void PipelineLogger::logInfo(const std::string &message)
{
    instance().info(message);
}

void PipelineLogger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void PipelineLogger::logError(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::PIPELINE_ERROR, format, args);
    va_end(args);
}

void PipelineLogger::logWarning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::PIPELINE_WARNING, format, args);
    va_end(args);
}

void PipelineLogger::logInfo(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::PIPELINE_INFO, format, args);
    va_end(args);
}

void PipelineLogger::logDebug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::PIPELINE_DEBUG, format, args);
    va_end(args);
}

void PipelineLogger::logv(LogLevel level, const char *format, va_list args)
{
    // Skip the formatting work for lines that would be filtered anyway
    if (level > this->level())
        return;

    log(level, formatString(format, args));
}

std::vector<LogEntry> PipelineLogger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return logs;
}

void PipelineLogger::clearLogs()
{
    std::lock_guard<std::mutex> lock(logMutex);
    logs.clear();
}

std::string PipelineLogger::formatString(const char *format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, format, argsCopy) + 1; // +1 for null terminator
    va_end(argsCopy);

    if (size <= 0)
    {
        return "Error formatting string";
    }

    std::vector<char> buffer(size);

    vsnprintf(buffer.data(), size, format, args);

    return std::string(buffer.data(), buffer.data() + size - 1);
}

void PipelineLogger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (level > minLevel)
    {
        return;
    }

    if (quietMode && level == LogLevel::PIPELINE_INFO)
    {
        return;
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = levelToString(level);

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelStr << "] " << message;
    std::string formattedMessage = logStream.str();

    if (logs.size() >= kMaxStoredEntries)
    {
        logs.erase(logs.begin(), logs.begin() + static_cast<std::ptrdiff_t>(kMaxStoredEntries / 2));
    }
    logs.push_back(LogEntry{level, timestamp, message});

    if (consoleOutput)
    {
        // stdout may carry the JSON result, diagnostics go to stderr
        std::cerr << formattedMessage << std::endl;
    }

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
        logFile.flush();
    }
}

std::string PipelineLogger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::PIPELINE_ERROR:
        return "ERROR";
    case LogLevel::PIPELINE_WARNING:
        return "WARNING";
    case LogLevel::PIPELINE_INFO:
        return "INFO";
    case LogLevel::PIPELINE_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string PipelineLogger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &time_t);
#else
    localtime_r(&time_t, &localTm);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
