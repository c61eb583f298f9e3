#include "filechunker/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace filechunker
{

Logger::Logger() : minLevel(LogLevel::LOG_INFO), quietMode(false)
{
}

Logger::~Logger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return minLevel;
}

void Logger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

bool Logger::setLogFile(const std::string &filePath)
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

void Logger::closeLogFile()
{
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open())
    {
        logFile.close();
    }
    logFilePath.clear();
}

bool Logger::parseLevel(const std::string &name, LogLevel &out)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG")
        out = LogLevel::LOG_DEBUG;
    else if (upper == "INFO")
        out = LogLevel::LOG_INFO;
    else if (upper == "WARN" || upper == "WARNING")
        out = LogLevel::LOG_WARNING;
    else if (upper == "ERROR")
        out = LogLevel::LOG_ERROR;
    else
        return false;
    return true;
}

void Logger::error(const std::string &message)
{
    log(LogLevel::LOG_ERROR, message);
}

void Logger::warning(const std::string &message)
{
    log(LogLevel::LOG_WARNING, message);
}

void Logger::info(const std::string &message)
{
    log(LogLevel::LOG_INFO, message);
}

void Logger::debug(const std::string &message)
{
    log(LogLevel::LOG_DEBUG, message);
}

void Logger::error(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_ERROR, formattedMsg);
}

void Logger::warning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_WARNING, formattedMsg);
}

void Logger::info(const char *format, ...)
{
    if (LogLevel::LOG_INFO > level())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_INFO, formattedMsg);
}

void Logger::debug(const char *format, ...)
{
    if (LogLevel::LOG_DEBUG > level())
        return;

    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    log(LogLevel::LOG_DEBUG, formattedMsg);
}

void Logger::logError(const std::string &message)
{
    instance().error(message);
}

void Logger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void Logger::logInfo(const std::string &message)
{
    instance().info(message);
}

void Logger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void Logger::logError(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().error(formattedMsg);
}

void Logger::logWarning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().warning(formattedMsg);
}

void Logger::logInfo(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().info(formattedMsg);
}

void Logger::logDebug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    std::string formattedMsg = formatString(format, args);
    va_end(args);

    instance().debug(formattedMsg);
}

std::vector<LogEntry> Logger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return logs;
}

void Logger::clearLogs()
{
    std::lock_guard<std::mutex> lock(logMutex);
    logs.clear();
}

std::string Logger::formatString(const char *format, va_list args)
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

void Logger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex);

    if (level > minLevel)
    {
        return;
    }

    // Per-chunk progress lines are the only routine INFO output of a split
    if (quietMode && level == LogLevel::LOG_INFO)
    {
        if (message.find("Wrote chunk") != std::string::npos ||
            message.find("Progress:") != std::string::npos)
        {
            return;
        }
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = levelToString(level);

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelStr << "] " << message;
    std::string formattedMessage = logStream.str();

    if (logs.size() >= kMaxHistory)
    {
        logs.erase(logs.begin());
    }
    logs.push_back(LogEntry{level, timestamp, message});

    std::cout << formattedMessage << std::endl;

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
        logFile.flush();
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LOG_ERROR:
        return "ERROR";
    case LogLevel::LOG_WARNING:
        return "WARNING";
    case LogLevel::LOG_INFO:
        return "INFO";
    case LogLevel::LOG_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm localTime{};
#ifdef _WIN32
    localtime_s(&localTime, &time_t);
#else
    localtime_r(&time_t, &localTime);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace filechunker
