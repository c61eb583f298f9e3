#pragma once

#include "export.hpp"

#include <cstdarg>
#include <cstddef>
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

namespace filechunker {

enum class LogLevel {
	LOG_ERROR,
	LOG_WARNING,
	LOG_INFO,
	LOG_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class FILECHUNKER_API Logger {
public:
	static Logger& instance();

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;
	Logger(Logger&&) = delete;
	Logger& operator=(Logger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel level() const;

	// Quiet mode drops per-chunk progress lines at INFO level
	void setQuietMode(bool enabled);

	// Set log file path (appended to)
	bool setLogFile(const std::string& filePath);
	void closeLogFile();

	// Parses DEBUG, INFO, WARN, WARNING, ERROR (case-insensitive)
	static bool parseLevel(const std::string& name, LogLevel& out);

	// Log methods
	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Most recent entries, oldest first; at most kMaxHistory are kept
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

	static constexpr std::size_t kMaxHistory = 1000;

private:
	Logger();
	~Logger();

	void log(LogLevel level, const std::string& message);

	static std::string formatString(const char* format, va_list args);

	std::string levelToString(LogLevel level);

	std::string getCurrentTimestamp();

	LogLevel minLevel;
#ifdef _WIN32
#pragma warning(push)
#pragma warning(disable: 4251)
#endif
	std::vector<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
#ifdef _WIN32
#pragma warning(pop)
#endif
	mutable std::mutex logMutex;

	bool quietMode;
};

} // namespace filechunker
