#pragma once

#include "export.hpp"

#include <cstdarg>
#include <string>
#include <vector>
#include <fstream>
#include <mutex>

enum class LogLevel {
	PIPELINE_ERROR,
	PIPELINE_WARNING,
	PIPELINE_INFO,
	PIPELINE_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class DOCCHUNK_API PipelineLogger {
public:
	static PipelineLogger& instance();

	PipelineLogger(const PipelineLogger&) = delete;
	PipelineLogger& operator=(const PipelineLogger&) = delete;
	PipelineLogger(PipelineLogger&&) = delete;
	PipelineLogger& operator=(PipelineLogger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel level() const;

	// Parse "ERROR", "WARNING"/"WARN", "INFO", "DEBUG"; unknown names map to INFO
	static LogLevel levelFromString(const std::string& name);

	// Suppress INFO lines on the console and in the log file
	void setQuietMode(bool enabled);

	// Mirror output to stderr (on by default)
	void setConsoleOutput(bool enabled);

	// Set log file path
	bool setLogFile(const std::string& filePath);

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

	// Stored entries, used by the tests to assert on logged outcomes
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

private:
	PipelineLogger();
	~PipelineLogger();

	void log(LogLevel level, const std::string& message);
	void logv(LogLevel level, const char* format, va_list args);

	std::string formatString(const char* format, va_list args);

	std::string levelToString(LogLevel level);

	std::string getCurrentTimestamp();

	LogLevel minLevel;
	std::vector<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
	mutable std::mutex logMutex;

	bool quietMode;
	bool consoleOutput;
};
