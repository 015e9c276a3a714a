#pragma once
#ifndef MERKSEAL_LOGGER_H
#define MERKSEAL_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

namespace merkseal {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Parse "trace", "debug", "info", "warn", "error" or "fatal".
/// @throws std::invalid_argument for anything else.
LogLevel logLevelFromString(const std::string &name);

/**
 * @brief Process-wide JSON line logger with size based rotation.
 *
 * Each record is one JSON object with "timestamp", "level" and "message".
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // log to stdout only

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the logger.
   *
   * Falls back to a console-only WARN logger if init() was never called.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string formatLine(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();
  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace merkseal

#endif // MERKSEAL_LOGGER_H
