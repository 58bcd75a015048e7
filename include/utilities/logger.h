#pragma once
#ifndef QUICKSHARE_LOGGER_H
#define QUICKSHARE_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as a single JSON line containing the timestamp,
 * level, component and message. File output rotates once the active file
 * grows past the configured size.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; ///< Log to stdout only.

  /**
   * @brief (Re)initialize the singleton.
   * @param logFile        Destination path or CONSOLE_ONLY_OUTPUT.
   * @param level          Minimum level that is written.
   * @param maxFileSize    Rotation threshold in bytes (<= 0 disables).
   * @param maxBackupFiles Number of rotated files kept (file.1 is newest).
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the singleton.
   *
   * Falls back to console logging at WARN if init() was never called.
   */
  static Logger &getInstance();

  static LogLevel levelFromString(const std::string &name);

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;

  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &component,
           const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
         int maxBackupFiles);

  std::string getTimestamp() const;
  static std::string levelToString(LogLevel level);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // QUICKSHARE_LOGGER_H
