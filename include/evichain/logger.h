#pragma once
#ifndef EVICHAIN_LOGGER_H
#define EVICHAIN_LOGGER_H

#include <fstream>
#include <mutex>
#include <string>

namespace evichain {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every entry is written as one JSON object per line with the keys
 * "level", "message" and "timestamp". File output rotates once the file
 * reaches maxFileSize, keeping up to maxBackupFiles numbered backups
 * (path.1 is the newest).
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  ~Logger();

  /// Pass as logFile to write entries to stdout instead of a file.
  static const std::string CONSOLE_ONLY_OUTPUT;

  /**
   * @brief (Re)initialize the process logger.
   *
   * Any previously initialized instance is replaced and its file closed.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the logger.
   *
   * Falls back to a console-only WARN logger when init() was never called.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;

  void log(LogLevel level, const std::string &message);

  static std::string levelToString(LogLevel level);

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
         int maxBackupFiles);

  std::string formatEntry(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();

  std::ofstream logFileStream_;
  LogLevel currentLogLevel_;
  std::string logFilePath_;
  long long maxFileSize_;
  int maxBackupFiles_;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace evichain

#endif // EVICHAIN_LOGGER_H
