#include "evichain/logger.h"
#include "evichain/timestamp.hpp"

#include <cstdio> // For std::rename and std::remove
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace evichain {

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSize, int maxBackupFiles) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSize, maxBackupFiles);
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(); logging WARN and above to the console."
              << std::endl;
    s_instance = new Logger(CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 0, 0);
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
               int maxBackupFiles)
    : currentLogLevel_(level), logFilePath_(logFile),
      maxFileSize_(maxFileSize), maxBackupFiles_(maxBackupFiles) {
  if (logFile == CONSOLE_ONLY_OUTPUT)
    return;

  std::error_code ec;
  auto parent = std::filesystem::path(logFile).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  logFileStream_.open(logFilePath_, std::ios::app);
  if (!logFileStream_.is_open()) {
    std::cerr << "Error: Could not open log file: " << logFilePath_
              << std::endl;
  }
}

Logger::~Logger() {
  if (logFileStream_.is_open())
    logFileStream_.close();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel_ = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel_;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatEntry(LogLevel level,
                                const std::string &message) const {
  nlohmann::json entry;
  entry["timestamp"] = isoTimestamp();
  entry["level"] = levelToString(level);
  entry["message"] = message;
  // Log lines must never throw on bad UTF-8 in a message.
  return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::rotateIfNeeded() {
  if (!logFileStream_.is_open() || maxFileSize_ <= 0)
    return;
  logFileStream_.clear();
  logFileStream_.flush();
  if (logFileStream_.tellp() < maxFileSize_)
    return;

  logFileStream_.close();
  if (maxBackupFiles_ == 0) {
    std::remove(logFilePath_.c_str());
  } else {
    std::remove((logFilePath_ + "." + std::to_string(maxBackupFiles_)).c_str());
    for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
      std::string from = logFilePath_ + "." + std::to_string(i);
      std::string to = logFilePath_ + "." + std::to_string(i + 1);
      std::error_code ec;
      if (std::filesystem::exists(from, ec))
        std::rename(from.c_str(), to.c_str());
    }
    std::rename(logFilePath_.c_str(), (logFilePath_ + ".1").c_str());
  }

  logFileStream_.open(logFilePath_, std::ios::app);
  if (!logFileStream_.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath_ << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel_)
    return;

  const std::string line = formatEntry(level, message);
  if (logFilePath_ == CONSOLE_ONLY_OUTPUT) {
    std::cout << line << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream_.is_open()) {
    logFileStream_ << line << std::endl;
  } else {
    std::cerr << line << std::endl;
  }
}

} // namespace evichain
