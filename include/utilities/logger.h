#pragma once
#ifndef _DEDUPFS_LOGGER_H_
#define _DEDUPFS_LOGGER_H_
#include <fstream>
#include <iostream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as one JSON object per line with the keys
 * "timestamp", "level" and "message". File output is rotated once it grows
 * past the configured size, keeping numbered backups (file.1, file.2, ...).
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Log to stdout only

  static void init(const std::string &logFile,
                   LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the logger.
   *
   * Falls back to console-only output at WARN if init() was never called.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   */
  static void trace(const char *format, ...);

  static std::string levelToString(LogLevel level);
  /// Parse "trace".."fatal" (case-insensitive).
  /// @throws std::invalid_argument for unknown names.
  static LogLevel parseLevel(const std::string &name);
  /// Escape a string for embedding in a JSON string literal.
  static std::string jsonEscape(const std::string &text);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif
