#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For std::rename and std::remove, snprintf
#include <ctime>
#include <filesystem>
#include <string>

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance) {
      return *s_instance;
    }
  }
  std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
               "Logger::init(). Falling back to console output."
            << std::endl;
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    throw std::runtime_error("Logger not initialized and emergency "
                             "initialization failed.");
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile == CONSOLE_ONLY_OUTPUT) {
    return;
  }
  std::error_code ec;
  const auto parent = std::filesystem::path(logFilePath).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    // The logger cannot log about itself yet.
    std::cerr << "Error: Could not open log file: " << logFilePath
              << std::endl;
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
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

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (LogLevel level : {TRACE, DEBUG, INFO, WARN, ERROR, FATAL}) {
    if (levelToString(level) == upper)
      return level;
  }
  if (upper == "WARNING")
    return WARN;
  throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::jsonEscape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out.push_back(static_cast<char>(c));
      }
    }
  }
  return out;
}

std::string Logger::formatRecord(LogLevel level, const std::string &message) {
  return "{\"timestamp\":\"" + getTimestamp() + "\",\"level\":\"" +
         levelToString(level) + "\",\"message\":\"" + jsonEscape(message) +
         "\"}";
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOldPath.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      if (std::filesystem::exists(oldPath)) {
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  const std::string jsonLine = formatRecord(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();

  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  } else {
    std::cerr << jsonLine << std::endl;
  }
}

void Logger::trace(const char *format, ...) {
  char buffer[512];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  Logger::getInstance().log(LogLevel::TRACE, buffer);
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
