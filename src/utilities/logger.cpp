#include "utilities/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>  // For std::rename and std::remove
#include <ctime>
#include <iostream>
#include <new> // For std::bad_alloc

// Initialize static members
Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

LogLevel logLevelFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace")
    return TRACE;
  if (lower == "debug")
    return DEBUG;
  if (lower == "info")
    return INFO;
  if (lower == "warn" || lower == "warning")
    return WARN;
  if (lower == "error")
    return ERROR;
  if (lower == "fatal")
    return FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);

  delete s_instance;    // Safe to delete nullptr
  s_instance = nullptr; // Explicitly nullify before attempting new allocation.

  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    // s_instance remains nullptr; getInstance() reports it.
    std::cerr
        << "[Logger::init] CRITICAL: new Logger FAILED due to std::bad_alloc: "
        << bae.what() << ". s_instance REMAINS nullptr." << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (s_instance) {
    return *s_instance;
  }
  // Emergency console logger, created under the lock so that concurrent
  // callers share one instance.
  std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
               "Logger::init(). Falling back to console output."
            << std::endl;
  try {
    s_instance = new Logger(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN,
                            10 * 1024 * 1024, 5);
  } catch (const std::bad_alloc &bae) {
    throw std::runtime_error("Logger not initialized. Call Logger::init() "
                             "first. Emergency init also failed: " +
                             std::string(bae.what()));
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      // The logger cannot report on itself yet.
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

// Public Destructor
Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
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

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear(); // Clear any error flags
  logFileStream.flush(); // Flush before tellp
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close(); // Close before rename/remove

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOldPath.c_str());

    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  // Reopen the primary log file path
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) { // Check level after acquiring lock
    return;
  }

  nlohmann::json obj;
  obj["timestamp"] = getTimestamp();
  obj["level"] = levelToString(level);
  obj["message"] = message;
  // Invalid UTF-8 in a message is replaced rather than thrown.
  const std::string jsonLine =
      obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
