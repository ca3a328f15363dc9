#pragma once
#ifndef _LOGGER_H_
#define _LOGGER_H_
#include <fstream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept> // Required for std::runtime_error
#include <string>

enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @brief Parse a level name ("trace" .. "fatal", any case).
 * @throws std::invalid_argument for an unknown name.
 */
LogLevel logLevelFromString(const std::string& name);

class Logger
{
public:
    // Deleting copy constructor and assignment operator
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

    static void init(const std::string& logFile, LogLevel level = LogLevel::INFO, long long maxFileSize = 10 * 1024 * 1024, int maxBackupFiles = 5);
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    void log(LogLevel level, const std::string& message);

private:
    Logger(const std::string& logFile, LogLevel level, long long maxFileSizeVal, int maxBackupFilesVal); // Private Constructor
public: // Public Destructor
    ~Logger();
private:
    std::string getTimestamp();
    std::string levelToString(LogLevel level);
    void rotateIfNeeded();

    std::ofstream logFileStream;
    LogLevel currentLogLevel;
    std::string logFilePath;
    long long maxFileSize;
    int maxBackupFiles;

    // Static members for init and getInstance
    static Logger* s_instance;
    static std::mutex s_mutex; // Mutex for thread safety
};

#endif
