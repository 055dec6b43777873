#include "logger.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

namespace scrub {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;

    std::lock_guard<std::mutex> fileLock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
    currentLogFile_ = config_.logFile;
    if (config_.fileOutput) {
        openLogFile(currentLogFile_);
        if (!fileStream_.is_open()) {
            config_.fileOutput = false;
        }
    }
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.format = format;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(configMutex_);
    std::lock_guard<std::mutex> fileLock(fileMutex_);

    if (fileStream_.is_open()) {
        fileStream_.close();
    }

    config_.logFile = filename;
    currentLogFile_ = filename;
    openLogFile(currentLogFile_);
    config_.fileOutput = fileStream_.is_open();
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.consoleOutput = enable;
}

void Logger::enableFileOutput(bool enable) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.fileOutput = enable;
}

void Logger::setComponentFilter(const StringSet& components) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.componentFilter = components;
}

void Logger::enableRotation(bool enable, size_t maxFileSize, int maxBackupFiles) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.enableRotation = enable;
    config_.maxFileSize = maxFileSize;
    config_.maxBackupFiles = maxBackupFiles;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const StringMap& context) {
    std::string formattedMessage;
    bool console = false;
    bool file = false;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (!shouldLog(level, component)) {
            return;
        }
        console = config_.consoleOutput;
        file = config_.fileOutput;
        formattedMessage = config_.format == LogFormat::JSON
            ? formatJsonMessage(level, component, message, context)
            : formatTextMessage(level, component, message, context);
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    writeLog(formattedMessage, console, file);
}

void Logger::debug(const std::string& component, const std::string& message,
                   const StringMap& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const StringMap& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const StringMap& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const StringMap& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const StringMap& context) {
    log(LogLevel::FATAL, component, message, context);
}

void Logger::logMetric(const std::string& name, double value, const std::string& unit) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (!config_.includeMetrics) return;
    }

    StringMap context = {
        {"metric_name", name},
        {"metric_value", std::to_string(value)},
        {"metric_unit", unit}
    };

    log(LogLevel::INFO, "Metrics", "Metric recorded: " + name, context);
}

void Logger::logPerformance(const std::string& operation, double durationMs,
                            const StringMap& context) {
    auto perfContext = context;
    perfContext["operation"] = operation;
    perfContext["duration_ms"] = std::to_string(durationMs);

    log(LogLevel::DEBUG, "Performance", "Operation completed: " + operation, perfContext);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::resetMetrics() {
    metrics_ = LogMetrics();
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& message,
                                  const StringMap& context) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.format == LogFormat::JSON
        ? formatJsonMessage(level, component, message, context)
        : formatTextMessage(level, component, message, context);
}

void Logger::flush() {
    std::cerr.flush();
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel Logger::parseLogLevel(const std::string& levelStr) {
    std::string level = string_utils::to_upper(levelStr);

    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    if (level == "FATAL") return LogLevel::FATAL;

    return LogLevel::INFO;
}

LogFormat Logger::parseLogFormat(const std::string& formatStr) {
    std::string format = string_utils::to_upper(formatStr);
    return format == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

std::string Logger::formatTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const StringMap& context) const {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        // Sorted so that lines are stable across runs
        std::vector<std::pair<std::string, std::string>> sorted(context.begin(), context.end());
        std::sort(sorted.begin(), sorted.end());
        oss << " |";
        for (const auto& [key, value] : sorted) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const StringMap& context) const {
    std::string levelName = levelToString(level);
    levelName.erase(levelName.find_last_not_of(' ') + 1);

    nlohmann::json line;
    line["timestamp"] = formatTimestamp();
    line["level"] = levelName;
    line["component"] = component;
    line["message"] = message;
    if (!context.empty()) {
        nlohmann::json ctx = nlohmann::json::object();
        for (const auto& [key, value] : context) {
            ctx[key] = value;
        }
        line["context"] = std::move(ctx);
    }
    return line.dump();
}

void Logger::openLogFile(const std::string& filename) {
    // Called with fileMutex_ held
    std::filesystem::path logPath(filename);
    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(filename, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return;
    }

    currentFileSize_ = std::filesystem::exists(filename, ec)
        ? static_cast<size_t>(std::filesystem::file_size(filename, ec))
        : 0;
}

void Logger::writeLog(const std::string& formattedMessage, bool console, bool file) {
    // Console output goes to stderr; stdout carries command results
    if (console) {
        std::cerr << formattedMessage << '\n';
    }

    if (file) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (fileStream_.is_open()) {
            if (currentFileSize_ + formattedMessage.length() > config_.maxFileSize) {
                rotateLogFile();
            }

            fileStream_ << formattedMessage << '\n';
            fileStream_.flush();
            currentFileSize_ += formattedMessage.length() + 1;
        }
    }
}

void Logger::rotateLogFile() {
    if (!config_.enableRotation) return;

    fileStream_.close();
    std::error_code ec;

    for (int i = config_.maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == config_.maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec);
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (config_.maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
    }
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    if (level < config_.level) {
        return false;
    }

    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }

    return true;
}

} // namespace scrub
