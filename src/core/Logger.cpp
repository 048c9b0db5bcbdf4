#include "Logger.hpp"
#include <QtGlobal>
#include <QFileInfo>
#include <mutex>
#include <deque>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ctime>

#ifdef Q_OS_UNIX
#include <syslog.h>
#elif defined(Q_OS_WIN)
#include <windows.h>
#endif

namespace sampler_monitor {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024};

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{1000};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    void writeToConsole(LogLevel level, const std::string& formattedMessage) {
        auto& stream = level >= LogLevel::Warning ? std::cerr : std::cout;
        stream << formattedMessage << std::endl;
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }

        if (fileStream && fileStream->is_open()) {
            (*fileStream) << formattedMessage << std::endl;
        }
    }

    void writeToSystem(LogLevel level, const std::string& formattedMessage) {
#ifdef Q_OS_UNIX
        int priority = LOG_INFO;
        switch (level) {
            case LogLevel::Debug:    priority = LOG_DEBUG; break;
            case LogLevel::Info:     priority = LOG_INFO; break;
            case LogLevel::Warning:  priority = LOG_WARNING; break;
            case LogLevel::Error:    priority = LOG_ERR; break;
            case LogLevel::Critical: priority = LOG_CRIT; break;
        }
        syslog(priority, "%s", formattedMessage.c_str());
#elif defined(Q_OS_WIN)
        Q_UNUSED(level);
        OutputDebugStringA(formattedMessage.c_str());
#else
        Q_UNUSED(level);
        Q_UNUSED(formattedMessage);
#endif
    }

    void pruneRecentLogs() {
        while (recentLogs.size() > maxRecentLogs) {
            recentLogs.pop_front();
        }
    }

    bool shouldRotateLogFile() {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return false;
        }

        auto fileSize = std::filesystem::file_size(logFile, ec);
        return !ec && fileSize >= maxFileSize;
    }

    std::string rotateLogFile() {
        closeLogFile();

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S");

        std::string rotated = logFile + "." + ss.str();

        std::error_code ec;
        std::filesystem::rename(logFile, rotated, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            rotated.clear();
        }

        openLogFile();
        return rotated;
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    std::string rotatedFrom;
    std::string rotatedTo;
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        // __FILE__ carries the build path, keep only the file name
        std::string file = source.empty()
            ? source
            : QFileInfo(QString::fromStdString(source)).fileName().toStdString();

        LogEntry entry{std::chrono::system_clock::now(), level, message, file, function};
        d->recentLogs.push_back(entry);
        d->pruneRecentLogs();

        std::string formattedMessage = formatLogMessage(
            level, message, file, function, entry.timestamp);

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(level, formattedMessage);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            if (d->shouldRotateLogFile()) {
                rotatedFrom = d->logFile;
                rotatedTo = d->rotateLogFile();
            }
            d->writeToFile(formattedMessage);
        }

        if (d->destination == LogDestination::System ||
            d->destination == LogDestination::All) {
            d->writeToSystem(level, formattedMessage);
        }
    }

    // Signals go out without the lock so slots may log themselves
    if (!rotatedTo.empty()) {
        emit logFileRotated(rotatedFrom, rotatedTo);
    }
    emit logAdded(level, message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
    std::cout.flush();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 :
                   d->recentLogs.size() - count;

    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        const auto& entry = d->recentLogs[i];
        result.push_back(formatLogMessage(
            entry.level,
            entry.message,
            entry.source,
            entry.function,
            entry.timestamp
        ));
    }

    return result;
}

std::string Logger::formatLogMessage(LogLevel level,
                                     const std::string& message,
                                     const std::string& source,
                                     const std::string& function,
                                     std::chrono::system_clock::time_point when) const {
    std::stringstream ss;

    auto time = std::chrono::system_clock::to_time_t(when);
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << " ";

    ss << "[" << getLevelString(level) << "] ";

    if (!source.empty()) {
        ss << source;
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

} // namespace sampler_monitor
