#pragma once
#include <QObject>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace sampler_monitor {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    // The file is renamed with a timestamp suffix once it reaches this size
    void setMaxFileSize(size_t bytes);

    // Logging methods
    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;

signals:
    void logAdded(LogLevel level, const std::string& message);
    void logFileRotated(const std::string& oldFile, const std::string& newFile);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);
    std::string formatLogMessage(LogLevel level,
                                 const std::string& message,
                                 const std::string& source,
                                 const std::string& function,
                                 std::chrono::system_clock::time_point when) const;
    static std::string getLevelString(LogLevel level);

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::sampler_monitor::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::sampler_monitor::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::sampler_monitor::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::sampler_monitor::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::sampler_monitor::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace sampler_monitor
