#ifndef JDKI_LOGGER_HPP
#define JDKI_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>

namespace jdki {

// Not DEBUG/ERROR: windows.h defines ERROR as a macro.
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Console lines are "[LEVEL] (stage) message"; the log file additionally
// gets a millisecond timestamp and always records every level.
class Logger {
public:
    static Logger& instance();

    // An empty logPath logs to the console only. Returns false if the log
    // file could not be opened; console logging still works.
    bool init(const std::filesystem::path& logPath, bool verbose);
    void log(LogLevel level, const std::string& message);
    void close();

    // Tag prepended to every line, normally the current install stage.
    void setContext(const std::string& context);
    std::string context() const;

    // Redirects console output; used by tests.
    void setConsoleStreams(std::ostream& out, std::ostream& err);

    bool verbose() const { return consoleLevel_ == LogLevel::Debug; }

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    LogLevel consoleLevel_ = LogLevel::Warning;
    std::string context_;
    std::ostream* out_ = &std::cout;
    std::ostream* err_ = &std::cerr;
    mutable std::mutex mutex_;

    static std::string getTimestamp();
    static const char* getLevelString(LogLevel level);
};

// Sets the logger context for the lifetime of the object, restoring the
// previous one afterwards.
class LogContext {
public:
    explicit LogContext(const std::string& context)
        : previous_(Logger::instance().context()) {
        Logger::instance().setContext(context);
    }
    ~LogContext() { Logger::instance().setContext(previous_); }

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

private:
    std::string previous_;
};

// Convenience macros
#define LOG_DEBUG(msg) jdki::Logger::instance().log(jdki::LogLevel::Debug, msg)
#define LOG_INFO(msg) jdki::Logger::instance().log(jdki::LogLevel::Info, msg)
#define LOG_WARN(msg) jdki::Logger::instance().log(jdki::LogLevel::Warning, msg)
#define LOG_ERROR(msg) jdki::Logger::instance().log(jdki::LogLevel::Error, msg)

} // namespace jdki

#endif // JDKI_LOGGER_HPP
