#include "jdki/logger.hpp"
#include "jdki/version.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace jdki {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

bool Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleLevel_ = verbose ? LogLevel::Debug : LogLevel::Warning;

    if (logFile_.is_open()) {
        logFile_.close();
    }
    if (logPath.empty()) return true;

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) return false;
    logFile_ << "\n=== jdki " << JDKI_VERSION_STRING << " run started " << getTimestamp()
             << " ===" << std::endl;
    return true;
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_ << "=== run finished " << getTimestamp() << " ===" << std::endl;
        logFile_.close();
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setContext(const std::string& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_ = context;
}

std::string Logger::context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
}

void Logger::setConsoleStreams(std::ostream& out, std::ostream& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &out;
    err_ = &err;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string line = std::string("[") + getLevelString(level) + "] ";
    if (!context_.empty()) {
        line += "(" + context_ + ") ";
    }
    line += message;

    if (logFile_.is_open()) {
        logFile_ << getTimestamp() << " " << line << "\n";
        if (level >= LogLevel::Warning) logFile_.flush();
    }

    if (level < consoleLevel_) return;
    std::ostream& console = level >= LogLevel::Warning ? *err_ : *out_;
    console << line << std::endl;
}

std::string Logger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &in_time_t);
#else
    localtime_r(&in_time_t, &tm);
#endif
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << ms.count();
    return ss.str();
}

const char* Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

} // namespace jdki
