#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace egress {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide logger. The gateway is embedded in a host process, so lines go to
// stderr by default; the host can redirect them with SetSink().
class Logger {
public:
    // Receives the fully formatted line (without trailing newline).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    static LogLevel ParseLevel(const std::string& levelStr);
    static const char* LevelName(LogLevel level);

    // Empty sink restores the default stderr output.
    void SetSink(Sink sink);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream ss_;
};

} // namespace common
} // namespace egress

#define LOG_DEBUG \
    if (egress::common::LogLevel::DEBUG >= egress::common::Logger::Instance().GetLevel()) \
    egress::common::LogStream(egress::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (egress::common::LogLevel::INFO >= egress::common::Logger::Instance().GetLevel()) \
    egress::common::LogStream(egress::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (egress::common::LogLevel::WARN >= egress::common::Logger::Instance().GetLevel()) \
    egress::common::LogStream(egress::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (egress::common::LogLevel::ERROR >= egress::common::Logger::Instance().GetLevel()) \
    egress::common::LogStream(egress::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (egress::common::LogLevel::FATAL >= egress::common::Logger::Instance().GetLevel()) \
    egress::common::LogStream(egress::common::LogLevel::FATAL, __FILE__, __LINE__)
