#pragma once
#include <functional>
#include <string>
#include <utility>

enum class LogLevel { Info, Warning, Error };

const char* to_string(LogLevel level);

// Receives one finished line per call; must be safe to call from any thread.
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    Logger() = default;
    explicit Logger(LogSink sink) : sink_(std::move(sink)) {}

    void info(const std::string& msg) const  { write(LogLevel::Info, msg); }
    void warn(const std::string& msg) const  { write(LogLevel::Warning, msg); }
    void error(const std::string& msg) const { write(LogLevel::Error, msg); }

private:
    LogSink sink_;
    void write(LogLevel level, const std::string& msg) const {
        if (sink_) sink_(level, msg);
    }
};

// "[INFO] 2025-08-16 14:32:10.123 message" to stdout (info) or stderr.
LogSink console_sink();
