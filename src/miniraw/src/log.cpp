#include "log.hpp"
#include "utils.hpp"
#include <iostream>
#include <mutex>

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

LogSink console_sink() {
    static std::mutex m;
    return [](LogLevel level, const std::string& msg) {
        std::string line = std::string("[") + to_string(level) + "] " + now_timestamp() + " " + msg + "\n";
        std::lock_guard<std::mutex> lk(m);
        std::ostream& os = (level == LogLevel::Info) ? std::cout : std::cerr;
        os << line;
        os.flush();
    };
}
