#pragma once
#include "log.hpp"
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("miniraw_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() { std::error_code ec; std::filesystem::remove_all(path_, ec); }

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::vector<std::string> files() const {
        std::vector<std::string> out;
        for (auto& e : std::filesystem::directory_iterator(path_))
            out.push_back(e.path().filename().string());
        return out;
    }

private:
    std::filesystem::path path_;
};

// Collects log lines; lets a test block until some line shows up.
class LogRecorder {
public:
    LogSink sink() {
        return [this](LogLevel level, const std::string& msg) {
            std::lock_guard<std::mutex> lk(m_);
            lines_.emplace_back(level, msg);
            cv_.notify_all();
        };
    }

    size_t count(LogLevel level, const std::string& needle) const {
        std::lock_guard<std::mutex> lk(m_);
        size_t n = 0;
        for (auto& l : lines_)
            if (l.first == level && l.second.find(needle) != std::string::npos) ++n;
        return n;
    }

    bool wait_for(LogLevel level, const std::string& needle, size_t n = 1,
                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(m_);
        return cv_.wait_for(lk, timeout, [&] {
            size_t c = 0;
            for (auto& l : lines_)
                if (l.first == level && l.second.find(needle) != std::string::npos) ++c;
            return c >= n;
        });
    }

    std::vector<std::pair<LogLevel, std::string>> lines() const {
        std::lock_guard<std::mutex> lk(m_);
        return lines_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};
