#pragma once
#include "discard_policy.hpp"
#include "log.hpp"
#include <atomic>
#include <ctime>
#include <functional>
#include <string>
#include <thread>

// Accepts raw TCP streams and hands each one to its own capture thread.
class CaptureServer {
public:
    using Clock = std::function<std::time_t()>;

    CaptureServer(std::string dir, DiscardPolicy policy, Logger log,
                  Clock clock = [] { return std::time(nullptr); });
    ~CaptureServer();

    CaptureServer(const CaptureServer&) = delete;
    CaptureServer& operator=(const CaptureServer&) = delete;

    // Binds 0.0.0.0:port (0 picks a free port) and starts accepting.
    bool start(int port);
    void stop();
    int port() const { return port_; }

private:
    std::string dir_;
    DiscardPolicy policy_;
    Logger log_;
    Clock clock_;

    int server_fd_ = -1;
    int port_ = 0;
    std::thread th_;
    std::atomic<bool> run_{false};

    void loop();
    void dispatch(int cfd, const std::string& peer);
};
