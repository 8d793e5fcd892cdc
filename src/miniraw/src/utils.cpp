#include "utils.hpp"
#include "config.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <system_error>

std::string now_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000);
    std::tm tm{};
    localtime_r(&t, &tm); // thread-safe
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    char out[80];
    snprintf(out, sizeof(out), "%s.%03ld", buf, ms);
    return std::string(out);
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || !exe.has_parent_path()) return ".";
    return exe.parent_path().string();
}

std::string default_settings_path() {
    std::filesystem::path base;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && *xdg) base = xdg;
    else if (home && *home) base = std::filesystem::path(home) / ".config";
    else base = ".";
    return (base / cfg::SETTINGS_DIR_NAME / cfg::SETTINGS_FILE_NAME).string();
}

std::string format_peer(const sockaddr_storage& addr, socklen_t len) {
    char ip[INET6_ADDRSTRLEN];
    if (addr.ss_family == AF_INET && len >= (socklen_t)sizeof(sockaddr_in)) {
        auto* in = (const sockaddr_in*)&addr;
        if (!inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip))) return "unknown";
        return std::string(ip) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6 && len >= (socklen_t)sizeof(sockaddr_in6)) {
        auto* in6 = (const sockaddr_in6*)&addr;
        if (!inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip))) return "unknown";
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "unknown";
}
