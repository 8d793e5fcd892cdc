#include "capture_server.hpp"
#include "capture.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

CaptureServer::CaptureServer(std::string dir, DiscardPolicy policy, Logger log, Clock clock)
    : dir_(std::move(dir)), policy_(std::move(policy)), log_(std::move(log)), clock_(std::move(clock)) {}

CaptureServer::~CaptureServer() { stop(); }

bool CaptureServer::start(int port){
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) { log_.error(std::string("socket: ") + strerror(errno)); return false; }
    int opt=1; setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{}; addr.sin_family=AF_INET; addr.sin_addr.s_addr=INADDR_ANY; addr.sin_port=htons(port);
    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr))<0){
        log_.error("bind port " + std::to_string(port) + ": " + strerror(errno));
        close(server_fd_); server_fd_=-1; return false;
    }
    if (listen(server_fd_, cfg::LISTEN_BACKLOG)<0){
        log_.error(std::string("listen: ") + strerror(errno));
        close(server_fd_); server_fd_=-1; return false;
    }
    socklen_t len = sizeof(addr);
    port_ = (getsockname(server_fd_, (sockaddr*)&addr, &len) == 0) ? ntohs(addr.sin_port) : port;

    run_ = true;
    th_ = std::thread(&CaptureServer::loop, this);
    log_.info("Started listener on port " + std::to_string(port_));
    return true;
}

void CaptureServer::stop(){
    run_ = false;
    // shutdown() wakes a thread blocked in accept(); close() alone does not.
    if (server_fd_>=0) shutdown(server_fd_, SHUT_RDWR);
    if (th_.joinable()) th_.join();
    if (server_fd_>=0){ close(server_fd_); server_fd_=-1; }
}

void CaptureServer::loop(){
    while (run_){
        sockaddr_storage peer{}; socklen_t plen = sizeof(peer);
        int cfd = accept4(server_fd_, (sockaddr*)&peer, &plen, SOCK_CLOEXEC);
        if (cfd<0){
            int err = errno;
            if (!run_) break;
            if (err == EINTR) continue;
            log_.error(std::string("accept: ") + strerror(err));
            if (err == EBADF || err == EINVAL) break;
            // Out of descriptors: the pending connection stays queued, back off.
            if (err == EMFILE || err == ENFILE)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        dispatch(cfd, format_peer(peer, plen));
    }
}

void CaptureServer::dispatch(int cfd, const std::string& peer){
    // Policy and timestamp are fixed for the whole session.
    bool discard = policy_.discard();
    std::time_t ts = clock_();
    log_.info("Incoming connection from " + peer);
    std::string dir = dir_;
    Logger log = log_;
    try {
        std::thread([cfd, discard, dir, ts, log](){
            capture_connection(cfd, discard, dir, ts, log);
        }).detach();
    } catch (const std::system_error& e) {
        log_.error(std::string("Cannot start capture thread: ") + e.what());
        close(cfd);
    }
}
