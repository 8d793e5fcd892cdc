#include "capture.hpp"
#include "config.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

std::string capture_file_name(std::time_t ts, unsigned long suffix) {
    std::string name = std::to_string((long long)ts);
    if (suffix) name += "-" + std::to_string(suffix);
    return name + cfg::CAPTURE_EXT;
}

int open_capture_file(const std::string& dir, std::time_t ts, std::string& path) {
    for (unsigned long suffix = 0;; ++suffix) {
        std::string candidate = (std::filesystem::path(dir) / capture_file_name(ts, suffix)).string();
        int fd;
        do {
            fd = open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        } while (fd < 0 && errno == EINTR);
        if (fd >= 0) { path = candidate; return fd; }
        if (errno != EEXIST) return -1;
    }
}

static std::string base_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

static ssize_t read_some(int fd, char* buf, size_t len) {
    ssize_t n;
    do { n = recv(fd, buf, len, 0); } while (n < 0 && errno == EINTR);
    return n;
}

static bool write_all(int fd, const char* buf, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, buf, len);
        if (n < 0) { if (errno == EINTR) continue; return false; }
        buf += n; len -= (size_t)n;
    }
    return true;
}

static CaptureResult discard_stream(int fd, std::vector<char>& buf, const Logger& log) {
    CaptureResult res;
    ssize_t n;
    while ((n = read_some(fd, buf.data(), buf.size())) > 0) res.bytes += (uint64_t)n;
    int err = (n < 0) ? errno : 0;
    log.info("Discarded " + std::to_string(res.bytes) + " bytes");
    if (err) {
        log.error(std::string("Read error: ") + strerror(err));
        return res;
    }
    res.outcome = CaptureOutcome::Discarded;
    return res;
}

// A capture that failed before anything reached the disk leaves no file behind.
static void remove_if_empty(const std::string& path, const std::string& name, const Logger& log) {
    std::error_code ec;
    if (std::filesystem::file_size(path, ec) != 0 || ec) return;
    std::filesystem::remove(path, ec);
    if (ec) log.error("Cannot delete " + name + ": " + ec.message());
}

static CaptureResult save_stream(int fd, std::vector<char>& buf, const std::string& dir,
                                 std::time_t ts, const Logger& log) {
    CaptureResult res;
    int out = open_capture_file(dir, ts, res.path);
    if (out < 0) {
        log.error("Cannot create capture file in " + dir + ": " + strerror(errno));
        return res;
    }
    std::string name = base_name(res.path);

    // Partially written files are left in place on error; empty ones are not.
    ssize_t n;
    while ((n = read_some(fd, buf.data(), buf.size())) > 0) {
        if (!write_all(out, buf.data(), (size_t)n)) {
            log.error("Write error on " + name + ": " + strerror(errno));
            close(out);
            remove_if_empty(res.path, name, log);
            return res;
        }
        res.bytes += (uint64_t)n;
    }
    if (n < 0) {
        log.error(std::string("Read error: ") + strerror(errno));
        close(out);
        remove_if_empty(res.path, name, log);
        return res;
    }
    if (close(out) < 0) {
        log.error("Write error on " + name + ": " + strerror(errno));
        remove_if_empty(res.path, name, log);
        return res;
    }

    if (res.bytes == 0) {
        log.warn("Received empty file, deleting " + name);
        std::error_code ec;
        std::filesystem::remove(res.path, ec);
        if (ec) log.error("Cannot delete " + name + ": " + ec.message());
        res.outcome = CaptureOutcome::Deleted;
        return res;
    }

    res.outcome = CaptureOutcome::Kept;
    log.info("Saved " + std::to_string(res.bytes) + " bytes into " + name);
    return res;
}

CaptureResult capture_connection(int fd, bool discard, const std::string& dir,
                                 std::time_t ts, const Logger& log) {
    std::vector<char> buf(cfg::COPY_CHUNK_SIZE);
    CaptureResult res = discard ? discard_stream(fd, buf, log)
                                : save_stream(fd, buf, dir, ts, log);
    close(fd);
    return res;
}
