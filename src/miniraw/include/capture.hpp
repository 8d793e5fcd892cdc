#pragma once
#include "log.hpp"
#include <cstdint>
#include <ctime>
#include <string>

enum class CaptureOutcome { Discarded, Kept, Deleted, Failed };

struct CaptureResult {
    CaptureOutcome outcome = CaptureOutcome::Failed;
    uint64_t bytes = 0;
    std::string path;   // empty when nothing was created
};

// "<ts>.spl" for suffix 0, "<ts>-<suffix>.spl" otherwise.
std::string capture_file_name(std::time_t ts, unsigned long suffix);

// Exclusively creates the first free capture file for ts in dir.
// Returns a writable fd and fills path, or -1 with errno set.
int open_capture_file(const std::string& dir, std::time_t ts, std::string& path);

// Drains fd to EOF, either dropping the bytes or saving them under dir.
// Always closes fd.
CaptureResult capture_connection(int fd, bool discard, const std::string& dir,
                                 std::time_t ts, const Logger& log);
