#pragma once
#include <string>
#include <sys/socket.h>

std::string now_timestamp();            // e.g. "2025-08-16 14:32:10.123"
std::string executable_dir();           // directory holding /proc/self/exe, "." if unknown
std::string default_settings_path();    // $XDG_CONFIG_HOME/miniraw/settings
std::string format_peer(const sockaddr_storage& addr, socklen_t len);
