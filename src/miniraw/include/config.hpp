#pragma once
#include <cstddef>

namespace cfg {
// Network
inline constexpr int LISTEN_PORT    = 9100;
inline constexpr int LISTEN_BACKLOG = 16;

// Capture files
inline constexpr const char* CAPTURE_EXT = ".spl";
inline constexpr std::size_t COPY_CHUNK_SIZE = 32768;

// Persisted settings ($XDG_CONFIG_HOME/miniraw/settings)
inline constexpr const char* SETTINGS_DIR_NAME    = "miniraw";
inline constexpr const char* SETTINGS_FILE_NAME   = "settings";
inline constexpr const char* SETTINGS_DISCARD_KEY = "discard";

inline constexpr const char* APP_NAME = "MiniRAW NG";
#ifdef MINIRAW_VERSION
inline constexpr const char* APP_VERSION = MINIRAW_VERSION;
#else
inline constexpr const char* APP_VERSION = "dev";
#endif
}
