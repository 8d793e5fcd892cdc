#include "settings.hpp"
#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

Settings Settings::load(const std::string& path) {
    Settings s(path);
    std::ifstream in(path);
    if (!in) return s;

    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string k = trim(line.substr(0, eq)), v = trim(line.substr(eq + 1));
        if (k == cfg::SETTINGS_DISCARD_KEY) {
            if (v == "1" || v == "true") s.set_discard_flag(true);
            else if (v == "0" || v == "false") s.set_discard_flag(false);
        }
    }
    return s;
}

bool Settings::store() const {
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }
    std::ofstream out(path_, std::ios::trunc);
    if (!out) return false;
    out << cfg::SETTINGS_DISCARD_KEY << "=" << (discard_flag() ? 1 : 0) << "\n";
    out.flush();
    return static_cast<bool>(out);
}
