#pragma once
#include "discard_policy.hpp"
#include <string>
#include <utility>

// Persisted user settings, one "key=value" per line.
class Settings {
public:
    explicit Settings(std::string path) : path_(std::move(path)) {}

    // Missing or unreadable file leaves defaults in place.
    static Settings load(const std::string& path);
    bool store() const;

    const std::string& path() const { return path_; }
    DiscardPolicy policy() const { return policy_; }
    bool discard_flag() const { return policy_.discard(); }
    void set_discard_flag(bool flag) { policy_.set_discard(flag); }

private:
    std::string path_;
    DiscardPolicy policy_;
};
