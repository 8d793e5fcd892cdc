#include "utils.hpp"
#include "log.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <utility>
#include <vector>

TEST(FormatPeer, Ipv4) {
    sockaddr_storage ss{};
    auto* in = (sockaddr_in*)&ss;
    in->sin_family = AF_INET;
    in->sin_port = htons(51234);
    inet_pton(AF_INET, "192.168.1.20", &in->sin_addr);
    EXPECT_EQ(format_peer(ss, sizeof(sockaddr_in)), "192.168.1.20:51234");
}

TEST(FormatPeer, Ipv6) {
    sockaddr_storage ss{};
    auto* in6 = (sockaddr_in6*)&ss;
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(9100);
    inet_pton(AF_INET6, "::1", &in6->sin6_addr);
    EXPECT_EQ(format_peer(ss, sizeof(sockaddr_in6)), "[::1]:9100");
}

TEST(FormatPeer, UnknownFamilyOrShortLength) {
    sockaddr_storage ss{};
    ss.ss_family = AF_UNIX;
    EXPECT_EQ(format_peer(ss, sizeof(ss)), "unknown");
    ss.ss_family = AF_INET;
    EXPECT_EQ(format_peer(ss, 2), "unknown");
}

TEST(ExecutableDir, PointsAtTestBinary) {
    std::string dir = executable_dir();
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST(DefaultSettingsPath, HonorsXdgConfigHome) {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";
    setenv("XDG_CONFIG_HOME", "/tmp/xdg_test", 1);
    EXPECT_EQ(default_settings_path(), "/tmp/xdg_test/miniraw/settings");
    if (old) setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else unsetenv("XDG_CONFIG_HOME");
}

TEST(NowTimestamp, HasMilliseconds) {
    std::string ts = now_timestamp();
    ASSERT_EQ(ts.size(), std::strlen("2025-08-16 14:32:10.123"));
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[19], '.');
}

TEST(Logger, DefaultDropsLinesAndSinkReceivesLevels) {
    Logger().info("nothing happens");

    std::vector<std::pair<LogLevel, std::string>> got;
    Logger log([&](LogLevel l, const std::string& m) { got.emplace_back(l, m); });
    log.info("a");
    log.warn("b");
    log.error("c");
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[1].first, LogLevel::Warning);
    EXPECT_STREQ(to_string(got[2].first), "ERROR");
}
