#include <gtest/gtest.h>
#include <mediadl/config/config_helpers.h>
#include <mediadl/downloader/downloader_config.hpp>

#include "../../common/test_helpers.h"

#include <cstdlib>

using namespace mediadl::downloader;
using namespace mediadl::tests;
namespace cfg = mediadl::config;

class DownloaderConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir("mediadl_cfg_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(DownloaderConfigTest, MissingFileYieldsDefaults) {
    auto r = loadDownloaderConfig(dir_ / "absent.toml");
    ASSERT_TRUE(r.ok());
    DownloaderConfig defaults;
    EXPECT_EQ(r.value().maxConcurrent, defaults.maxConcurrent);
    EXPECT_EQ(r.value().retry.maxRetries, defaults.retry.maxRetries);
    EXPECT_EQ(r.value().userAgent, defaults.userAgent);
}

TEST_F(DownloaderConfigTest, ReadsDownloaderSection) {
    auto path = write_file(dir_ / "config.toml", R"(
# global settings
[core]
max_concurrent = 99

[downloader]
max_concurrent = 5
max_retries = 4          # retry budget
retry_backoff_ms = 10
retry_backoff_multiplier = 1.5
retry_max_backoff_ms = 40
timeout_ms = 60000
stall_timeout_s = 12
staging_dir = "/tmp/mediadl-staging"
rate_limit_bps = 1048576
follow_redirects = false
tls_insecure = yes
user_agent = "mediadl-test # not a comment"
proxy = "http://proxy.local:3128"
)");

    auto r = loadDownloaderConfig(path);
    ASSERT_TRUE(r.ok()) << r.error().message;
    const auto& c = r.value();
    EXPECT_EQ(c.maxConcurrent, 5u);
    EXPECT_EQ(c.retry.maxRetries, 4);
    EXPECT_EQ(c.retry.initialBackoff.count(), 10);
    EXPECT_DOUBLE_EQ(c.retry.multiplier, 1.5);
    EXPECT_EQ(c.retry.maxBackoff.count(), 40);
    EXPECT_EQ(c.timeout.count(), 60000);
    EXPECT_EQ(c.stallTimeout.count(), 12);
    EXPECT_EQ(c.stagingDir, std::filesystem::path("/tmp/mediadl-staging"));
    EXPECT_EQ(c.rateLimit.globalBps, 1048576u);
    EXPECT_FALSE(c.followRedirects);
    EXPECT_TRUE(c.tls.insecure);
    EXPECT_EQ(c.userAgent, "mediadl-test # not a comment");
    ASSERT_TRUE(c.proxy.has_value());
    EXPECT_EQ(*c.proxy, "http://proxy.local:3128");
}

TEST_F(DownloaderConfigTest, AcceptsDottedKeys) {
    auto path = write_file(dir_ / "dotted.toml", "downloader.max_concurrent = 2\n");
    auto r = loadDownloaderConfig(path);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().maxConcurrent, 2u);
}

TEST_F(DownloaderConfigTest, RejectsInvalidValuesNamingTheKey) {
    struct Case {
        const char* key;
        const char* value;
    };
    for (const auto& c : {Case{"max_concurrent", "0"}, Case{"max_concurrent", "three"},
                          Case{"max_retries", "101"}, Case{"retry_backoff_multiplier", "0.5"},
                          Case{"timeout_ms", "-1"}, Case{"follow_redirects", "maybe"},
                          Case{"staging_dir", ""}}) {
        auto r = applyDownloaderSettings(DownloaderConfig{}, {{c.key, c.value}});
        ASSERT_FALSE(r.ok()) << c.key << " = " << c.value;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
        EXPECT_NE(r.error().message.find(c.key), std::string::npos) << r.error().message;
    }
}

TEST_F(DownloaderConfigTest, RejectsBackoffCapBelowInitialDelay) {
    auto r = applyDownloaderSettings(DownloaderConfig{},
                                     {{"retry_backoff_ms", "500"}, {"retry_max_backoff_ms", "100"}});
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error().message.find("retry_max_backoff_ms"), std::string::npos);
}

TEST_F(DownloaderConfigTest, IgnoresUnknownKeys) {
    auto r = applyDownloaderSettings(DownloaderConfig{}, {{"colour", "blue"}});
    ASSERT_TRUE(r.ok());
}

TEST(ConfigHelpers, UnquoteAndTilde) {
    EXPECT_EQ(cfg::unquote("  \"quoted\"  "), "quoted");
    EXPECT_EQ(cfg::unquote("'single'"), "single");
    EXPECT_EQ(cfg::unquote("bare"), "bare");

    const char* home = std::getenv("HOME");
    if (home) {
        EXPECT_EQ(cfg::expand_tilde("~"), std::filesystem::path(home));
        EXPECT_EQ(cfg::expand_tilde("~/media"), std::filesystem::path(home) / "media");
    }
    EXPECT_EQ(cfg::expand_tilde("/abs/~x"), std::filesystem::path("/abs/~x"));
}

TEST(ConfigHelpers, SanitizeForTerminal) {
    EXPECT_EQ(cfg::sanitize_for_terminal("ok\x1b[31mred"), "ok?[31mred");
}
