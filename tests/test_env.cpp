// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "discovery/discovery_manager.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

struct LevelGuard
{
    bluest::Level old = bluest::global_level().load();
    ~LevelGuard() { bluest::set_log_level(old); }
};

TEST(Env_Config, DefaultsWhenUnset)
{
    EnvGuard d("BLUEST_DRIVER"), a("BLUEST_ADAPTER"), t("BLUEST_SCAN_TIMEOUT"),
        n("BLUEST_LISTENER_THREADS");
    d.unset();
    a.unset();
    t.unset();
    n.unset();

    const auto cfg = bluest::load_config_from_env();
    EXPECT_EQ(cfg.driver, "bluez");
    EXPECT_EQ(cfg.adapter, std::string(constants::DEFAULT_ADAPTER));
    EXPECT_EQ(cfg.scan_timeout_s, constants::SCAN_TIMEOUT_DEFAULT_S);
    EXPECT_EQ(cfg.listener_threads, constants::LISTENER_THREADS);
}

TEST(Env_Config, ReadsValidValues)
{
    EnvGuard d("BLUEST_DRIVER"), a("BLUEST_ADAPTER"), t("BLUEST_SCAN_TIMEOUT"),
        n("BLUEST_LISTENER_THREADS");
    d.set("sim");
    a.set("hci1");
    t.set("42");
    n.set("3");

    const auto cfg = bluest::load_config_from_env();
    EXPECT_EQ(cfg.driver, "sim");
    EXPECT_EQ(cfg.adapter, "hci1");
    EXPECT_EQ(cfg.scan_timeout_s, 42);
    EXPECT_EQ(cfg.listener_threads, 3u);

    const auto opts = discovery::Options::from_config(cfg);
    EXPECT_EQ(opts.default_timeout_s, 42);
    EXPECT_EQ(opts.listener_threads, 3u);
    EXPECT_EQ(opts.scan_slice, constants::SCAN_SLICE);
}

TEST(Env_Config, InvalidValuesKeepDefaultsAndWarn)
{
    LevelGuard lg;
    bluest::set_log_level(bluest::Level::Debug);

    EnvGuard d("BLUEST_DRIVER"), t("BLUEST_SCAN_TIMEOUT"), n("BLUEST_LISTENER_THREADS");
    d.set("usb");
    t.set("0");
    n.set("12abc");

    testing::internal::CaptureStderr();
    const auto        cfg = bluest::load_config_from_env();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.driver, "bluez");
    EXPECT_EQ(cfg.scan_timeout_s, constants::SCAN_TIMEOUT_DEFAULT_S);
    EXPECT_EQ(cfg.listener_threads, constants::LISTENER_THREADS);
    EXPECT_NE(err.find("BLUEST_DRIVER"), std::string::npos);
    EXPECT_NE(err.find("BLUEST_SCAN_TIMEOUT"), std::string::npos);
    EXPECT_NE(err.find("BLUEST_LISTENER_THREADS"), std::string::npos);
}

TEST(Env_Config, ParseUintInRange)
{
    unsigned long v = 7;
    EXPECT_TRUE(bluest::parse_uint_in_range("3600", 1, 3600, v));
    EXPECT_EQ(v, 3600u);
    EXPECT_FALSE(bluest::parse_uint_in_range("3601", 1, 3600, v));
    EXPECT_FALSE(bluest::parse_uint_in_range("-1", 1, 3600, v));
    EXPECT_FALSE(bluest::parse_uint_in_range("", 1, 3600, v));
    EXPECT_FALSE(bluest::parse_uint_in_range(nullptr, 1, 3600, v));
    EXPECT_EQ(v, 3600u);
}

TEST(Env_LogLevel, NamesAndThreshold)
{
    LevelGuard lg;

    bluest::set_log_level_by_name("WARN");
    EXPECT_EQ(bluest::global_level().load(), bluest::Level::Warning);
    bluest::set_log_level_by_name("debug");
    EXPECT_EQ(bluest::global_level().load(), bluest::Level::Debug);
    bluest::set_log_level_by_name("bogus");
    EXPECT_EQ(bluest::global_level().load(), bluest::Level::Info);
    bluest::set_log_level_by_name(nullptr);
    EXPECT_EQ(bluest::global_level().load(), bluest::Level::Info);

    bluest::set_log_level(bluest::Level::Error);
    testing::internal::CaptureStderr();
    LOG_INFO("hidden %d", 1);
    LOG_ERROR("shown %d", 2);
    const std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[ERROR]"), std::string::npos);
    EXPECT_NE(out.find("shown 2"), std::string::npos);
}
