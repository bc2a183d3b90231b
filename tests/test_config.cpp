// tests/test_config.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
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

TEST(Env_Config, Defaults)
{
    EnvGuard g_kind("GATTLINK_ADAPTER_KIND");
    EnvGuard g_adapter("GATTLINK_ADAPTER");
    EnvGuard g_peer("GATTLINK_PEER");
    EnvGuard g_services("GATTLINK_SERVICES");
    g_kind.unset();
    g_adapter.unset();
    g_peer.unset();
    g_services.unset();

    gattlink::Config cfg = gattlink::Config::from_env();
    EXPECT_EQ(cfg.adapter_kind, gattlink::AdapterKind::Bluez);
    EXPECT_EQ(cfg.adapter, "hci0");
    EXPECT_TRUE(cfg.peer.empty());
    EXPECT_TRUE(cfg.service_filter.empty());
}

TEST(Env_Config, FromEnv)
{
    EnvGuard g_kind("GATTLINK_ADAPTER_KIND");
    EnvGuard g_adapter("GATTLINK_ADAPTER");
    EnvGuard g_peer("GATTLINK_PEER");
    EnvGuard g_services("GATTLINK_SERVICES");
    g_kind.set("fake");
    g_adapter.set("hci1");
    g_peer.set("aa:bb:cc:dd:ee:ff");
    g_services.set("180F, 6E400001-B5A3-F393-E0A9-E50E24DCCA9E");

    gattlink::Config cfg = gattlink::Config::from_env();
    EXPECT_EQ(cfg.adapter_kind, gattlink::AdapterKind::Fake);
    EXPECT_EQ(cfg.adapter, "hci1");
    EXPECT_EQ(cfg.peer, "AA:BB:CC:DD:EE:FF");
    ASSERT_EQ(cfg.service_filter.size(), 2u);
    EXPECT_EQ(cfg.service_filter[0], "0000180f-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(cfg.service_filter[1], "6e400001-b5a3-f393-e0a9-e50e24dcca9e");
}

TEST(Env_Config, InvalidValuesWarnAndAreIgnored)
{
    EnvGuard g_kind("GATTLINK_ADAPTER_KIND");
    EnvGuard g_peer("GATTLINK_PEER");
    EnvGuard g_services("GATTLINK_SERVICES");
    g_kind.set("corebluetooth");
    g_peer.set("not-a-mac");
    g_services.set("180f,zz");

    gattlink::set_log_level_by_name("INFO");
    testing::internal::CaptureStderr();
    gattlink::Config cfg = gattlink::Config::from_env();
    std::string      err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.adapter_kind, gattlink::AdapterKind::Bluez);
    EXPECT_TRUE(cfg.peer.empty());
    EXPECT_EQ(cfg.service_filter.size(), 1u);
    EXPECT_NE(err.find("GATTLINK_ADAPTER_KIND"), std::string::npos);
    EXPECT_NE(err.find("GATTLINK_PEER"), std::string::npos);
    EXPECT_NE(err.find("'zz'"), std::string::npos);
}

TEST(Env_Config, Helpers)
{
    EXPECT_TRUE(gattlink::is_valid_mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_FALSE(gattlink::is_valid_mac("AA-BB-CC-DD-EE-FF"));
    EXPECT_FALSE(gattlink::is_valid_mac("AA:BB:CC:DD:EE"));
    EXPECT_EQ(gattlink::split_list(" a, b ,,c "), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace gattlink;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    LOG_SYSTEM("system_always_shown");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[SYSTEM]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level_by_name("INFO");
}

TEST(LogLevel, FromEnv)
{
    EnvGuard g("GATTLINK_LOG_LEVEL");
    g.set("warn");
    (void)gattlink::Config::from_env();
    EXPECT_EQ(gattlink::global_level(), gattlink::Level::Warning);
    gattlink::set_log_level_by_name("INFO");
}

TEST(LogLevel, UnknownNameHidesDebug)
{
    gattlink::set_log_level_by_name("verbose");
    EXPECT_EQ(gattlink::global_level(), gattlink::Level::Info);

    testing::internal::CaptureStderr();
    LOG_DEBUG("per_operation_noise");
    LOG_INFO("info_visible");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("per_operation_noise"), std::string::npos);
    EXPECT_NE(out.find("info_visible"), std::string::npos);
}
