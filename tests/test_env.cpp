// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "xfer/retry_policy.hpp"

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
    EnvGuard g1("UDPCONV_HOST"), g2("UDPCONV_PORT"), g3("UDPCONV_ACK_TIMEOUT_MS"),
        g4("UDPCONV_MAX_RETRIES"), g5("UDPCONV_OUTPUT_DIR"), g6("UDPCONV_BIND"),
        g7("UDPCONV_IDLE_TIMEOUT_MS");
    for (auto *g : {&g1, &g2, &g3, &g4, &g5, &g6, &g7})
        g->unset();

    auto c = config::load_from_env(config::Role::Client);
    EXPECT_EQ(c.host, "127.0.0.1");
    EXPECT_EQ(c.port, constants::SERVER_PORT);
    EXPECT_EQ(c.ack_timeout_ms, constants::ACK_TIMEOUT_MS);
    EXPECT_EQ(c.max_retries, constants::MAX_RETRIES);
    EXPECT_EQ(c.idle_timeout_ms, constants::IDLE_TIMEOUT_MS);
    EXPECT_EQ(c.output_dir, "results_client");

    auto s = config::load_from_env(config::Role::Server);
    EXPECT_EQ(s.bind, "0.0.0.0");
    EXPECT_EQ(s.output_dir, "conversions_server");
}

TEST(Env_Config, FromEnv)
{
    EnvGuard host("UDPCONV_HOST"), port("UDPCONV_PORT"), ack("UDPCONV_ACK_TIMEOUT_MS"),
        retries("UDPCONV_MAX_RETRIES"), out("UDPCONV_OUTPUT_DIR");
    host.set("10.0.0.7");
    port.set("6000");
    ack.set("150");
    retries.set("0");
    out.set("/tmp/udpconv-out");

    auto c = config::load_from_env(config::Role::Client);
    EXPECT_EQ(c.host, "10.0.0.7");
    EXPECT_EQ(c.port, 6000);
    EXPECT_EQ(c.ack_timeout_ms, 150u);
    EXPECT_EQ(c.max_retries, 0u);
    EXPECT_EQ(c.output_dir, "/tmp/udpconv-out");

    auto p = xfer::RetryPolicy::from_config(c);
    EXPECT_EQ(p.ack_timeout.count(), 150);
    EXPECT_EQ(p.max_retries, 0u);
}

TEST(Env_Config, InvalidValuesAreIgnoredWithWarning)
{
    EnvGuard port("UDPCONV_PORT"), ack("UDPCONV_ACK_TIMEOUT_MS"), retries("UDPCONV_MAX_RETRIES");
    port.set("70000");
    ack.set("fast");
    retries.set("-1");

    udpconv::set_log_level(udpconv::Level::Info);
    testing::internal::CaptureStderr();
    auto        c   = config::load_from_env(config::Role::Client);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c.port, constants::SERVER_PORT);
    EXPECT_EQ(c.ack_timeout_ms, constants::ACK_TIMEOUT_MS);
    EXPECT_EQ(c.max_retries, constants::MAX_RETRIES);
    EXPECT_NE(err.find("UDPCONV_PORT"), std::string::npos);
    EXPECT_NE(err.find("UDPCONV_ACK_TIMEOUT_MS"), std::string::npos);
}

TEST(Env_Config, ParseU32)
{
    std::uint32_t v = 0;
    EXPECT_TRUE(config::parse_u32("42", 0, 100, v));
    EXPECT_EQ(v, 42u);
    EXPECT_FALSE(config::parse_u32("101", 0, 100, v));
    EXPECT_FALSE(config::parse_u32("4x", 0, 100, v));
    EXPECT_FALSE(config::parse_u32("", 0, 100, v));
    EXPECT_FALSE(config::parse_u32(nullptr, 0, 100, v));
    EXPECT_FALSE(config::parse_u32("-3", 0, 100, v));
}

TEST(ExitCodes, MapErrors)
{
    using udpconv::Error;
    EXPECT_EQ(exitc::from_error(Error::Ok), 0);
    EXPECT_EQ(exitc::from_error(Error::InvalidArgument), exitc::bad_args);
    EXPECT_EQ(exitc::from_error(Error::Io), exitc::io);
    EXPECT_EQ(exitc::from_error(Error::TransferTimeout), exitc::timeout);
    EXPECT_EQ(exitc::from_error(Error::IntegrityMismatch), exitc::integrity);
    EXPECT_EQ(exitc::from_error(Error::PeerRejected), exitc::rejected);
    EXPECT_EQ(exitc::from_error(Error::Conversion), exitc::rejected);
    EXPECT_STREQ(udpconv::error_name(Error::IntegrityMismatch), "integrity_mismatch");
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace udpconv;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    // unknown names fall back to INFO
    set_log_level_by_name("verbose");
    EXPECT_EQ(global_level(), Level::Info);
    set_log_level_by_name(nullptr);
    EXPECT_EQ(global_level(), Level::Info);
}
