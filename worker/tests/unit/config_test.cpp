#include <gtest/gtest.h>
#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear();
        setenv("PG_DSN", "postgresql://uptime@localhost/uptime", 1);
    }

    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"PG_DSN", "WORKER_THREADS", "CHECK_INTERVAL_SECONDS", "RUN_ON_START",
                                 "TWILIO_ACCOUNT_SID", "TWILIO_AUTH_TOKEN", "TWILIO_FROM_PHONE",
                                 "LOG_ROTATION_INTERVAL_SECONDS"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsApplyWhenUnset) {
    Config config = Config::from_env();

    EXPECT_EQ(config.check_interval_seconds, 60);
    EXPECT_EQ(config.log_rotation_interval_seconds, 86400);
    EXPECT_EQ(config.max_check_timeout_seconds, 5);
    EXPECT_EQ(config.worker_threads, 8);
    EXPECT_TRUE(config.run_on_start);
    EXPECT_FALSE(config.sms_enabled());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, ReadsOverrides) {
    setenv("WORKER_THREADS", "16", 1);
    setenv("CHECK_INTERVAL_SECONDS", "30", 1);
    setenv("RUN_ON_START", "false", 1);
    setenv("TWILIO_ACCOUNT_SID", "AC123", 1);
    setenv("TWILIO_AUTH_TOKEN", "secret", 1);
    setenv("TWILIO_FROM_PHONE", "+15550001111", 1);

    Config config = Config::from_env();

    EXPECT_EQ(config.worker_threads, 16);
    EXPECT_EQ(config.check_interval_seconds, 30);
    EXPECT_FALSE(config.run_on_start);
    EXPECT_TRUE(config.sms_enabled());
}

TEST_F(ConfigTest, MissingDsnThrows) {
    unsetenv("PG_DSN");
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST_F(ConfigTest, MalformedIntegerThrows) {
    setenv("WORKER_THREADS", "eight", 1);
    EXPECT_THROW(Config::from_env(), std::runtime_error);
}

TEST_F(ConfigTest, ValidateRejectsOutOfRangeValues) {
    Config config = Config::from_env();
    config.worker_threads = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config::from_env();
    config.check_interval_seconds = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config::from_env();
    config.health_port = 70000;
    EXPECT_THROW(config.validate(), std::runtime_error);
}
