#include <gtest/gtest.h>

#include "domain/SessionRecord.hpp"
#include "settings/SecuritySettings.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace session;
using session::settings::SecurityConfig;
using session::settings::SecuritySettings;

class SecuritySettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& name : touchedEnv_) {
            unsetenv(name.c_str());
        }
        if (!tempFile_.empty()) {
            std::remove(tempFile_.c_str());
        }
    }

    void setEnv(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        touchedEnv_.push_back(name);
    }

    std::string writeTempFile(const std::string& content) {
        tempFile_ = ::testing::TempDir() + "session_settings_test.json";
        std::ofstream out(tempFile_);
        out << content;
        return tempFile_;
    }

    std::vector<std::string> touchedEnv_;
    std::string tempFile_;
};

// ============================================
// DEFAULTS / VALIDATION
// ============================================

TEST_F(SecuritySettingsTest, Defaults) {
    SecuritySettings settings;

    EXPECT_EQ(settings.getSessionTimeout(), std::chrono::hours(24));
    EXPECT_EQ(settings.getMaxConcurrentSessions(), 3);
    EXPECT_FALSE(settings.requireSameIp());
    EXPECT_FALSE(settings.requireSameUserAgent());
    EXPECT_EQ(settings.getCleanupInterval(), std::chrono::minutes(30));
    EXPECT_EQ(settings.getTokenLength(), 64);
    EXPECT_TRUE(settings.isFingerprintingEnabled());
    EXPECT_EQ(settings.getMaxRefreshes(), 5);
    EXPECT_EQ(settings.getEvictionPolicy(), domain::EvictionPolicy::OLDEST_CREATED);
}

TEST_F(SecuritySettingsTest, RejectsNonPositiveValues) {
    SecurityConfig timeout;
    timeout.sessionTimeoutHours = 0;
    EXPECT_THROW(SecuritySettings{timeout}, std::invalid_argument);

    SecurityConfig concurrent;
    concurrent.maxConcurrentSessions = 0;
    EXPECT_THROW(SecuritySettings{concurrent}, std::invalid_argument);

    SecurityConfig cleanup;
    cleanup.cleanupIntervalMinutes = -5;
    EXPECT_THROW(SecuritySettings{cleanup}, std::invalid_argument);

    SecurityConfig refreshes;
    refreshes.maxRefreshes = -1;
    EXPECT_THROW(SecuritySettings{refreshes}, std::invalid_argument);
}

TEST_F(SecuritySettingsTest, RejectsOverflowingDurations) {
    SecurityConfig timeout;
    timeout.sessionTimeoutHours = 3000000;
    EXPECT_THROW(SecuritySettings{timeout}, std::invalid_argument);

    SecurityConfig cleanup;
    cleanup.cleanupIntervalMinutes = 200000000;
    EXPECT_THROW(SecuritySettings{cleanup}, std::invalid_argument);

    SecurityConfig longest;
    longest.sessionTimeoutHours = SecuritySettings::kMaxSessionTimeoutHours;
    longest.cleanupIntervalMinutes = SecuritySettings::kMaxCleanupIntervalMinutes;
    SecuritySettings settings(longest);

    // Самый долгий таймаут всё ещё даёт expiresAt позже текущего момента
    const auto now = domain::Clock::now();
    EXPECT_GT(now + settings.getSessionTimeout(), now);
}

TEST_F(SecuritySettingsTest, FromJson_OverflowingTimeoutRejected) {
    const nlohmann::json config = {{"session_timeout_hours", 3000000}};

    EXPECT_THROW(SecuritySettings::fromJson(config), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, TokenLengthBounds) {
    SecurityConfig config;
    config.tokenLength = SecuritySettings::kMinTokenLength - 1;
    EXPECT_THROW(SecuritySettings{config}, std::invalid_argument);

    config.tokenLength = SecuritySettings::kMaxTokenLength + 1;
    EXPECT_THROW(SecuritySettings{config}, std::invalid_argument);

    config.tokenLength = SecuritySettings::kMinTokenLength;
    EXPECT_NO_THROW(SecuritySettings{config});
}

TEST_F(SecuritySettingsTest, ZeroRefreshesIsValid) {
    SecurityConfig config;
    config.maxRefreshes = 0;

    EXPECT_EQ(SecuritySettings(config).getMaxRefreshes(), 0);
}

// ============================================
// ENV
// ============================================

TEST_F(SecuritySettingsTest, FromEnv_Overrides) {
    setEnv("SESSION_TIMEOUT_HOURS", "8");
    setEnv("SESSION_MAX_CONCURRENT", "5");
    setEnv("SESSION_REQUIRE_SAME_IP", "true");
    setEnv("SESSION_REQUIRE_SAME_USER_AGENT", "YES");
    setEnv("SESSION_ENABLE_FINGERPRINTING", "0");
    setEnv("SESSION_MAX_REFRESHES", "2");
    setEnv("SESSION_EVICTION_POLICY", "least_recently_active");

    auto settings = SecuritySettings::fromEnv();

    EXPECT_EQ(settings.getSessionTimeout(), std::chrono::hours(8));
    EXPECT_EQ(settings.getMaxConcurrentSessions(), 5);
    EXPECT_TRUE(settings.requireSameIp());
    EXPECT_TRUE(settings.requireSameUserAgent());
    EXPECT_FALSE(settings.isFingerprintingEnabled());
    EXPECT_EQ(settings.getMaxRefreshes(), 2);
    EXPECT_EQ(settings.getEvictionPolicy(), domain::EvictionPolicy::LEAST_RECENTLY_ACTIVE);
    EXPECT_EQ(settings.getTokenLength(), 64);
}

TEST_F(SecuritySettingsTest, FromEnv_InvalidBoolean) {
    setEnv("SESSION_REQUIRE_SAME_IP", "maybe");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, FromEnv_UnknownPolicy) {
    setEnv("SESSION_EVICTION_POLICY", "random");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, FromEnv_TrailingGarbageRejected) {
    setEnv("SESSION_TIMEOUT_HOURS", "24h");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, FromEnv_NonNumericRejected) {
    setEnv("SESSION_TOKEN_LENGTH", "long");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, FromEnv_IntegerOverflowRejected) {
    setEnv("SESSION_MAX_REFRESHES", "99999999999999999999");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, FromEnv_OutOfRangeValue) {
    setEnv("SESSION_MAX_CONCURRENT", "0");

    EXPECT_THROW(SecuritySettings::fromEnv(), std::invalid_argument);
}

// ============================================
// JSON
// ============================================

TEST_F(SecuritySettingsTest, FromJson_PartialOverride) {
    auto settings = SecuritySettings::fromJson({
        {"max_concurrent_sessions", 1},
        {"require_same_ip", true}
    });

    EXPECT_EQ(settings.getMaxConcurrentSessions(), 1);
    EXPECT_TRUE(settings.requireSameIp());
    EXPECT_EQ(settings.getSessionTimeout(), std::chrono::hours(24));
    EXPECT_EQ(settings.getMaxRefreshes(), 5);
}

TEST_F(SecuritySettingsTest, FromJson_WrongTypeRejected) {
    const nlohmann::json wrongType = {{"session_timeout_hours", "long"}};

    EXPECT_THROW(SecuritySettings::fromJson(wrongType), std::invalid_argument);
    EXPECT_THROW(SecuritySettings::fromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST_F(SecuritySettingsTest, ToJson_RoundTrip) {
    SecurityConfig config;
    config.sessionTimeoutHours = 12;
    config.evictionPolicy = domain::EvictionPolicy::LEAST_RECENTLY_ACTIVE;
    SecuritySettings saved(config);

    auto restored = SecuritySettings::fromJson(saved.toJson());

    EXPECT_EQ(restored.toJson(), saved.toJson());
    EXPECT_EQ(saved.toJson()["eviction_policy"].get<std::string>(), "least_recently_active");
}

TEST_F(SecuritySettingsTest, FromJsonFile_UsesSessionSection) {
    auto path = writeTempFile(R"({"server": {"port": 8080}, "session": {"session_timeout_hours": 6}})");

    auto settings = SecuritySettings::fromJsonFile(path);

    EXPECT_EQ(settings.getSessionTimeout(), std::chrono::hours(6));
}

TEST_F(SecuritySettingsTest, FromJsonFile_Missing) {
    EXPECT_THROW(SecuritySettings::fromJsonFile("/nonexistent/session.json"), std::runtime_error);
}

TEST_F(SecuritySettingsTest, FromJsonFile_Malformed) {
    auto path = writeTempFile("{ not json");

    EXPECT_THROW(SecuritySettings::fromJsonFile(path), std::invalid_argument);
}
