#pragma once

#include "domain/enums/EvictionPolicy.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace session::settings {

/**
 * @brief Параметры политики безопасности сессий
 *
 * Значения по умолчанию совпадают с боевой конфигурацией.
 */
struct SecurityConfig {
    int sessionTimeoutHours = 24;
    int maxConcurrentSessions = 3;
    bool requireSameIp = false;
    bool requireSameUserAgent = false;
    int cleanupIntervalMinutes = 30;
    int tokenLength = 64;               ///< Байт энтропии в токене
    bool enableSessionFingerprinting = true;
    int maxRefreshes = 5;
    domain::EvictionPolicy evictionPolicy = domain::EvictionPolicy::OLDEST_CREATED;
};

/**
 * @brief Неизменяемые настройки безопасности сессий
 *
 * Проверяются один раз при создании и больше не меняются.
 *
 * Источники:
 * - SecurityConfig напрямую (тесты, встраивание)
 * - ENV через fromEnv():
 *   SESSION_TIMEOUT_HOURS (default: 24)
 *   SESSION_MAX_CONCURRENT (default: 3)
 *   SESSION_REQUIRE_SAME_IP (default: false)
 *   SESSION_REQUIRE_SAME_USER_AGENT (default: false)
 *   SESSION_CLEANUP_INTERVAL_MINUTES (default: 30)
 *   SESSION_TOKEN_LENGTH (default: 64)
 *   SESSION_ENABLE_FINGERPRINTING (default: true)
 *   SESSION_MAX_REFRESHES (default: 5)
 *   SESSION_EVICTION_POLICY (default: oldest_created)
 * - config.json через fromJson() (допускаются частичные переопределения)
 */
class SecuritySettings {
public:
    static constexpr int kMinTokenLength = 16;
    static constexpr int kMaxTokenLength = 1024;
    /// Верхние границы держат now + interval в пределах std::chrono
    static constexpr int kMaxSessionTimeoutHours = 24 * 365 * 100;
    static constexpr int kMaxCleanupIntervalMinutes = 60 * 24 * 365;

    SecuritySettings() : SecuritySettings(SecurityConfig{}) {}

    /**
     * @throws std::invalid_argument если конфигурация некорректна
     */
    explicit SecuritySettings(const SecurityConfig& config)
        : config_(validate(config))
    {}

    static SecuritySettings fromEnv() {
        SecurityConfig config;
        config.sessionTimeoutHours = getEnvInt("SESSION_TIMEOUT_HOURS", 24);
        config.maxConcurrentSessions = getEnvInt("SESSION_MAX_CONCURRENT", 3);
        config.requireSameIp = parseBool(getEnvOrDefault("SESSION_REQUIRE_SAME_IP", "false"));
        config.requireSameUserAgent = parseBool(getEnvOrDefault("SESSION_REQUIRE_SAME_USER_AGENT", "false"));
        config.cleanupIntervalMinutes = getEnvInt("SESSION_CLEANUP_INTERVAL_MINUTES", 30);
        config.tokenLength = getEnvInt("SESSION_TOKEN_LENGTH", 64);
        config.enableSessionFingerprinting = parseBool(getEnvOrDefault("SESSION_ENABLE_FINGERPRINTING", "true"));
        config.maxRefreshes = getEnvInt("SESSION_MAX_REFRESHES", 5);
        config.evictionPolicy = domain::evictionPolicyFromString(
            getEnvOrDefault("SESSION_EVICTION_POLICY", "oldest_created"));
        return SecuritySettings(config);
    }

    /**
     * @brief Загрузить настройки из JSON
     *
     * Отсутствующие ключи берутся по умолчанию.
     *
     * @throws std::invalid_argument при неверных типах или значениях
     */
    static SecuritySettings fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("Security config must be a JSON object");
        }

        SecurityConfig defaults;
        SecurityConfig config;
        try {
            config.sessionTimeoutHours = j.value("session_timeout_hours", defaults.sessionTimeoutHours);
            config.maxConcurrentSessions = j.value("max_concurrent_sessions", defaults.maxConcurrentSessions);
            config.requireSameIp = j.value("require_same_ip", defaults.requireSameIp);
            config.requireSameUserAgent = j.value("require_same_user_agent", defaults.requireSameUserAgent);
            config.cleanupIntervalMinutes = j.value("cleanup_interval_minutes", defaults.cleanupIntervalMinutes);
            config.tokenLength = j.value("token_length", defaults.tokenLength);
            config.enableSessionFingerprinting =
                j.value("enable_session_fingerprinting", defaults.enableSessionFingerprinting);
            config.maxRefreshes = j.value("max_refreshes", defaults.maxRefreshes);
            config.evictionPolicy = domain::evictionPolicyFromString(
                j.value("eviction_policy", domain::toString(defaults.evictionPolicy)));
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("Invalid security config: ") + e.what());
        }
        return SecuritySettings(config);
    }

    /**
     * @brief Загрузить настройки из config.json
     *
     * Берётся секция "session", если она есть, иначе весь документ.
     *
     * @throws std::runtime_error если файл не открывается
     * @throws std::invalid_argument при некорректном содержимом
     */
    static SecuritySettings fromJsonFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }

        nlohmann::json document;
        try {
            document = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Invalid JSON in " + path + ": " + e.what());
        }

        if (document.is_object() && document.contains("session")) {
            return fromJson(document.at("session"));
        }
        return fromJson(document);
    }

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"session_timeout_hours", config_.sessionTimeoutHours},
            {"max_concurrent_sessions", config_.maxConcurrentSessions},
            {"require_same_ip", config_.requireSameIp},
            {"require_same_user_agent", config_.requireSameUserAgent},
            {"cleanup_interval_minutes", config_.cleanupIntervalMinutes},
            {"token_length", config_.tokenLength},
            {"enable_session_fingerprinting", config_.enableSessionFingerprinting},
            {"max_refreshes", config_.maxRefreshes},
            {"eviction_policy", domain::toString(config_.evictionPolicy)}
        };
    }

    const SecurityConfig& config() const { return config_; }

    std::chrono::hours getSessionTimeout() const { return std::chrono::hours(config_.sessionTimeoutHours); }
    std::chrono::minutes getCleanupInterval() const { return std::chrono::minutes(config_.cleanupIntervalMinutes); }
    int getMaxConcurrentSessions() const { return config_.maxConcurrentSessions; }
    bool requireSameIp() const { return config_.requireSameIp; }
    bool requireSameUserAgent() const { return config_.requireSameUserAgent; }
    int getTokenLength() const { return config_.tokenLength; }
    bool isFingerprintingEnabled() const { return config_.enableSessionFingerprinting; }
    int getMaxRefreshes() const { return config_.maxRefreshes; }
    domain::EvictionPolicy getEvictionPolicy() const { return config_.evictionPolicy; }

private:
    SecurityConfig config_;

    static SecurityConfig validate(const SecurityConfig& config) {
        if (config.sessionTimeoutHours < 1 || config.sessionTimeoutHours > kMaxSessionTimeoutHours) {
            throw std::invalid_argument("session_timeout_hours must be in [1, "
                                        + std::to_string(kMaxSessionTimeoutHours) + "]");
        }
        if (config.maxConcurrentSessions < 1) {
            throw std::invalid_argument("max_concurrent_sessions must be >= 1");
        }
        if (config.cleanupIntervalMinutes < 1 || config.cleanupIntervalMinutes > kMaxCleanupIntervalMinutes) {
            throw std::invalid_argument("cleanup_interval_minutes must be in [1, "
                                        + std::to_string(kMaxCleanupIntervalMinutes) + "]");
        }
        if (config.tokenLength < kMinTokenLength || config.tokenLength > kMaxTokenLength) {
            throw std::invalid_argument("token_length must be in [" + std::to_string(kMinTokenLength)
                                        + ", " + std::to_string(kMaxTokenLength) + "]");
        }
        if (config.maxRefreshes < 0) {
            throw std::invalid_argument("max_refreshes must be >= 0");
        }
        return config;
    }

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    /**
     * @throws std::invalid_argument если значение не целое число целиком
     */
    static int getEnvInt(const char* name, int defaultValue) {
        const char* raw = std::getenv(name);
        if (!raw) {
            return defaultValue;
        }

        const std::string value(raw);
        std::size_t pos = 0;
        int result = 0;
        try {
            result = std::stoi(value, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid integer for ") + name + ": " + value);
        }
        if (pos != value.size()) {
            throw std::invalid_argument(std::string("Invalid integer for ") + name + ": " + value);
        }
        return result;
    }

    static bool parseBool(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
        if (value == "0" || value == "false" || value == "no" || value == "off") return false;
        throw std::invalid_argument("Invalid boolean value: " + value);
    }
};

} // namespace session::settings
