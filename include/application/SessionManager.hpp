#pragma once

#include "ports/input/ISessionManager.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IFingerprintProvider.hpp"
#include "ports/output/ITokenGenerator.hpp"
#include "application/ConcurrencyLimiter.hpp"
#include "application/SessionStore.hpp"
#include "settings/SecuritySettings.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace session::application {

/**
 * @brief Менеджер жизненного цикла сессий
 *
 * Выдаёт, проверяет, продлевает и отзывает session-токены после того,
 * как внешний OAuth уже подтвердил личность пользователя.
 *
 * Один mutex покрывает всё хранилище: последовательность
 * "посчитать -> вытеснить -> вставить" в createSession, парное обновление
 * таблицы и индекса при удалении, а также read-modify-write в validate/refresh.
 */
class SessionManager : public ports::input::ISessionManager {
public:
    /// Сколько раз пробуем сгенерировать токен при коллизии
    static constexpr int kMaxTokenAttempts = 3;

    SessionManager(
        std::shared_ptr<settings::SecuritySettings> settings,
        std::shared_ptr<SessionStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator,
        std::shared_ptr<ports::output::IFingerprintProvider> fingerprintProvider
    ) : settings_(std::move(settings))
      , store_(std::move(store))
      , clock_(std::move(clock))
      , tokenGenerator_(std::move(tokenGenerator))
      , fingerprintProvider_(std::move(fingerprintProvider))
      , limiter_(settings_->getMaxConcurrentSessions(), settings_->getEvictionPolicy())
    {
        std::cout << "[SessionManager] Created (timeout=" << settings_->getSessionTimeout().count()
                  << "h, max_concurrent=" << settings_->getMaxConcurrentSessions() << ")" << std::endl;
    }

    // ========================================================================
    // СОЗДАНИЕ
    // ========================================================================

    /**
     * @throws std::invalid_argument если userId пуст
     */
    ports::input::CreateResult createSession(
        const std::string& userId,
        const std::string& username,
        const std::string& accessToken,
        const std::set<std::string>& roles,
        const domain::RequestMetadata& metadata
    ) override {
        if (userId.empty()) {
            throw std::invalid_argument("userId is required to create a session");
        }

        ports::input::CreateResult result;
        const std::string fingerprint = fingerprintProvider_->compute(metadata);

        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        std::string token = allocateTokenLocked();
        if (token.empty()) {
            std::cerr << "[SessionManager] Failed to generate session token for user " << userId << std::endl;
            result.error = domain::SessionError::INTERNAL_ERROR;
            result.message = "Failed to generate session token";
            return result;
        }

        // Admission control: освобождаем место до вставки новой сессии
        auto decision = limiter_.admit(*store_, userId, now);
        for (const auto& expired : decision.expiredTokens) {
            invalidateLocked(expired);
        }
        for (const auto& evicted : decision.evictedTokens) {
            invalidateLocked(evicted);
            std::cout << "[SessionManager] Removed oldest session for user " << userId
                      << " due to limit (" << domain::toString(limiter_.policy()) << ")" << std::endl;
        }

        domain::SessionRecord record;
        record.userId = userId;
        record.username = username;
        record.accessToken = accessToken;
        record.roles = roles;
        record.createdAt = now;
        record.expiresAt = now + settings_->getSessionTimeout();
        record.lastActivity = now;
        record.ipAddress = metadata.clientIp;
        record.userAgent = metadata.userAgent;
        record.fingerprint = fingerprint;
        record.isActive = true;
        record.refreshCount = 0;
        record.maxRefreshes = settings_->getMaxRefreshes();

        if (!store_->insert(token, record)) {
            result.error = domain::SessionError::INTERNAL_ERROR;
            result.message = "Session token collision";
            return result;
        }

        std::cout << "[SessionManager] Created session for user " << username << " (ID: " << userId
                  << ") from " << metadata.clientIp << " with roles: " << formatRoles(roles) << std::endl;

        result.success = true;
        result.message = "Session created";
        result.sessionToken = token;
        result.session = record;
        return result;
    }

    std::optional<domain::SessionRecord> getSession(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* record = store_->find(token);
        if (!record) {
            return std::nullopt;
        }
        return *record;
    }

    // ========================================================================
    // ВАЛИДАЦИЯ
    // ========================================================================

    ports::input::SessionResult validateSession(
        const std::string& token,
        const domain::RequestMetadata& metadata
    ) override {
        if (token.empty()) {
            return failure(domain::SessionError::INVALID_TOKEN);
        }

        const std::string fingerprint = fingerprintProvider_->compute(metadata);

        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        auto* record = store_->find(token);
        if (!record) {
            return failure(domain::SessionError::INVALID_TOKEN);
        }

        if (!record->isActive) {
            return failure(domain::SessionError::SESSION_INACTIVE);
        }

        if (record->isExpiredAt(now)) {
            invalidateLocked(token);
            return failure(domain::SessionError::SESSION_EXPIRED);
        }

        if (settings_->requireSameIp() && record->ipAddress != metadata.clientIp) {
            std::cerr << "[SessionManager] Session IP mismatch for user " << record->userId << ": "
                      << record->ipAddress << " vs " << metadata.clientIp << std::endl;
            return failure(domain::SessionError::SECURITY_MISMATCH);
        }

        if (settings_->requireSameUserAgent() && record->userAgent != metadata.userAgent) {
            std::cerr << "[SessionManager] Session User-Agent mismatch for user " << record->userId << std::endl;
            return failure(domain::SessionError::SECURITY_MISMATCH);
        }

        // Отпечаток - только сигнал аномалии, отказа по нему нет
        if (!record->fingerprint.empty() && !fingerprint.empty() && record->fingerprint != fingerprint) {
            ++fingerprintAnomalies_;
            std::cerr << "[SessionManager] Session fingerprint drift for user " << record->userId << std::endl;
        }

        record->lastActivity = now;
        return success(*record);
    }

    // ========================================================================
    // ПРОДЛЕНИЕ
    // ========================================================================

    ports::input::SessionResult refreshSession(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        auto* record = store_->find(token);
        if (!record) {
            return failure(domain::SessionError::INVALID_TOKEN);
        }

        if (!record->isActive) {
            return failure(domain::SessionError::SESSION_INACTIVE);
        }

        if (record->isExpiredAt(now)) {
            invalidateLocked(token);
            return failure(domain::SessionError::SESSION_EXPIRED);
        }

        if (!record->canRefresh()) {
            const std::string userId = record->userId;
            invalidateLocked(token);
            std::cout << "[SessionManager] Refresh limit exceeded for user " << userId << std::endl;
            return failure(domain::SessionError::REFRESH_LIMIT_EXCEEDED);
        }

        record->expiresAt = now + settings_->getSessionTimeout();
        record->refreshCount += 1;
        record->lastActivity = now;

        std::cout << "[SessionManager] Refreshed session for user " << record->userId
                  << " (" << record->refreshCount << "/" << record->maxRefreshes << ")" << std::endl;
        return success(*record);
    }

    // ========================================================================
    // ИНВАЛИДАЦИЯ
    // ========================================================================

    void invalidateSession(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        invalidateLocked(token);
    }

    std::size_t invalidateAllUserSessions(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        // Снимок: индекс пользователя меняется по мере удаления
        const auto tokens = store_->tokensForUser(userId);

        std::size_t removed = 0;
        for (const auto& token : tokens) {
            if (invalidateLocked(token)) {
                ++removed;
            }
        }

        if (removed > 0) {
            std::cout << "[SessionManager] Invalidated all sessions for user " << userId
                      << " (" << removed << ")" << std::endl;
        }
        return removed;
    }

    std::size_t cleanupExpiredSessions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        std::vector<std::string> stale;
        for (const auto& [token, record] : store_->records()) {
            if (record.isExpiredAt(now) || !record.isActive) {
                stale.push_back(token);
            }
        }

        for (const auto& token : stale) {
            invalidateLocked(token);
        }

        if (!stale.empty()) {
            std::cout << "[SessionManager] Cleaned up " << stale.size() << " expired sessions" << std::endl;
        }
        return stale.size();
    }

    // ========================================================================
    // СТАТИСТИКА
    // ========================================================================

    domain::SessionStats getStats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        domain::SessionStats stats;
        stats.totalSessions = store_->size();
        for (const auto& [token, record] : store_->records()) {
            if (record.isLiveAt(now)) {
                ++stats.activeSessions;
            } else {
                ++stats.expiredSessions;
            }
        }
        stats.uniqueUsers = store_->userCount();
        stats.fingerprintAnomalies = fingerprintAnomalies_;
        return stats;
    }

    const settings::SecuritySettings& settings() const { return *settings_; }

private:
    std::shared_ptr<settings::SecuritySettings> settings_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator_;
    std::shared_ptr<ports::output::IFingerprintProvider> fingerprintProvider_;
    ConcurrencyLimiter limiter_;

    std::mutex mutex_;
    std::uint64_t fingerprintAnomalies_ = 0;

    std::string allocateTokenLocked() {
        for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
            std::string token = tokenGenerator_->generate();
            if (token.empty()) {
                return "";
            }
            if (!store_->contains(token)) {
                return token;
            }
        }
        return "";
    }

    /**
     * @brief Пометить неактивной и удалить из таблицы и индекса
     * @return false если токена нет
     */
    bool invalidateLocked(const std::string& token) {
        auto* record = store_->find(token);
        if (!record) {
            return false;
        }

        record->isActive = false;
        const std::string userId = record->userId;
        store_->remove(token);

        std::cout << "[SessionManager] Invalidated session for user " << userId << std::endl;
        return true;
    }

    static std::string messageFor(domain::SessionError error) {
        switch (error) {
            case domain::SessionError::INVALID_TOKEN:          return "Invalid session token";
            case domain::SessionError::SESSION_EXPIRED:        return "Session expired";
            case domain::SessionError::SESSION_INACTIVE:       return "Session has been deactivated";
            case domain::SessionError::SECURITY_MISMATCH:      return "Session security validation failed";
            case domain::SessionError::REFRESH_LIMIT_EXCEEDED: return "Session refresh limit exceeded";
            case domain::SessionError::INTERNAL_ERROR:         return "Internal session error";
            case domain::SessionError::NONE:                   return "OK";
        }
        return "Unknown error";
    }

    static ports::input::SessionResult failure(domain::SessionError error) {
        ports::input::SessionResult result;
        result.success = false;
        result.error = error;
        result.message = messageFor(error);
        return result;
    }

    static ports::input::SessionResult success(const domain::SessionRecord& record) {
        ports::input::SessionResult result;
        result.success = true;
        result.message = "Valid";
        result.session = record;
        return result;
    }

    static std::string formatRoles(const std::set<std::string>& roles) {
        std::ostringstream oss;
        oss << "[";
        bool first = true;
        for (const auto& role : roles) {
            if (!first) oss << ", ";
            oss << role;
            first = false;
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace session::application
