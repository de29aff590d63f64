#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace session::domain {

/**
 * @brief Снимок статистики хранилища сессий
 *
 * Только для мониторинга. Не используется для решений об авторизации.
 * Инвариант: totalSessions == activeSessions + expiredSessions.
 */
struct SessionStats {
    std::size_t totalSessions = 0;
    std::size_t activeSessions = 0;
    std::size_t expiredSessions = 0;    ///< Истёкшие или неактивные, ещё не убранные
    std::size_t uniqueUsers = 0;
    std::uint64_t fingerprintAnomalies = 0;
};

inline void to_json(nlohmann::json& j, const SessionStats& stats) {
    j = nlohmann::json{
        {"total_sessions", stats.totalSessions},
        {"active_sessions", stats.activeSessions},
        {"expired_sessions", stats.expiredSessions},
        {"unique_users", stats.uniqueUsers},
        {"fingerprint_anomalies", stats.fingerprintAnomalies}
    };
}

} // namespace session::domain
