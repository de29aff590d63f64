#pragma once

#include <chrono>
#include <set>
#include <string>

namespace session::domain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Запись об аутентифицированной сессии
 *
 * Создаётся только после успешной внешней проверки (Discord OAuth).
 * accessToken хранится как есть и никогда не интерпретируется и не логируется.
 *
 * isActive - временный маркер: выставляется в false непосредственно
 * перед удалением записи из хранилища.
 */
struct SessionRecord {
    std::string userId;                 ///< Внешний ID пользователя
    std::string username;               ///< Отображаемое имя
    std::string accessToken;            ///< Upstream-токен (непрозрачный)
    std::set<std::string> roles;        ///< Плоский набор ролей
    TimePoint createdAt;                ///< Время создания
    TimePoint expiresAt;                ///< Время истечения
    TimePoint lastActivity;             ///< Последняя успешная валидация / продление
    std::string ipAddress;              ///< IP при создании
    std::string userAgent;              ///< User-Agent при создании
    std::string fingerprint;            ///< Отпечаток запроса (пусто, если выключено)
    bool isActive = true;
    int refreshCount = 0;
    int maxRefreshes = 5;

    bool isExpiredAt(TimePoint now) const {
        return now > expiresAt;
    }

    /**
     * @brief Активна и не истекла на момент now
     */
    bool isLiveAt(TimePoint now) const {
        return isActive && !isExpiredAt(now);
    }

    bool hasRole(const std::string& role) const {
        return roles.count(role) > 0;
    }

    bool canRefresh() const {
        return refreshCount < maxRefreshes;
    }
};

} // namespace session::domain
