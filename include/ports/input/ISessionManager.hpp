#pragma once

#include "domain/RequestMetadata.hpp"
#include "domain/SessionRecord.hpp"
#include "domain/SessionStats.hpp"
#include "domain/enums/SessionError.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace session::ports::input {

/**
 * @brief Результат создания сессии
 */
struct CreateResult {
    bool success = false;
    domain::SessionError error = domain::SessionError::NONE;
    std::string message;

    std::string sessionToken;       ///< Выданный токен (если success=true)
    domain::SessionRecord session;  ///< Снимок созданной записи
};

/**
 * @brief Результат валидации или продления сессии
 */
struct SessionResult {
    bool success = false;
    domain::SessionError error = domain::SessionError::NONE;
    std::string message;

    domain::SessionRecord session;  ///< Снимок записи (если success=true)
};

/**
 * @brief Интерфейс менеджера жизненного цикла сессий
 *
 * Типичный флоу:
 *   1. Внешний OAuth завершён -> createSession()
 *   2. Каждый защищённый запрос -> validateSession()
 *   3. Продление -> refreshSession() (не более maxRefreshes раз)
 *   4. Logout -> invalidateSession()
 *
 * Все методы потокобезопасны.
 */
class ISessionManager {
public:
    virtual ~ISessionManager() = default;

    /**
     * @brief Создать сессию после успешной внешней проверки
     *
     * При превышении лимита одновременных сессий пользователя
     * вытесняет одну старую сессию до выдачи новой.
     */
    virtual CreateResult createSession(
        const std::string& userId,
        const std::string& username,
        const std::string& accessToken,
        const std::set<std::string>& roles,
        const domain::RequestMetadata& metadata
    ) = 0;

    /**
     * @brief Получить запись без побочных эффектов
     */
    virtual std::optional<domain::SessionRecord> getSession(const std::string& token) = 0;

    /**
     * @brief Проверить токен и обновить lastActivity
     */
    virtual SessionResult validateSession(
        const std::string& token,
        const domain::RequestMetadata& metadata
    ) = 0;

    /**
     * @brief Продлить срок действия сессии
     */
    virtual SessionResult refreshSession(const std::string& token) = 0;

    /**
     * @brief Инвалидировать сессию (идемпотентно, неизвестный токен игнорируется)
     */
    virtual void invalidateSession(const std::string& token) = 0;

    /**
     * @brief Инвалидировать все сессии пользователя
     * @return Количество удалённых сессий
     */
    virtual std::size_t invalidateAllUserSessions(const std::string& userId) = 0;

    /**
     * @brief Удалить истёкшие и неактивные записи
     * @return Количество удалённых записей
     */
    virtual std::size_t cleanupExpiredSessions() = 0;

    /**
     * @brief Снимок статистики (только для мониторинга)
     */
    virtual domain::SessionStats getStats() = 0;
};

} // namespace session::ports::input
