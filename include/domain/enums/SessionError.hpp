#pragma once

#include <string>

namespace session::domain {

/**
 * @brief Вид ошибки операции с сессией
 *
 * Разделяет ожидаемые отказы (нужна повторная аутентификация)
 * и внутренние сбои сервиса.
 */
enum class SessionError {
    NONE,                   ///< Ошибки нет
    INVALID_TOKEN,          ///< Токен неизвестен (не раскрываем, существовал ли он)
    SESSION_EXPIRED,        ///< Время жизни сессии истекло
    SESSION_INACTIVE,       ///< Сессия деактивирована (logout)
    SECURITY_MISMATCH,      ///< IP / User-Agent не совпадают с сохранёнными
    REFRESH_LIMIT_EXCEEDED, ///< Исчерпан лимит продлений
    INTERNAL_ERROR          ///< Внутренний сбой (например, отказ RNG)
};

/**
 * @brief Преобразовать SessionError в строку
 */
inline std::string toString(SessionError error) {
    switch (error) {
        case SessionError::NONE:                   return "none";
        case SessionError::INVALID_TOKEN:          return "invalid_token";
        case SessionError::SESSION_EXPIRED:        return "session_expired";
        case SessionError::SESSION_INACTIVE:       return "session_inactive";
        case SessionError::SECURITY_MISMATCH:      return "security_mismatch";
        case SessionError::REFRESH_LIMIT_EXCEEDED: return "refresh_limit_exceeded";
        case SessionError::INTERNAL_ERROR:         return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Требует ли ошибка повторной аутентификации через OAuth
 *
 * @return true для всех ожидаемых отказов, false для NONE и INTERNAL_ERROR
 */
inline bool requiresReauthentication(SessionError error) {
    switch (error) {
        case SessionError::INVALID_TOKEN:
        case SessionError::SESSION_EXPIRED:
        case SessionError::SESSION_INACTIVE:
        case SessionError::SECURITY_MISMATCH:
        case SessionError::REFRESH_LIMIT_EXCEEDED:
            return true;
        case SessionError::NONE:
        case SessionError::INTERNAL_ERROR:
            return false;
    }
    return false;
}

} // namespace session::domain
