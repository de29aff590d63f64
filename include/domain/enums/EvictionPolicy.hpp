#pragma once

#include <string>
#include <stdexcept>

namespace session::domain {

/**
 * @brief Политика вытеснения при превышении лимита одновременных сессий
 */
enum class EvictionPolicy {
    OLDEST_CREATED,         ///< Вытесняется сессия с наименьшим createdAt
    LEAST_RECENTLY_ACTIVE   ///< Вытесняется сессия с наименьшим lastActivity
};

inline std::string toString(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::OLDEST_CREATED:        return "oldest_created";
        case EvictionPolicy::LEAST_RECENTLY_ACTIVE: return "least_recently_active";
    }
    return "unknown";
}

/**
 * @brief Создать EvictionPolicy из строки
 *
 * @throws std::invalid_argument если строка не распознана
 */
inline EvictionPolicy evictionPolicyFromString(const std::string& str) {
    if (str == "oldest_created")        return EvictionPolicy::OLDEST_CREATED;
    if (str == "least_recently_active") return EvictionPolicy::LEAST_RECENTLY_ACTIVE;
    throw std::invalid_argument("Unknown EvictionPolicy: " + str);
}

} // namespace session::domain
