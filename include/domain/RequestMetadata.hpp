#pragma once

#include <string>

namespace session::domain {

/**
 * @brief Метаданные входящего запроса
 *
 * Заполняются обработчиком запросов (IP клиента и заголовки).
 * Используются для привязки сессии и вычисления отпечатка.
 */
struct RequestMetadata {
    std::string clientIp = "unknown";   ///< IP клиента
    std::string userAgent = "unknown";  ///< Заголовок User-Agent
    std::string acceptLanguage;         ///< Заголовок Accept-Language
    std::string acceptEncoding;         ///< Заголовок Accept-Encoding

    RequestMetadata() = default;

    RequestMetadata(const std::string& clientIp, const std::string& userAgent)
        : clientIp(clientIp)
        , userAgent(userAgent)
    {}
};

} // namespace session::domain
