#pragma once

#include "ports/input/ISessionManager.hpp"
#include "domain/RequestMetadata.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace session::adapters::primary {

/// Заголовки запроса (имена сравниваются без учёта регистра)
using Headers = std::map<std::string, std::string>;

/**
 * @brief Результат проверки запроса
 */
struct GuardResult {
    bool authorized = false;
    int status = 401;
    nlohmann::json body;                        ///< {"error": "..."} при отказе
    Headers headers;                            ///< Доп. заголовки ответа (WWW-Authenticate)
    std::optional<domain::SessionRecord> session;
};

/**
 * @brief Проверка session-токена для защищённых маршрутов
 *
 * Токен берётся из "Authorization: Bearer <token>" либо из cookie
 * "session_token". Коды ответа:
 * - 401 + WWW-Authenticate: Bearer - нужна повторная аутентификация
 *   (нет токена, INVALID_TOKEN, SESSION_EXPIRED, SESSION_INACTIVE, SECURITY_MISMATCH)
 * - 403 - REFRESH_LIMIT_EXCEEDED или нет ни одной из требуемых ролей
 * - 500 - INTERNAL_ERROR
 */
class SessionGuard {
public:
    static constexpr const char* kSessionCookieName = "session_token";

    explicit SessionGuard(std::shared_ptr<ports::input::ISessionManager> sessionManager)
        : sessionManager_(std::move(sessionManager))
    {}

    /**
     * @brief Проверить запрос
     *
     * @param clientIp IP клиента (определяется транспортом)
     * @param headers Заголовки запроса
     * @param acceptedRoles Роли, любой из которых достаточно; пусто - роли не проверяются
     */
    GuardResult authorize(const std::string& clientIp,
                          const Headers& headers,
                          const std::set<std::string>& acceptedRoles = {}) const {
        auto token = extractToken(headers);
        if (!token) {
            return reject(401, "Authentication required");
        }

        auto result = sessionManager_->validateSession(*token, extractMetadata(clientIp, headers));
        if (!result.success) {
            return reject(statusFor(result.error), result.message);
        }

        if (!acceptedRoles.empty()) {
            bool allowed = std::any_of(acceptedRoles.begin(), acceptedRoles.end(),
                [&](const std::string& role) { return result.session.hasRole(role); });
            if (!allowed) {
                return reject(403, "Insufficient permissions");
            }
        }

        GuardResult granted;
        granted.authorized = true;
        granted.status = 200;
        granted.session = result.session;
        return granted;
    }

    /**
     * @brief HTTP-статус для ошибки сессии
     */
    static int statusFor(domain::SessionError error) {
        switch (error) {
            case domain::SessionError::NONE:
                return 200;
            case domain::SessionError::INVALID_TOKEN:
            case domain::SessionError::SESSION_EXPIRED:
            case domain::SessionError::SESSION_INACTIVE:
            case domain::SessionError::SECURITY_MISMATCH:
                return 401;
            case domain::SessionError::REFRESH_LIMIT_EXCEEDED:
                return 403;
            case domain::SessionError::INTERNAL_ERROR:
                return 500;
        }
        return 500;
    }

    /**
     * @brief Извлечь токен: сначала Bearer, затем cookie
     */
    static std::optional<std::string> extractToken(const Headers& headers) {
        if (auto auth = findHeader(headers, "authorization")) {
            static const std::string kBearer = "bearer ";
            if (auth->size() > kBearer.size() && toLower(auth->substr(0, kBearer.size())) == kBearer) {
                std::string token = trim(auth->substr(kBearer.size()));
                if (!token.empty()) {
                    return token;
                }
            }
        }

        if (auto cookie = findHeader(headers, "cookie")) {
            // "a=1; session_token=xyz; b=2"
            std::size_t pos = 0;
            while (pos <= cookie->size()) {
                std::size_t end = cookie->find(';', pos);
                if (end == std::string::npos) end = cookie->size();
                std::string pair = trim(cookie->substr(pos, end - pos));
                std::size_t eq = pair.find('=');
                if (eq != std::string::npos && trim(pair.substr(0, eq)) == kSessionCookieName) {
                    std::string value = trim(pair.substr(eq + 1));
                    if (!value.empty()) {
                        return value;
                    }
                }
                pos = end + 1;
            }
        }

        return std::nullopt;
    }

    static domain::RequestMetadata extractMetadata(const std::string& clientIp, const Headers& headers) {
        domain::RequestMetadata metadata;
        metadata.clientIp = clientIp.empty() ? "unknown" : clientIp;
        metadata.userAgent = findHeader(headers, "user-agent").value_or("unknown");
        metadata.acceptLanguage = findHeader(headers, "accept-language").value_or("");
        metadata.acceptEncoding = findHeader(headers, "accept-encoding").value_or("");
        return metadata;
    }

private:
    std::shared_ptr<ports::input::ISessionManager> sessionManager_;

    static GuardResult reject(int status, const std::string& message) {
        GuardResult result;
        result.authorized = false;
        result.status = status;
        result.body["error"] = message;
        if (status == 401) {
            result.headers["WWW-Authenticate"] = "Bearer";
        }
        return result;
    }

    static std::optional<std::string> findHeader(const Headers& headers, const std::string& lowerName) {
        for (const auto& [name, value] : headers) {
            if (toLower(name) == lowerName) {
                return value;
            }
        }
        return std::nullopt;
    }

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    static std::string trim(const std::string& value) {
        const auto begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        const auto end = value.find_last_not_of(" \t");
        return value.substr(begin, end - begin + 1);
    }
};

} // namespace session::adapters::primary
