#pragma once

#include "domain/SessionRecord.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace session::application {

/**
 * @brief Хранилище сессий: token -> запись и индекс userId -> [tokens]
 *
 * Единственный источник истины о сессиях процесса. Две структуры
 * всегда изменяются вместе и никогда не расходятся.
 *
 * @note Не синхронизировано. Все обращения идут через SessionManager,
 *       который держит единый mutex.
 */
class SessionStore {
public:
    using Records = std::unordered_map<std::string, domain::SessionRecord>;

    /**
     * @brief Добавить запись
     * @return false если токен уже занят (запись не изменяется)
     */
    bool insert(const std::string& token, const domain::SessionRecord& record) {
        if (sessions_.count(token) > 0) {
            return false;
        }
        sessions_.emplace(token, record);
        userSessions_[record.userId].push_back(token);
        return true;
    }

    domain::SessionRecord* find(const std::string& token) {
        auto it = sessions_.find(token);
        return it == sessions_.end() ? nullptr : &it->second;
    }

    const domain::SessionRecord* find(const std::string& token) const {
        auto it = sessions_.find(token);
        return it == sessions_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& token) const {
        return sessions_.count(token) > 0;
    }

    /**
     * @brief Удалить запись из основной таблицы и из индекса пользователя
     *
     * Пустой список пользователя удаляется целиком.
     *
     * @return false если токена нет
     */
    bool remove(const std::string& token) {
        auto it = sessions_.find(token);
        if (it == sessions_.end()) {
            return false;
        }

        auto userIt = userSessions_.find(it->second.userId);
        if (userIt != userSessions_.end()) {
            auto& tokens = userIt->second;
            tokens.erase(std::remove(tokens.begin(), tokens.end(), token), tokens.end());
            if (tokens.empty()) {
                userSessions_.erase(userIt);
            }
        }

        sessions_.erase(it);
        return true;
    }

    /**
     * @brief Копия списка токенов пользователя в порядке создания
     */
    std::vector<std::string> tokensForUser(const std::string& userId) const {
        auto it = userSessions_.find(userId);
        if (it == userSessions_.end()) {
            return {};
        }
        return it->second;
    }

    const Records& records() const { return sessions_; }

    std::size_t size() const { return sessions_.size(); }

    /**
     * @brief Количество пользователей хотя бы с одной записью в индексе
     */
    std::size_t userCount() const { return userSessions_.size(); }

    /**
     * @brief Проверить согласованность основной таблицы и индекса
     */
    bool isConsistent() const {
        std::size_t indexed = 0;
        std::unordered_set<std::string> seen;
        for (const auto& [userId, tokens] : userSessions_) {
            if (tokens.empty()) {
                return false;
            }
            for (const auto& token : tokens) {
                auto it = sessions_.find(token);
                if (it == sessions_.end() || it->second.userId != userId) {
                    return false;
                }
                if (!seen.insert(token).second) {
                    return false;
                }
                ++indexed;
            }
        }
        return indexed == sessions_.size();
    }

    void clear() {
        sessions_.clear();
        userSessions_.clear();
    }

private:
    Records sessions_;
    std::unordered_map<std::string, std::vector<std::string>> userSessions_;
};

} // namespace session::application
