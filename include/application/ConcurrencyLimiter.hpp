#pragma once

#include "application/SessionStore.hpp"
#include "domain/enums/EvictionPolicy.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace session::application {

/**
 * @brief Решение о допуске новой сессии
 */
struct AdmissionDecision {
    std::vector<std::string> expiredTokens;   ///< Истёкшие сессии пользователя, подлежат удалению
    std::vector<std::string> evictedTokens;   ///< Живые сессии, вытесняемые по лимиту
    std::size_t liveSessions = 0;             ///< Живые сессии до вытеснения
};

/**
 * @brief Ограничение числа одновременных сессий пользователя
 *
 * Считает активные неистёкшие сессии. Если их уже maxConcurrent или больше,
 * выбирает жертву по политике так, чтобы после допуска новой сессии
 * живых осталось ровно maxConcurrent. При равенстве ключей побеждает
 * более ранняя по порядку вставки.
 *
 * Сам ничего не удаляет: решение исполняет SessionManager под своим mutex.
 */
class ConcurrencyLimiter {
public:
    ConcurrencyLimiter(int maxConcurrentSessions, domain::EvictionPolicy policy)
        : maxConcurrentSessions_(static_cast<std::size_t>(maxConcurrentSessions))
        , policy_(policy)
    {}

    AdmissionDecision admit(const SessionStore& store,
                            const std::string& userId,
                            domain::TimePoint now) const {
        AdmissionDecision decision;

        std::vector<std::string> live;
        for (const auto& token : store.tokensForUser(userId)) {
            const auto* record = store.find(token);
            if (!record) {
                continue;
            }
            if (record->isExpiredAt(now)) {
                decision.expiredTokens.push_back(token);
            } else if (record->isActive) {
                live.push_back(token);
            }
        }

        decision.liveSessions = live.size();

        while (live.size() >= maxConcurrentSessions_) {
            auto victim = selectVictim(store, live);
            decision.evictedTokens.push_back(live[victim]);
            live.erase(live.begin() + static_cast<std::ptrdiff_t>(victim));
        }

        return decision;
    }

    std::size_t maxConcurrentSessions() const { return maxConcurrentSessions_; }
    domain::EvictionPolicy policy() const { return policy_; }

private:
    std::size_t maxConcurrentSessions_;
    domain::EvictionPolicy policy_;

    domain::TimePoint evictionKey(const domain::SessionRecord& record) const {
        return policy_ == domain::EvictionPolicy::LEAST_RECENTLY_ACTIVE
            ? record.lastActivity
            : record.createdAt;
    }

    // Строгое сравнение: при равенстве остаётся первый по порядку вставки
    std::size_t selectVictim(const SessionStore& store,
                             const std::vector<std::string>& candidates) const {
        std::size_t victim = 0;
        auto victimKey = evictionKey(*store.find(candidates[0]));
        for (std::size_t i = 1; i < candidates.size(); ++i) {
            auto key = evictionKey(*store.find(candidates[i]));
            if (key < victimKey) {
                victim = i;
                victimKey = key;
            }
        }
        return victim;
    }
};

} // namespace session::application
