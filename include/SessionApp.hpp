#pragma once

#include "settings/SecuritySettings.hpp"
#include "ports/input/ISessionManager.hpp"
#include "application/CleanupScheduler.hpp"
#include "adapters/primary/SessionGuard.hpp"

#include <nlohmann/json.hpp>
#include <memory>

namespace session {

/**
 * @class SessionApp
 * @brief Корневой объект процесса: собирает граф зависимостей и управляет
 * жизненным циклом менеджера сессий
 *
 * Создаётся один раз при старте процесса и передаётся обработчикам
 * запросов по ссылке. Порядок:
 * 1. конструктор -> configureInjection() (Boost.DI)
 * 2. start() - запуск фоновой очистки
 * 3. stop() - остановка очистки с ожиданием потока
 */
class SessionApp
{
public:
    explicit SessionApp(settings::SecuritySettings settings);
    ~SessionApp();

    SessionApp(const SessionApp&) = delete;
    SessionApp& operator=(const SessionApp&) = delete;

    /**
     * @brief Запустить фоновую очистку. Повторный вызов - no-op.
     */
    void start();

    /**
     * @brief Остановить фоновую очистку и дождаться потока
     */
    void stop();

    bool isRunning() const;

    std::shared_ptr<ports::input::ISessionManager> sessionManager() const { return sessionManager_; }
    std::shared_ptr<adapters::primary::SessionGuard> sessionGuard() const { return sessionGuard_; }
    std::shared_ptr<application::CleanupScheduler> cleanupScheduler() const { return cleanupScheduler_; }
    const settings::SecuritySettings& settings() const { return *settings_; }

    /**
     * @brief Статистика для мониторинга вместе с действующей конфигурацией
     */
    nlohmann::json statsJson() const;

protected:
    /**
     * @brief Связать порты с адаптерами через Boost.DI
     */
    void configureInjection();

private:
    std::shared_ptr<settings::SecuritySettings> settings_;
    std::shared_ptr<ports::input::ISessionManager> sessionManager_;
    std::shared_ptr<adapters::primary::SessionGuard> sessionGuard_;
    std::shared_ptr<application::CleanupScheduler> cleanupScheduler_;
};

} // namespace session
