#pragma once

#include "ports/input/ISessionManager.hpp"
#include "settings/SecuritySettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace session::application {

/**
 * @brief Фоновая периодическая очистка истёкших сессий
 *
 * Раз в interval вызывает ISessionManager::cleanupExpiredSessions().
 * Это только освобождение памяти: истечение проверяется синхронно в
 * validate/refresh и не зависит от того, запущен ли планировщик.
 *
 * Ошибка одного прохода логируется, цикл продолжает работать.
 */
class CleanupScheduler {
public:
    CleanupScheduler(
        std::shared_ptr<ports::input::ISessionManager> sessionManager,
        std::chrono::milliseconds interval)
        : sessionManager_(std::move(sessionManager))
        , interval_(interval)
        , running_(false)
        , stopRequested_(false)
        , sweepCount_(0)
        , failedSweeps_(0)
        , totalRemoved_(0)
        , lastRemoved_(0)
    {}

    CleanupScheduler(
        std::shared_ptr<ports::input::ISessionManager> sessionManager,
        const settings::SecuritySettings& settings)
        : CleanupScheduler(
              std::move(sessionManager),
              std::chrono::duration_cast<std::chrono::milliseconds>(settings.getCleanupInterval()))
    {}

    ~CleanupScheduler() {
        stop();
    }

    // Non-copyable, non-movable
    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    /**
     * @brief Запустить фоновый поток. Повторный вызов - no-op.
     */
    void start() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (running_) return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = false;
        }
        running_ = true;
        thread_ = std::thread([this]() { loop(); });

        std::cout << "[CleanupScheduler] Started (interval="
                  << interval_.count() << "ms)" << std::endl;
    }

    /**
     * @brief Остановить поток и дождаться его завершения
     *
     * Прерывает ожидание следующего прохода. Если проход уже идёт,
     * ждёт его окончания.
     */
    void stop() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (!running_) return;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
        }
        cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }
        running_ = false;

        std::cout << "[CleanupScheduler] Stopped after " << sweepCount_ << " sweeps" << std::endl;
    }

    bool isRunning() const { return running_; }

    /**
     * @brief Выполнить один проход синхронно
     * @return Количество удалённых сессий (0 при ошибке)
     */
    std::size_t runOnce() {
        try {
            const std::size_t removed = sessionManager_->cleanupExpiredSessions();
            lastRemoved_ = removed;
            totalRemoved_ += removed;
            ++sweepCount_;
            return removed;
        } catch (const std::exception& e) {
            ++failedSweeps_;
            std::cerr << "[CleanupScheduler] Session cleanup error: " << e.what() << std::endl;
            return 0;
        } catch (...) {
            ++failedSweeps_;
            std::cerr << "[CleanupScheduler] Session cleanup error: unknown exception" << std::endl;
            return 0;
        }
    }

    std::uint64_t sweepCount() const { return sweepCount_; }
    std::uint64_t failedSweeps() const { return failedSweeps_; }
    std::uint64_t totalRemoved() const { return totalRemoved_; }
    std::uint64_t lastRemoved() const { return lastRemoved_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::shared_ptr<ports::input::ISessionManager> sessionManager_;
    std::chrono::milliseconds interval_;

    std::mutex lifecycleMutex_;         ///< Сериализует start/stop
    std::mutex mutex_;                  ///< Защищает stopRequested_
    std::condition_variable cv_;
    std::thread thread_;

    std::atomic<bool> running_;
    bool stopRequested_;

    std::atomic<std::uint64_t> sweepCount_;
    std::atomic<std::uint64_t> failedSweeps_;
    std::atomic<std::uint64_t> totalRemoved_;
    std::atomic<std::uint64_t> lastRemoved_;

    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            if (cv_.wait_for(lock, interval_, [this]() { return stopRequested_; })) {
                break;
            }
            lock.unlock();
            runOnce();
            lock.lock();
        }
    }
};

} // namespace session::application
