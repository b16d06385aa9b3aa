#pragma once

#include "domain/Timestamp.hpp"
#include "ports/output/IClock.hpp"
#include <PeriodicTask.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>

namespace proximity::application {

/**
 * @brief Локальный таймер окончания сессии на стороне вещателя
 *
 * Периодически сообщает оставшиеся секунды и один раз вызывает onExpired,
 * когда локальные часы дошли до endsAt. Только для UI: реестр проверяет
 * окно сессии при каждой отметке независимо от этого таймера.
 */
class SessionLifecycleMonitor {
public:
    using CountdownCallback = std::function<void(int64_t remainingSeconds)>;
    using ExpiredCallback = std::function<void()>;

    explicit SessionLifecycleMonitor(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
        , task_("SessionLifecycleMonitor")
    {}

    /**
     * @brief Начать отслеживание
     * @return false, если монитор уже запущен
     */
    bool start(domain::TimePoint endsAt,
               std::chrono::milliseconds checkInterval,
               CountdownCallback onCountdown,
               ExpiredCallback onExpired) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (task_.isRunning()) {
                return false;
            }
            endsAt_ = endsAt;
            onCountdown_ = std::move(onCountdown);
            onExpired_ = std::move(onExpired);
            expiredFired_ = false;
        }

        return task_.start(checkInterval, [this]() { checkNow(); });
    }

    /**
     * @brief Остановить таймер (безопасно вызывать из onExpired)
     */
    void stop() {
        task_.stop();
    }

    /**
     * @brief Выполнить проверку синхронно
     * @return true, если сессия по локальным часам уже закончилась
     */
    bool checkNow() {
        CountdownCallback onCountdown;
        ExpiredCallback onExpired;
        domain::TimePoint endsAt;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            onCountdown = onCountdown_;
            onExpired = onExpired_;
            endsAt = endsAt_;
        }

        int64_t remaining = domain::Timestamp::secondsUntil(clock_->now(), endsAt);
        if (onCountdown) {
            onCountdown(remaining);
        }

        if (clock_->now() < endsAt) {
            return false;
        }

        if (!expiredFired_.exchange(true)) {
            std::cout << "[SessionLifecycleMonitor] Session window ended locally" << std::endl;
            if (onExpired) {
                onExpired();
            }
        }
        return true;
    }

    bool isRunning() const {
        return task_.isRunning();
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    PeriodicTask task_;

    std::mutex mutex_;
    domain::TimePoint endsAt_;
    CountdownCallback onCountdown_;
    ExpiredCallback onExpired_;
    std::atomic<bool> expiredFired_{false};
};

} // namespace proximity::application
