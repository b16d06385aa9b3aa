#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Периодическая фоновая задача с явным владельцем
 *
 * Вызывает tick-функцию раз в interval в отдельном потоке.
 * stop() прерывает ожидание сразу (condition_variable), а не по истечении
 * интервала, и дожидается завершения потока.
 *
 * stop() можно вызвать из самой tick-функции: тогда поток только помечается
 * остановленным и будет присоединён при следующем start()/stop() или в деструкторе.
 *
 * @example
 * ```cpp
 * PeriodicTask task("Advertiser");
 * task.start(std::chrono::milliseconds(1000), [&]() { transmitter->advertise(payload); });
 * // ...
 * task.stop();
 * ```
 *
 * Thread-safe: да
 */
class PeriodicTask {
public:
    explicit PeriodicTask(std::string name)
        : name_(std::move(name))
    {}

    ~PeriodicTask() {
        stop();
        if (workerThread_.joinable()) {
            workerThread_.detach();  // stop() из собственного потока
        }
    }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Запустить задачу
     * @param interval Интервал между вызовами (первый вызов через interval)
     * @param tick Функция, вызываемая в фоновом потоке
     * @return false, если задача уже запущена
     */
    bool start(std::chrono::milliseconds interval, std::function<void()> tick) {
        std::lock_guard<std::mutex> joinLock(joinMutex_);

        if (running_.load()) {
            return false;
        }
        joinFinishedWorker();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            interval_ = interval;
            tick_ = std::move(tick);
            running_ = true;
        }

        workerThread_ = std::thread([this]() {
            runLoop();
        });
        return true;
    }

    /**
     * @brief Остановить задачу и дождаться потока
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeUp_.notify_all();

        if (workerId_.load() == std::this_thread::get_id()) {
            return;
        }
        std::lock_guard<std::mutex> joinLock(joinMutex_);
        joinFinishedWorker();
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t tickCount() const {
        return tickCount_.load();
    }

    /**
     * @brief Выполнить один тик синхронно (для тестов)
     */
    void manualTick() {
        doTick();
    }

    const std::string& name() const {
        return name_;
    }

private:
    std::string name_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread workerThread_;
    std::atomic<std::thread::id> workerId_{};

    std::mutex mutex_;
    std::mutex joinMutex_;
    std::condition_variable wakeUp_;
    std::chrono::milliseconds interval_{1000};
    std::function<void()> tick_;

    void joinFinishedWorker() {
        if (workerThread_.joinable() && workerThread_.get_id() != std::this_thread::get_id()) {
            workerThread_.join();
            workerId_ = std::thread::id();
        }
    }

    void runLoop() {
        workerId_ = std::this_thread::get_id();
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_.load()) {
            bool stopped = wakeUp_.wait_for(lock, interval_, [this]() {
                return !running_.load();
            });
            if (stopped) {
                break;
            }

            lock.unlock();
            doTick();
            lock.lock();
        }
    }

    void doTick() {
        std::function<void()> tick;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tick = tick_;
        }
        if (!tick) {
            return;
        }

        try {
            tick();
        } catch (const std::exception& e) {
            std::cerr << "[PeriodicTask:" << name_ << "] Tick failed: " << e.what() << std::endl;
        }
        ++tickCount_;
    }
};
