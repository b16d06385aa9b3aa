#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная FIFO очередь с блокирующим pop()
 * @details
 * Порядок извлечения совпадает с порядком добавления.
 * После shutdown() новые элементы отбрасываются, а pop() возвращает
 * оставшиеся элементы и затем std::nullopt.
 * clear() позволяет выбросить необработанные элементы при отмене.
 */
template <typename T>
class ThreadSafeQueue {
private:
    std::queue<T> queue_;               ///< Внутренняя очередь
    mutable std::mutex mutex_;          ///< Мьютекс для синхронизации
    std::condition_variable condVar_;   ///< Условная переменная для ожидания
    bool shutdown_ = false;             ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue() = default;

    ~ThreadSafeQueue() {
        shutdown();
    }

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить элемент в очередь
     * @return false, если очередь уже закрыта и элемент отброшен
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return false;
            queue_.push(std::move(item));
        }

        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Извлечь элемент (блокирующий вызов)
     * @return Элемент, либо std::nullopt, если очередь закрыта и пуста
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
    }

    /**
     * @brief Выбросить все необработанные элементы
     * @return Количество выброшенных элементов
     */
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = queue_.size();
        std::queue<T>().swap(queue_);
        return dropped;
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    bool isEmpty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
