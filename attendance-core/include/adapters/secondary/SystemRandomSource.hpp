#pragma once

#include "ports/output/IRandomSource.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <thread>

namespace proximity::adapters::secondary {

/**
 * @brief Источник случайных байт на основе std::random_device
 *
 * Если устройство энтропии ОС недоступно, переключается на mt19937_64
 * и сообщает isSecure() == false: такие токены помечаются как degraded.
 */
class SystemRandomSource : public ports::output::IRandomSource {
public:
    SystemRandomSource() {
        try {
            device_ = std::make_unique<std::random_device>("/dev/urandom");
            secure_ = true;
        } catch (const std::exception& e) {
            std::cerr << "[SystemRandomSource] Secure device unavailable (" << e.what()
                      << "), falling back to mt19937_64" << std::endl;
            fallback_.seed(fallbackSeed());
            secure_ = false;
        }
    }

    /**
     * @brief Зерно для mt19937_64: два таймера и идентификатор потока
     */
    static uint64_t fallbackSeed() {
        auto wall = static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
        auto mono = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        auto thread = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
        return wall ^ (mono << 1) ^ (thread * 0x9E3779B97F4A7C15ULL);
    }

    bool isSecure() const override {
        return secure_;
    }

    void fill(uint8_t* buffer, size_t size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < size; ++i) {
            if (secure_) {
                buffer[i] = static_cast<uint8_t>((*device_)() & 0xFF);
            } else {
                buffer[i] = static_cast<uint8_t>(fallback_() & 0xFF);
            }
        }
    }

private:
    std::unique_ptr<std::random_device> device_;
    std::mt19937_64 fallback_;
    bool secure_ = false;
    std::mutex mutex_;
};

} // namespace proximity::adapters::secondary
