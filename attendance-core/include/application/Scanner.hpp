#pragma once

#include "application/ResolutionEngine.hpp"
#include "ports/input/IScanner.hpp"
#include "ports/output/IBeaconReceiver.hpp"
#include "ports/output/IBeaconTransmitter.hpp"
#include "settings/IProximitySettings.hpp"
#include <ThreadSafeQueue.hpp>

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace proximity::application {

/**
 * @brief Сканер участника
 *
 * Обнаружения от радио складываются в очередь и разрешаются одним рабочим
 * потоком в порядке поступления. Поток радио никогда не ждёт реестр.
 *
 * На каждый start() создаётся новая очередь: callback, оставшийся у
 * платформы после stop(), пишет в закрытую очередь и ничего не делает.
 */
class Scanner : public ports::input::IScanner {
public:
    Scanner(
        std::shared_ptr<ports::output::IBeaconReceiver> receiver,
        std::shared_ptr<ResolutionEngine> engine,
        std::shared_ptr<settings::IProximitySettings> settings
    ) : receiver_(std::move(receiver))
      , engine_(std::move(engine))
      , settings_(std::move(settings))
    {
        std::cout << "[Scanner] Created" << std::endl;
    }

    ~Scanner() override {
        stop();
    }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    bool start(const domain::MemberContext& member,
               std::shared_ptr<ports::input::IResolutionListener> listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == domain::ScannerState::SCANNING) {
            return true;
        }

        if (!receiver_->isAvailable()) {
            return fail("Beacon receiver is unavailable");
        }

        auto queue = std::make_shared<ThreadSafeQueue<domain::BeaconDetection>>();
        auto engine = engine_;
        std::thread worker([this, queue, engine, member, listener]() {
            workerLoop(queue, engine, member, listener);
        });

        try {
            receiver_->startListening(settings_->getBeaconNamespace(),
                [queue](const domain::BeaconDetection& detection) {
                    queue->push(detection);
                });
        } catch (const ports::output::RadioError& e) {
            queue->shutdown();
            worker.join();
            return fail(e.what());
        }

        queue_ = queue;
        worker_ = std::move(worker);
        state_ = domain::ScannerState::SCANNING;
        lastError_.clear();

        std::cout << "[Scanner] Scanning for member " << member.memberId
                  << " (" << member.memberships.size() << " organizations)" << std::endl;
        return true;
    }

    void stop() override {
        std::shared_ptr<ThreadSafeQueue<domain::BeaconDetection>> queue;
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != domain::ScannerState::SCANNING) {
                state_ = domain::ScannerState::IDLE;
                return;
            }
            state_ = domain::ScannerState::IDLE;
            queue = std::move(queue_);
            worker = std::move(worker_);
        }

        receiver_->stopListening();

        size_t dropped = queue->clear();
        queue->shutdown();

        if (worker.joinable()) {
            if (worker.get_id() == std::this_thread::get_id()) {
                // stop() из onResolution: поток завершится сам после возврата
                worker.detach();
            } else {
                worker.join();
            }
        }

        std::cout << "[Scanner] Stopped, dropped " << dropped << " pending detections" << std::endl;
    }

    void onDetected(const domain::BeaconDetection& detection) override {
        std::shared_ptr<ThreadSafeQueue<domain::BeaconDetection>> queue;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue = queue_;
        }
        if (queue) {
            queue->push(detection);
        }
    }

    domain::ScannerState state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::string lastError() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastError_;
    }

    uint64_t processedCount() const {
        return processed_.load();
    }

private:
    std::shared_ptr<ports::output::IBeaconReceiver> receiver_;
    std::shared_ptr<ResolutionEngine> engine_;
    std::shared_ptr<settings::IProximitySettings> settings_;

    mutable std::mutex mutex_;
    domain::ScannerState state_ = domain::ScannerState::IDLE;
    std::string lastError_;
    std::shared_ptr<ThreadSafeQueue<domain::BeaconDetection>> queue_;
    std::thread worker_;

    std::atomic<uint64_t> processed_{0};

    bool fail(const std::string& message) {
        state_ = domain::ScannerState::ERROR;
        lastError_ = message;
        std::cerr << "[Scanner] " << message << std::endl;
        return false;
    }

    void workerLoop(
        std::shared_ptr<ThreadSafeQueue<domain::BeaconDetection>> queue,
        std::shared_ptr<ResolutionEngine> engine,
        domain::MemberContext member,
        std::shared_ptr<ports::input::IResolutionListener> listener
    ) {
        while (auto detection = queue->pop()) {
            auto result = engine->resolve(member, *detection);
            ++processed_;

            if (!listener) {
                continue;
            }
            try {
                listener->onResolution(result);
            } catch (const std::exception& e) {
                std::cerr << "[Scanner] Resolution listener failed: " << e.what() << std::endl;
            }
        }
    }
};

} // namespace proximity::application
