#pragma once

#include "application/SecurityValidator.hpp"
#include "application/SessionLifecycleMonitor.hpp"
#include "application/TokenCodec.hpp"
#include "ports/input/IBroadcaster.hpp"
#include "ports/output/IBeaconTransmitter.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/IProximitySettings.hpp"
#include <PeriodicTask.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

namespace proximity::application {

/**
 * @brief Вещатель офицера
 *
 * Владеет одной сессией за раз. Пока сессия идёт, работают две задачи:
 * цикл повторной рассылки пакета и локальный монитор окончания.
 * Обе отменяются вместе, из любого пути завершения (stop или истечение),
 * и только один из путей может перевести состояние обратно в IDLE.
 *
 * @note Пакет не рассылается, если токен или организация не проходят
 *       проверки кодека: сканер не смог бы его разрешить.
 *
 * Начало окна ставит реестр по своим часам. Локальный монитор отсчитывает
 * оставшуюся длительность (endsAt - registryNow) от часов устройства,
 * поэтому сдвиг часов офицера не сокращает и не продлевает вещание.
 */
class Broadcaster : public ports::input::IBroadcaster {
public:
    Broadcaster(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<ports::output::IBeaconTransmitter> transmitter,
        std::shared_ptr<TokenCodec> codec,
        std::shared_ptr<SecurityValidator> validator,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::IProximitySettings> settings
    ) : registry_(std::move(registry))
      , transmitter_(std::move(transmitter))
      , codec_(std::move(codec))
      , validator_(std::move(validator))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
      , advertiseTask_("Advertiser")
      , monitor_(clock_)
    {
        std::cout << "[Broadcaster] Created" << std::endl;
    }

    ~Broadcaster() override {
        // Без timersMutex_: поток монитора может ждать его внутри onLocalExpiry
        advertiseTask_.stop();
        monitor_.stop();
        haltTransmitter();
    }

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    ports::input::BroadcastResult start(
        const domain::OfficerContext& officer,
        const std::string& title,
        int64_t durationSeconds
    ) override {
        // Валидация до радио и реестра
        if (trim(title).empty()) {
            return failure(domain::BroadcastStatus::VALIDATION_ERROR, "Title is required");
        }
        if (durationSeconds <= 0 || durationSeconds > settings_->getMaxSessionSeconds()) {
            return failure(domain::BroadcastStatus::VALIDATION_ERROR,
                "Duration must be between 1 and " + std::to_string(settings_->getMaxSessionSeconds()) + " seconds");
        }
        if (officer.organization.orgId.empty()) {
            return failure(domain::BroadcastStatus::VALIDATION_ERROR, "Organization id is required");
        }
        auto orgCode = codec_->orgCode(officer.organization.orgSlug);
        if (!orgCode) {
            return failure(domain::BroadcastStatus::UNKNOWN_ORGANIZATION,
                "Unknown organization: " + officer.organization.orgSlug);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != domain::BroadcasterState::IDLE) {
                return failure(domain::BroadcastStatus::ALREADY_ACTIVE,
                    "Broadcaster is " + domain::toString(state_));
            }
            state_ = domain::BroadcasterState::CREATING;
        }
        notifyState(domain::BroadcasterState::CREATING);

        if (!transmitter_->isAvailable()) {
            return returnToIdle(domain::BroadcastStatus::RADIO_UNAVAILABLE, "Beacon transmitter is unavailable");
        }

        ports::output::CreateSessionResult created;
        try {
            created = registry_->createSession(
                officer.organization.orgId, trim(title), std::nullopt, durationSeconds);
        } catch (const ports::output::RegistryUnavailableError& e) {
            std::cerr << "[Broadcaster] createSession failed: " << e.what() << std::endl;
            return returnToIdle(domain::BroadcastStatus::REGISTRY_UNAVAILABLE, e.what());
        }

        if (!created.created()) {
            return returnToIdle(mapCreateStatus(created.status),
                "Registry rejected session: " + domain::toString(created.status) +
                (created.message.empty() ? "" : " (" + created.message + ")"));
        }
        const domain::SessionToken token = *created.token;

        // Major в пакете должен указывать на ту же организацию, что и сессия в реестре
        if (codec_->orgCode(created.orgSlug) != orgCode) {
            abandonSession(token);
            return returnToIdle(domain::BroadcastStatus::ORGANIZATION_MISMATCH,
                "Registry organization '" + created.orgSlug + "' does not match '" +
                officer.organization.orgSlug + "'");
        }
        if (created.registryNow < created.startsAt || created.registryNow >= created.endsAt) {
            abandonSession(token);
            return returnToIdle(domain::BroadcastStatus::WINDOW_NOT_ACTIVE,
                "Session window " + domain::Timestamp::format(created.startsAt) + " - " +
                domain::Timestamp::format(created.endsAt) + " does not cover registry time " +
                domain::Timestamp::format(created.registryNow));
        }
        const auto localEndsAt = clock_->now() + (created.endsAt - created.registryNow);

        auto validation = validator_->validateToken(token.value());
        if (!validation.valid) {
            abandonSession(token);
            return returnToIdle(domain::BroadcastStatus::INVALID_TOKEN,
                "Issued token failed validation: " + validation.error);
        }

        domain::BeaconPayload payload;
        payload.namespaceId = settings_->getBeaconNamespace();
        payload.major = *orgCode;
        payload.minor = TokenCodec::encodeHash(token);
        payload.txPower = settings_->getTxPower();

        try {
            transmitter_->advertise(payload);
        } catch (const ports::output::RadioError& e) {
            std::cerr << "[Broadcaster] First advertisement failed: " << e.what() << std::endl;
            abandonSession(token);
            return returnToIdle(domain::BroadcastStatus::RADIO_UNAVAILABLE, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            token_ = token;
            payload_ = payload;
            endsAt_ = localEndsAt;
            state_ = domain::BroadcasterState::ADVERTISING;
        }
        startTimers(payload, localEndsAt);
        notifyState(domain::BroadcasterState::ADVERTISING);

        std::cout << "[Broadcaster] Advertising session " << token.value()
                  << " org=" << payload.major << " hash=" << payload.minor
                  << " until " << domain::Timestamp::format(created.endsAt) << std::endl;

        ports::input::BroadcastResult result;
        result.status = domain::BroadcastStatus::STARTED;
        result.token = token;
        result.payload = payload;
        result.endsAt = created.endsAt;
        result.message = "Advertising";
        return result;
    }

    ports::input::BroadcastResult stop() override {
        std::optional<domain::SessionToken> token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == domain::BroadcasterState::ADVERTISING) {
                state_ = domain::BroadcasterState::STOPPING;
            } else if (state_ != domain::BroadcasterState::STOPPING) {
                return failure(domain::BroadcastStatus::NOT_ACTIVE,
                    "Nothing to stop, broadcaster is " + domain::toString(state_));
            }
            token = token_;
        }
        notifyState(domain::BroadcasterState::STOPPING);

        cancelTimers();

        domain::StopStatus stopStatus;
        try {
            stopStatus = registry_->stopSession(*token);
        } catch (const ports::output::RegistryUnavailableError& e) {
            // Передача уже остановлена, stop() можно повторить
            std::cerr << "[Broadcaster] stopSession failed: " << e.what() << std::endl;
            ports::input::BroadcastResult result;
            result.status = domain::BroadcastStatus::REGISTRY_UNAVAILABLE;
            result.token = token;
            result.message = std::string("Transmission halted, registry not updated: ") + e.what();
            return result;
        }

        if (stopStatus == domain::StopStatus::NOT_FOUND) {
            std::cerr << "[Broadcaster] Registry does not know session " << token->value() << std::endl;
        }

        resetToIdle();
        std::cout << "[Broadcaster] Session " << token->value() << " stopped" << std::endl;

        ports::input::BroadcastResult result;
        result.status = domain::BroadcastStatus::STOPPED;
        result.token = token;
        result.message = "Stopped";
        return result;
    }

    domain::BroadcasterState state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::optional<domain::SessionToken> currentToken() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return token_;
    }

    std::optional<domain::BeaconPayload> currentPayload() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return payload_;
    }

    /**
     * @brief Оставшееся время по локальным часам
     */
    int64_t remainingSeconds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != domain::BroadcasterState::ADVERTISING) {
            return 0;
        }
        return domain::Timestamp::secondsUntil(clock_->now(), endsAt_);
    }

    /**
     * @brief Синхронная проверка окончания (тот же путь, что и у таймера)
     */
    bool checkExpiryNow() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != domain::BroadcasterState::ADVERTISING) {
                return false;
            }
        }
        return monitor_.checkNow();
    }

    bool timersRunning() const {
        return advertiseTask_.isRunning() || monitor_.isRunning();
    }

    void setListener(std::shared_ptr<ports::input::IBroadcastListener> listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<ports::output::IBeaconTransmitter> transmitter_;
    std::shared_ptr<TokenCodec> codec_;
    std::shared_ptr<SecurityValidator> validator_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::IProximitySettings> settings_;

    PeriodicTask advertiseTask_;
    SessionLifecycleMonitor monitor_;

    std::mutex timersMutex_;
    mutable std::mutex mutex_;
    domain::BroadcasterState state_ = domain::BroadcasterState::IDLE;
    std::optional<domain::SessionToken> token_;
    std::optional<domain::BeaconPayload> payload_;
    domain::TimePoint endsAt_;
    std::shared_ptr<ports::input::IBroadcastListener> listener_;

    void onLocalExpiry() {
        std::optional<domain::SessionToken> token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != domain::BroadcasterState::ADVERTISING) {
                return;
            }
            state_ = domain::BroadcasterState::EXPIRING;
            token = token_;
        }
        notifyState(domain::BroadcasterState::EXPIRING);

        cancelTimers();

        try {
            registry_->stopSession(*token);
        } catch (const ports::output::RegistryUnavailableError& e) {
            // Реестр сам отклонит поздние отметки по своим часам
            std::cerr << "[Broadcaster] stopSession on expiry failed: " << e.what() << std::endl;
        }

        resetToIdle();
        std::cout << "[Broadcaster] Session " << token->value() << " expired" << std::endl;
    }

    /**
     * @note Под timersMutex_: stop/истечение, пришедшие во время запуска,
     *       дождутся его и отменят обе задачи.
     */
    void startTimers(const domain::BeaconPayload& payload, domain::TimePoint endsAt) {
        std::lock_guard<std::mutex> timersLock(timersMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != domain::BroadcasterState::ADVERTISING) {
                return;
            }
        }

        auto transmitter = transmitter_;
        advertiseTask_.start(settings_->getAdvertiseInterval(), [transmitter, payload]() {
            transmitter->advertise(payload);
        });
        monitor_.start(
            endsAt,
            settings_->getExpiryCheckInterval(),
            [this](int64_t remaining) { notifyCountdown(remaining); },
            [this]() { onLocalExpiry(); });
    }

    void cancelTimers() {
        std::lock_guard<std::mutex> timersLock(timersMutex_);
        advertiseTask_.stop();
        monitor_.stop();
        haltTransmitter();
    }

    void haltTransmitter() {
        try {
            transmitter_->halt();
        } catch (const ports::output::RadioError& e) {
            std::cerr << "[Broadcaster] halt() failed: " << e.what() << std::endl;
        }
    }

    void abandonSession(const domain::SessionToken& token) {
        try {
            registry_->stopSession(token);
        } catch (const ports::output::RegistryUnavailableError& e) {
            std::cerr << "[Broadcaster] Could not stop abandoned session " << token.value()
                      << ": " << e.what() << std::endl;
        }
    }

    void resetToIdle() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = domain::BroadcasterState::IDLE;
            token_.reset();
            payload_.reset();
        }
        notifyState(domain::BroadcasterState::IDLE);
    }

    ports::input::BroadcastResult returnToIdle(domain::BroadcastStatus status, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = domain::BroadcasterState::IDLE;
        }
        notifyState(domain::BroadcasterState::IDLE);
        return failure(status, message);
    }

    static ports::input::BroadcastResult failure(domain::BroadcastStatus status, const std::string& message) {
        std::cerr << "[Broadcaster] " << domain::toString(status) << ": " << message << std::endl;
        ports::input::BroadcastResult result;
        result.status = status;
        result.message = message;
        return result;
    }

    static domain::BroadcastStatus mapCreateStatus(domain::CreateSessionStatus status) {
        switch (status) {
            case domain::CreateSessionStatus::VALIDATION_ERROR:
                return domain::BroadcastStatus::VALIDATION_ERROR;
            case domain::CreateSessionStatus::UNKNOWN_ORGANIZATION:
                return domain::BroadcastStatus::UNKNOWN_ORGANIZATION;
            default:
                return domain::BroadcastStatus::REGISTRY_REJECTED;
        }
    }

    void notifyState(domain::BroadcasterState state) {
        std::shared_ptr<ports::input::IBroadcastListener> listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = listener_;
        }
        if (listener) {
            listener->onStateChanged(state);
        }
    }

    void notifyCountdown(int64_t remaining) {
        std::shared_ptr<ports::input::IBroadcastListener> listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = listener_;
        }
        if (listener) {
            listener->onCountdown(remaining);
        }
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }
};

} // namespace proximity::application
