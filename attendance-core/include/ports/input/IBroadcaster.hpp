#pragma once

#include "domain/BeaconPayload.hpp"
#include "domain/Membership.hpp"
#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/BroadcastStatus.hpp"
#include "domain/enums/BroadcasterState.hpp"
#include <memory>
#include <optional>
#include <string>

namespace proximity::ports::input {

/**
 * @brief Результат запуска/остановки вещания
 */
struct BroadcastResult {
    domain::BroadcastStatus status = domain::BroadcastStatus::NOT_ACTIVE;
    std::optional<domain::SessionToken> token;
    std::optional<domain::BeaconPayload> payload;
    domain::TimePoint endsAt;
    std::string message;
};

/**
 * @brief Наблюдатель за вещателем (UI офицера)
 *
 * Вызывается из фоновых потоков вещателя, без удержания его блокировок.
 */
class IBroadcastListener {
public:
    virtual ~IBroadcastListener() = default;
    virtual void onStateChanged(domain::BroadcasterState state) = 0;
    virtual void onCountdown(int64_t remainingSeconds) = 0;
};

/**
 * @brief Роль офицера: владеет одной активной сессией и рассылает её маяк
 */
class IBroadcaster {
public:
    virtual ~IBroadcaster() = default;

    /**
     * @brief Создать сессию в реестре и начать вещание
     */
    virtual BroadcastResult start(
        const domain::OfficerContext& officer,
        const std::string& title,
        int64_t durationSeconds
    ) = 0;

    /**
     * @brief Остановить передачу и пометить сессию остановленной в реестре
     *
     * STOPPED возвращается только после подтверждения реестра.
     */
    virtual BroadcastResult stop() = 0;

    virtual domain::BroadcasterState state() const = 0;

    virtual std::optional<domain::SessionToken> currentToken() const = 0;

    virtual void setListener(std::shared_ptr<IBroadcastListener> listener) = 0;
};

} // namespace proximity::ports::input
