#pragma once

#include <string>

namespace proximity::domain {

/**
 * @brief Состояние вещателя (роль офицера)
 *
 * IDLE → CREATING → ADVERTISING → (STOPPING | EXPIRING) → IDLE
 */
enum class BroadcasterState {
    IDLE,
    CREATING,       ///< Сессия создаётся в реестре
    ADVERTISING,    ///< Пакет рассылается
    STOPPING,       ///< Остановка офицером (реестр ещё не подтвердил)
    EXPIRING        ///< Остановка по истечении endsAt
};

inline std::string toString(BroadcasterState state) {
    switch (state) {
        case BroadcasterState::IDLE:        return "IDLE";
        case BroadcasterState::CREATING:    return "CREATING";
        case BroadcasterState::ADVERTISING: return "ADVERTISING";
        case BroadcasterState::STOPPING:    return "STOPPING";
        case BroadcasterState::EXPIRING:    return "EXPIRING";
        default: return "UNKNOWN";
    }
}

} // namespace proximity::domain
