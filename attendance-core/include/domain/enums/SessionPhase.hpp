#pragma once

#include <string>
#include <stdexcept>

namespace proximity::domain {

/**
 * @brief Производная фаза сессии
 */
enum class SessionPhase {
    SCHEDULED, ///< now < startsAt
    ACTIVE,    ///< startsAt <= now < endsAt, не остановлена
    EXPIRED,   ///< now >= endsAt
    STOPPED    ///< Остановлена офицером досрочно
};

inline std::string toString(SessionPhase value) {
    switch (value) {
        case SessionPhase::SCHEDULED: return "scheduled";
        case SessionPhase::ACTIVE: return "active";
        case SessionPhase::EXPIRED: return "expired";
        case SessionPhase::STOPPED: return "stopped";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline SessionPhase parseSessionPhase(const std::string& str) {
    if (str == "scheduled") return SessionPhase::SCHEDULED;
    if (str == "active") return SessionPhase::ACTIVE;
    if (str == "expired") return SessionPhase::EXPIRED;
    if (str == "stopped") return SessionPhase::STOPPED;
    throw std::invalid_argument("Unknown SessionPhase: " + str);
}

} // namespace proximity::domain
