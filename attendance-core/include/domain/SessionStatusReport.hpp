#pragma once

#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/SessionPhase.hpp"
#include <optional>
#include <string>

namespace proximity::domain {

/**
 * @brief Состояние сессии на момент запроса
 */
struct SessionStatusReport {
    SessionToken token;
    std::string orgId;
    std::string title;
    SessionPhase phase = SessionPhase::ACTIVE;
    TimePoint startsAt;
    TimePoint endsAt;
    std::optional<TimePoint> stoppedAt;
    int64_t timeRemainingSeconds = 0;   ///< 0 вне активного окна
    int attendeeCount = 0;
};

} // namespace proximity::domain
