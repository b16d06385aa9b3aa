#pragma once

#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/SessionPhase.hpp"
#include <optional>
#include <string>

namespace registry::domain {

using proximity::domain::SessionPhase;
using proximity::domain::SessionToken;
using proximity::domain::TimePoint;

/**
 * @brief Сессия посещаемости в хранилище реестра
 *
 * Активность не хранится, а вычисляется на момент запроса по часам реестра.
 */
struct SessionRecord {
    SessionToken token;
    std::string orgId;
    std::string title;
    TimePoint startsAt;
    TimePoint endsAt;
    std::optional<TimePoint> stoppedAt;
    TimePoint createdAt;

    /**
     * @brief Фаза сессии на момент now
     *
     * Истечение проверяется раньше остановки: сессия, остановленная
     * и уже дошедшая до endsAt, считается истёкшей.
     */
    SessionPhase phaseAt(TimePoint now) const {
        if (now < startsAt) {
            return SessionPhase::SCHEDULED;
        }
        if (now >= endsAt) {
            return SessionPhase::EXPIRED;
        }
        if (stoppedAt) {
            return SessionPhase::STOPPED;
        }
        return SessionPhase::ACTIVE;
    }

    bool isActiveAt(TimePoint now) const {
        return phaseAt(now) == SessionPhase::ACTIVE;
    }
};

} // namespace registry::domain
