#pragma once

#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace registry::domain {

/**
 * @brief Отметка посещения. Не более одной на пару (участник, сессия).
 */
struct AttendanceRecord {
    proximity::domain::SessionToken sessionToken;
    std::string memberId;
    std::string orgId;
    proximity::domain::TimePoint recordedAt;
};

} // namespace registry::domain
