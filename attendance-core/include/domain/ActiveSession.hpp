#pragma once

#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace proximity::domain {

/**
 * @brief Сессия внутри активного окна (элемент listActiveSessions)
 */
struct ActiveSession {
    SessionToken token;
    std::string orgId;
    std::string title;
    TimePoint startsAt;
    TimePoint endsAt;
    int attendeeCount = 0;
};

} // namespace proximity::domain
