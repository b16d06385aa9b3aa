#pragma once

#include "domain/AttendanceRecord.hpp"
#include <vector>

namespace registry::ports::output {

class IAttendanceRepository {
public:
    virtual ~IAttendanceRepository() = default;

    /**
     * @brief Атомарно вставить отметку
     * @return false, если участник уже отмечен в этой сессии
     */
    virtual bool insertIfAbsent(const domain::AttendanceRecord& record) = 0;

    virtual int countBySession(const proximity::domain::SessionToken& token) = 0;

    virtual std::vector<domain::AttendanceRecord> findBySession(
        const proximity::domain::SessionToken& token
    ) = 0;
};

} // namespace registry::ports::output
