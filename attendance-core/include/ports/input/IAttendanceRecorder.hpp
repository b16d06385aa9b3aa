#pragma once

#include "domain/SessionToken.hpp"
#include "domain/enums/RecordStatus.hpp"
#include <optional>
#include <string>

namespace proximity::ports::input {

/**
 * @brief Результат отметки посещения
 */
struct RecordResult {
    domain::RecordStatus status = domain::RecordStatus::INVALID_TOKEN;
    std::optional<domain::SessionToken> token;
    bool suppressedLocally = false;     ///< Ответ из локального кэша повторов, без сети
    std::string message;
};

class IAttendanceRecorder {
public:
    virtual ~IAttendanceRecorder() = default;

    /**
     * @param rawToken Токен в любом регистре, с пробелами
     * @param memberId Участник
     */
    virtual RecordResult submit(const std::string& rawToken, const std::string& memberId) = 0;
};

} // namespace proximity::ports::input
