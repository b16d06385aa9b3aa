#pragma once

#include <string>
#include <stdexcept>

namespace proximity::domain {

/**
 * @brief Результат регистрации посещения в реестре
 */
enum class SubmitStatus {
    SUCCESS,          ///< Запись создана
    ALREADY_RECORDED, ///< Участник уже отмечен в этой сессии
    SESSION_EXPIRED,  ///< Окно сессии закрыто (истекла, остановлена или ещё не началась)
    INVALID_TOKEN     ///< Токен неверной формы или неизвестен
};

inline std::string toString(SubmitStatus value) {
    switch (value) {
        case SubmitStatus::SUCCESS: return "success";
        case SubmitStatus::ALREADY_RECORDED: return "already_recorded";
        case SubmitStatus::SESSION_EXPIRED: return "session_expired";
        case SubmitStatus::INVALID_TOKEN: return "invalid_token";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline SubmitStatus parseSubmitStatus(const std::string& str) {
    if (str == "success") return SubmitStatus::SUCCESS;
    if (str == "already_recorded") return SubmitStatus::ALREADY_RECORDED;
    if (str == "session_expired") return SubmitStatus::SESSION_EXPIRED;
    if (str == "invalid_token") return SubmitStatus::INVALID_TOKEN;
    throw std::invalid_argument("Unknown SubmitStatus: " + str);
}

} // namespace proximity::domain
