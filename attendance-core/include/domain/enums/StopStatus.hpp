#pragma once

#include <string>
#include <stdexcept>

namespace proximity::domain {

/**
 * @brief Результат остановки сессии
 */
enum class StopStatus {
    STOPPED,   ///< Сессия остановлена (идемпотентно)
    NOT_FOUND  ///< Сессия с таким токеном не найдена
};

inline std::string toString(StopStatus value) {
    switch (value) {
        case StopStatus::STOPPED: return "stopped";
        case StopStatus::NOT_FOUND: return "not_found";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline StopStatus parseStopStatus(const std::string& str) {
    if (str == "stopped") return StopStatus::STOPPED;
    if (str == "not_found") return StopStatus::NOT_FOUND;
    throw std::invalid_argument("Unknown StopStatus: " + str);
}

} // namespace proximity::domain
