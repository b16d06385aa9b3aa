#pragma once

#include <string>

namespace proximity::domain {

/**
 * @brief Исход разрешения одного обнаруженного маяка
 */
enum class ResolutionStatus {
    RESOLVED,           ///< Ровно один кандидат
    AMBIGUOUS,          ///< Коллизия хэша: несколько кандидатов, выбирает участник
    NO_ACTIVE_SESSION,  ///< Ноль кандидатов, штатный исход
    FETCH_FAILED,       ///< Реестр недоступен, это не промах
    FOREIGN_BEACON      ///< Чужое пространство имён или организация
};

inline std::string toString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::RESOLVED:          return "RESOLVED";
        case ResolutionStatus::AMBIGUOUS:         return "AMBIGUOUS";
        case ResolutionStatus::NO_ACTIVE_SESSION: return "NO_ACTIVE_SESSION";
        case ResolutionStatus::FETCH_FAILED:      return "FETCH_FAILED";
        case ResolutionStatus::FOREIGN_BEACON:    return "FOREIGN_BEACON";
        default: return "UNKNOWN";
    }
}

} // namespace proximity::domain
