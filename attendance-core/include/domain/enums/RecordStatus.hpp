#pragma once

#include "domain/enums/SubmitStatus.hpp"
#include <string>

namespace proximity::domain {

/**
 * @brief Результат AttendanceRecorder::submit
 *
 * Ответы реестра плюс REGISTRY_UNAVAILABLE для сетевых сбоев.
 */
enum class RecordStatus {
    SUCCESS,
    ALREADY_RECORDED,
    SESSION_EXPIRED,
    INVALID_TOKEN,
    REGISTRY_UNAVAILABLE    ///< Транспортный сбой, можно повторить
};

inline RecordStatus fromSubmitStatus(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::SUCCESS:          return RecordStatus::SUCCESS;
        case SubmitStatus::ALREADY_RECORDED: return RecordStatus::ALREADY_RECORDED;
        case SubmitStatus::SESSION_EXPIRED:  return RecordStatus::SESSION_EXPIRED;
        case SubmitStatus::INVALID_TOKEN:    return RecordStatus::INVALID_TOKEN;
    }
    return RecordStatus::INVALID_TOKEN;
}

inline std::string toString(RecordStatus status) {
    switch (status) {
        case RecordStatus::SUCCESS:              return "SUCCESS";
        case RecordStatus::ALREADY_RECORDED:     return "ALREADY_RECORDED";
        case RecordStatus::SESSION_EXPIRED:      return "SESSION_EXPIRED";
        case RecordStatus::INVALID_TOKEN:        return "INVALID_TOKEN";
        case RecordStatus::REGISTRY_UNAVAILABLE: return "REGISTRY_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

} // namespace proximity::domain
