#pragma once

#include <string>
#include <stdexcept>

namespace proximity::domain {

/**
 * @brief Результат создания сессии
 */
enum class CreateSessionStatus {
    CREATED,
    VALIDATION_ERROR,
    UNKNOWN_ORGANIZATION,
    TOKEN_GENERATION_FAILED  ///< Исчерпаны попытки получить уникальный токен
};

inline std::string toString(CreateSessionStatus value) {
    switch (value) {
        case CreateSessionStatus::CREATED: return "created";
        case CreateSessionStatus::VALIDATION_ERROR: return "validation_error";
        case CreateSessionStatus::UNKNOWN_ORGANIZATION: return "unknown_organization";
        case CreateSessionStatus::TOKEN_GENERATION_FAILED: return "token_generation_failed";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline CreateSessionStatus parseCreateSessionStatus(const std::string& str) {
    if (str == "created") return CreateSessionStatus::CREATED;
    if (str == "validation_error") return CreateSessionStatus::VALIDATION_ERROR;
    if (str == "unknown_organization") return CreateSessionStatus::UNKNOWN_ORGANIZATION;
    if (str == "token_generation_failed") return CreateSessionStatus::TOKEN_GENERATION_FAILED;
    throw std::invalid_argument("Unknown CreateSessionStatus: " + str);
}

} // namespace proximity::domain
