#pragma once

#include <string>

namespace proximity::domain {

/**
 * @brief Результат операций Broadcaster::start / stop
 */
enum class BroadcastStatus {
    STARTED,
    STOPPED,
    VALIDATION_ERROR,       ///< Пустой заголовок, неверная длительность
    UNKNOWN_ORGANIZATION,   ///< Slug не имеет OrganizationCode
    ALREADY_ACTIVE,         ///< Вещатель уже занят сессией
    NOT_ACTIVE,             ///< Нечего останавливать
    RADIO_UNAVAILABLE,
    REGISTRY_REJECTED,      ///< Реестр отказал в создании сессии
    REGISTRY_UNAVAILABLE,
    INVALID_TOKEN,          ///< Реестр выдал токен, который нельзя безопасно вещать
    ORGANIZATION_MISMATCH,  ///< Реестр привязал сессию к другой организации
    WINDOW_NOT_ACTIVE       ///< Окно сессии не покрывает текущее время реестра
};

inline std::string toString(BroadcastStatus status) {
    switch (status) {
        case BroadcastStatus::STARTED:              return "STARTED";
        case BroadcastStatus::STOPPED:              return "STOPPED";
        case BroadcastStatus::VALIDATION_ERROR:     return "VALIDATION_ERROR";
        case BroadcastStatus::UNKNOWN_ORGANIZATION: return "UNKNOWN_ORGANIZATION";
        case BroadcastStatus::ALREADY_ACTIVE:       return "ALREADY_ACTIVE";
        case BroadcastStatus::NOT_ACTIVE:           return "NOT_ACTIVE";
        case BroadcastStatus::RADIO_UNAVAILABLE:    return "RADIO_UNAVAILABLE";
        case BroadcastStatus::REGISTRY_REJECTED:    return "REGISTRY_REJECTED";
        case BroadcastStatus::REGISTRY_UNAVAILABLE: return "REGISTRY_UNAVAILABLE";
        case BroadcastStatus::INVALID_TOKEN:        return "INVALID_TOKEN";
        case BroadcastStatus::ORGANIZATION_MISMATCH: return "ORGANIZATION_MISMATCH";
        case BroadcastStatus::WINDOW_NOT_ACTIVE:    return "WINDOW_NOT_ACTIVE";
        default: return "UNKNOWN";
    }
}

} // namespace proximity::domain
