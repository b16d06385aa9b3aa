#pragma once

#include <string>

namespace proximity::domain {

enum class CollisionRisk {
    LOW,
    MEDIUM,
    HIGH
};

inline std::string toString(CollisionRisk risk) {
    switch (risk) {
        case CollisionRisk::LOW:    return "low";
        case CollisionRisk::MEDIUM: return "medium";
        case CollisionRisk::HIGH:   return "high";
        default: return "unknown";
    }
}

/**
 * @brief Оценка стойкости генератора к коллизиям хэша
 */
enum class CollisionResistance {
    EXCELLENT,  ///< < 0.1% коллизий
    GOOD,       ///< < 1%
    FAIR,       ///< < 5%
    POOR
};

inline std::string toString(CollisionResistance rating) {
    switch (rating) {
        case CollisionResistance::EXCELLENT: return "excellent";
        case CollisionResistance::GOOD:      return "good";
        case CollisionResistance::FAIR:      return "fair";
        case CollisionResistance::POOR:      return "poor";
        default: return "unknown";
    }
}

} // namespace proximity::domain
