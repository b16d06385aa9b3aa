#pragma once

#include "domain/SessionToken.hpp"
#include "domain/enums/CollisionRisk.hpp"
#include <optional>
#include <string>

namespace proximity::domain {

/**
 * @brief Результат проверки токена SecurityValidator'ом
 */
struct TokenValidation {
    bool valid = false;
    std::optional<SessionToken> token;      ///< Нормализованный токен (если форма верна)
    double entropyBits = 0.0;
    CollisionRisk collisionRisk = CollisionRisk::HIGH;
    std::string error;
};

} // namespace proximity::domain
