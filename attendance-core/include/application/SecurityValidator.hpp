#pragma once

#include "domain/SessionToken.hpp"
#include "domain/TokenValidation.hpp"
#include "ports/output/IClock.hpp"
#include "settings/IProximitySettings.hpp"
#include <ThreadSafeMap.hpp>

#include <atomic>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace proximity::application {

/**
 * @brief Исход предварительной проверки перед отправкой
 */
enum class SecurityCheckStatus {
    CHECK_OK,
    MALFORMED,            ///< Неверная форма или низкая энтропия
    RECENTLY_SUBMITTED    ///< Тот же участник и токен в окне подавления повторов
};

struct SecurityCheck {
    SecurityCheckStatus status = SecurityCheckStatus::MALFORMED;
    domain::TokenValidation validation;
};

/**
 * @brief Счётчики безопасности (для экрана диагностики и логов)
 */
struct SecurityMetrics {
    uint64_t tokensValidated = 0;
    uint64_t validationFailures = 0;
    uint64_t duplicatesSuppressed = 0;
    size_t trackedSubmissions = 0;
};

/**
 * @brief Проверки токена и локальное подавление повторных отправок
 *
 * Локальный кэш повторов - только UX: он гасит случайные двойные нажатия
 * до сетевого запроса. Единственная гарантия уникальности - реестр.
 *
 * @note Энтропия считается по распределению символов (Шеннон × длина),
 *       максимум для 12 символов = 12·log2(12) ≈ 43 бита.
 */
class SecurityValidator {
public:
    SecurityValidator(
        std::shared_ptr<settings::IProximitySettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , clock_(std::move(clock))
    {
        std::cout << "[SecurityValidator] Created, min entropy "
                  << settings_->getMinTokenEntropyBits() << " bits, duplicate window "
                  << settings_->getDuplicateWindow().count() << "s" << std::endl;
    }

    /**
     * @brief Энтропия Шеннона распределения символов, умноженная на длину
     */
    static double shannonEntropyBits(const std::string& value) {
        if (value.empty()) {
            return 0.0;
        }
        std::map<char, int> frequency;
        for (char c : value) {
            frequency[c]++;
        }

        double entropy = 0.0;
        const double length = static_cast<double>(value.size());
        for (const auto& [symbol, count] : frequency) {
            double p = count / length;
            entropy -= p * std::log2(p);
        }
        return entropy * length;
    }

    /**
     * @brief Максимально достижимая энтропия токена стандартной длины
     */
    static double maxEntropyBits() {
        return std::log2(static_cast<double>(domain::TOKEN_LENGTH)) * domain::TOKEN_LENGTH;
    }

    static domain::CollisionRisk assessCollisionRisk(double entropyBits) {
        double share = entropyBits / maxEntropyBits();
        if (share >= 0.8) return domain::CollisionRisk::LOW;
        if (share >= 0.6) return domain::CollisionRisk::MEDIUM;
        return domain::CollisionRisk::HIGH;
    }

    /**
     * @brief Форма (12 символов алфавита после нормализации) и энтропия
     */
    domain::TokenValidation validateToken(const std::string& rawToken) {
        ++tokensValidated_;
        domain::TokenValidation result;

        auto token = domain::SessionToken::tryParse(rawToken);
        if (!token) {
            ++validationFailures_;
            result.error = "Token must be 12 characters from the session alphabet";
            return result;
        }

        result.token = token;
        result.entropyBits = shannonEntropyBits(token->value());
        result.collisionRisk = assessCollisionRisk(result.entropyBits);

        if (result.entropyBits < settings_->getMinTokenEntropyBits()) {
            ++validationFailures_;
            result.error = "Token entropy too low";
            return result;
        }

        result.valid = true;
        return result;
    }

    /**
     * @brief Проверка перед отправкой: форма + окно повторов
     */
    SecurityCheck check(const std::string& rawToken, const std::string& memberId) {
        SecurityCheck result;
        result.validation = validateToken(rawToken);
        if (!result.validation.valid) {
            result.status = SecurityCheckStatus::MALFORMED;
            return result;
        }

        auto key = suppressionKey(*result.validation.token, memberId);
        auto entry = recentSubmissions_.find(key);
        if (entry && clock_->now() < entry->expiresAt) {
            ++duplicatesSuppressed_;
            result.status = SecurityCheckStatus::RECENTLY_SUBMITTED;
            return result;
        }
        if (entry) {
            recentSubmissions_.erase(key);
        }

        result.status = SecurityCheckStatus::CHECK_OK;
        return result;
    }

    /**
     * @brief Запомнить успешную (или уже учтённую) отправку
     *
     * Заодно выбрасывает просроченные записи: кэш не больше числа
     * отправок за одно окно повторов.
     */
    void markSubmitted(const domain::SessionToken& token, const std::string& memberId) {
        purgeExpired();
        auto entry = std::make_shared<SuppressionEntry>();
        entry->expiresAt = clock_->now() + settings_->getDuplicateWindow();
        recentSubmissions_.insert(suppressionKey(token, memberId), entry);
    }

    /**
     * @brief Удалить просроченные записи
     * @return Количество удалённых
     */
    size_t purgeExpired() {
        auto now = clock_->now();
        return recentSubmissions_.eraseIf([now](const std::string&, const SuppressionEntry& e) {
            return e.expiresAt <= now;
        });
    }

    SecurityMetrics metrics() const {
        SecurityMetrics m;
        m.tokensValidated = tokensValidated_.load();
        m.validationFailures = validationFailures_.load();
        m.duplicatesSuppressed = duplicatesSuppressed_.load();
        m.trackedSubmissions = recentSubmissions_.size();
        return m;
    }

private:
    struct SuppressionEntry {
        domain::TimePoint expiresAt;
    };

    std::shared_ptr<settings::IProximitySettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    ThreadSafeMap<std::string, SuppressionEntry> recentSubmissions_;

    std::atomic<uint64_t> tokensValidated_{0};
    std::atomic<uint64_t> validationFailures_{0};
    std::atomic<uint64_t> duplicatesSuppressed_{0};

    static std::string suppressionKey(const domain::SessionToken& token, const std::string& memberId) {
        return memberId + "|" + token.value();
    }
};

} // namespace proximity::application
