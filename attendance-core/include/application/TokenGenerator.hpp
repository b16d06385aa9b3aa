#pragma once

#include "application/SecurityValidator.hpp"
#include "application/TokenCodec.hpp"
#include "domain/SessionToken.hpp"
#include "domain/enums/CollisionRisk.hpp"
#include "ports/output/IRandomSource.hpp"

#include <array>
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace proximity::application {

/**
 * @brief Сгенерированный токен с признаком качества источника
 */
struct GeneratedToken {
    domain::SessionToken token;
    bool degraded = false;      ///< Источник не криптостойкий
    double entropyBits = 0.0;
};

/**
 * @brief Результат проверки генератора на коллизии
 */
struct CollisionAssessment {
    size_t sampleSize = 0;
    size_t uniqueTokens = 0;
    size_t tokenCollisions = 0;
    size_t hashCollisions = 0;              ///< Токены, чей TokenHash уже встречался
    double expectedHashCollisions = 0.0;    ///< Оценка парадокса дней рождения n²/(2·65536)
    double collisionRate = 0.0;             ///< tokenCollisions / sampleSize
    domain::CollisionResistance rating = domain::CollisionResistance::POOR;
};

/**
 * @brief Генератор токенов сессий
 *
 * Символ = byte % 32 (256 кратно 32, смещения нет).
 * Токены с энтропией распределения ниже порога перегенерируются,
 * не более MAX_ATTEMPTS раз. Уникальность между вызовами не гарантируется:
 * коллизии разрешает реестр повторной генерацией.
 */
class TokenGenerator {
public:
    static constexpr int MAX_ATTEMPTS = 8;

    TokenGenerator(
        std::shared_ptr<ports::output::IRandomSource> random,
        double minEntropyBits
    ) : random_(std::move(random))
      , minEntropyBits_(minEntropyBits)
    {
        if (!random_->isSecure()) {
            std::cerr << "[TokenGenerator] WARNING: secure random source unavailable, "
                      << "tokens will be flagged as degraded" << std::endl;
        }
    }

    /**
     * @throws std::runtime_error если за MAX_ATTEMPTS не удалось получить токен с нужной энтропией
     */
    GeneratedToken generate() {
        const bool degraded = !random_->isSecure();

        for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
            std::array<uint8_t, domain::TOKEN_LENGTH> bytes{};
            random_->fill(bytes.data(), bytes.size());

            std::string value;
            value.reserve(domain::TOKEN_LENGTH);
            for (auto b : bytes) {
                value.push_back(domain::TOKEN_ALPHABET[b % domain::TOKEN_ALPHABET_SIZE]);
            }

            double bits = SecurityValidator::shannonEntropyBits(value);
            if (bits < minEntropyBits_) {
                ++lowEntropyRejected_;
                continue;
            }

            ++tokensGenerated_;
            if (degraded) {
                ++degradedTokens_;
            }
            return GeneratedToken{domain::SessionToken(value), degraded, bits};
        }

        throw std::runtime_error("Unable to generate a session token with sufficient entropy");
    }

    /**
     * @brief Сгенерировать выборку и оценить коллизии токенов и хэшей
     */
    CollisionAssessment assessCollisionResistance(size_t sampleSize) {
        CollisionAssessment result;
        result.sampleSize = sampleSize;

        std::unordered_set<std::string> tokens;
        std::unordered_set<domain::TokenHash> hashes;
        for (size_t i = 0; i < sampleSize; ++i) {
            auto generated = generate();
            if (!tokens.insert(generated.token.value()).second) {
                ++result.tokenCollisions;
            }
            if (!hashes.insert(TokenCodec::encodeHash(generated.token)).second) {
                ++result.hashCollisions;
            }
        }

        result.uniqueTokens = tokens.size();
        double n = static_cast<double>(sampleSize);
        result.expectedHashCollisions = n * n / (2.0 * 65536.0);
        result.collisionRate = sampleSize == 0 ? 0.0 : result.tokenCollisions / n;

        if (result.collisionRate < 0.001) {
            result.rating = domain::CollisionResistance::EXCELLENT;
        } else if (result.collisionRate < 0.01) {
            result.rating = domain::CollisionResistance::GOOD;
        } else if (result.collisionRate < 0.05) {
            result.rating = domain::CollisionResistance::FAIR;
        } else {
            result.rating = domain::CollisionResistance::POOR;
        }

        std::cout << "[TokenGenerator] Collision assessment: " << sampleSize << " tokens, "
                  << result.tokenCollisions << " token collisions, "
                  << result.hashCollisions << " hash collisions (expected ~"
                  << result.expectedHashCollisions << "), rating "
                  << domain::toString(result.rating) << std::endl;
        return result;
    }

    bool isDegraded() const { return !random_->isSecure(); }
    uint64_t tokensGenerated() const { return tokensGenerated_.load(); }
    uint64_t degradedTokens() const { return degradedTokens_.load(); }
    uint64_t lowEntropyRejected() const { return lowEntropyRejected_.load(); }

private:
    std::shared_ptr<ports::output::IRandomSource> random_;
    double minEntropyBits_;

    std::atomic<uint64_t> tokensGenerated_{0};
    std::atomic<uint64_t> degradedTokens_{0};
    std::atomic<uint64_t> lowEntropyRejected_{0};
};

} // namespace proximity::application
