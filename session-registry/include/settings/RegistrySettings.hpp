#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace registry::settings {

/**
 * @brief Правила создания сессий
 *
 * Читает из ENV:
 * - REGISTRY_MAX_SESSION_SECONDS (default: 86400)
 * - REGISTRY_DEFAULT_SESSION_SECONDS (default: 3600), если клиент не передал длительность
 * - REGISTRY_TOKEN_RETRIES (default: 10), попыток при конфликте токенов
 * - REGISTRY_MIN_TOKEN_ENTROPY_BITS (default: 30)
 */
class RegistrySettings {
public:
    RegistrySettings() {
        maxSessionSeconds_ = std::stoll(getEnvOrDefault("REGISTRY_MAX_SESSION_SECONDS", "86400"));
        defaultSessionSeconds_ = std::stoll(getEnvOrDefault("REGISTRY_DEFAULT_SESSION_SECONDS", "3600"));
        tokenRetries_ = std::stoi(getEnvOrDefault("REGISTRY_TOKEN_RETRIES", "10"));
        minTokenEntropyBits_ = std::stod(getEnvOrDefault("REGISTRY_MIN_TOKEN_ENTROPY_BITS", "30"));

        if (maxSessionSeconds_ <= 0 || defaultSessionSeconds_ <= 0 ||
            defaultSessionSeconds_ > maxSessionSeconds_) {
            throw std::invalid_argument("Session duration limits are inconsistent");
        }
        if (tokenRetries_ < 1) {
            throw std::invalid_argument("REGISTRY_TOKEN_RETRIES must be at least 1");
        }
    }

    int64_t getMaxSessionSeconds() const { return maxSessionSeconds_; }
    int64_t getDefaultSessionSeconds() const { return defaultSessionSeconds_; }
    int getTokenRetries() const { return tokenRetries_; }
    double getMinTokenEntropyBits() const { return minTokenEntropyBits_; }

private:
    int64_t maxSessionSeconds_ = 86400;
    int64_t defaultSessionSeconds_ = 3600;
    int tokenRetries_ = 10;
    double minTokenEntropyBits_ = 30.0;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace registry::settings
