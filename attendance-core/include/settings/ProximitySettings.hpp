#pragma once

#include "settings/IProximitySettings.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace proximity::settings {

/**
 * @brief Настройки протокола из ENV
 *
 * Читает из ENV:
 * - PROXIMITY_BEACON_UUID (default: "550E8400-E29B-41D4-A716-446655440000", nil запрещён)
 * - PROXIMITY_TX_POWER (default: -57)
 * - PROXIMITY_ADVERTISE_INTERVAL_MS (default: 1000)
 * - PROXIMITY_EXPIRY_CHECK_INTERVAL_MS (default: 30000)
 * - PROXIMITY_MAX_SESSION_SECONDS (default: 86400)
 * - PROXIMITY_DUPLICATE_WINDOW_SECONDS (default: 30)
 * - PROXIMITY_MIN_TOKEN_ENTROPY_BITS (default: 30)
 * - PROXIMITY_ORG_CODES (default: "nhs=1,nhsa=2")
 */
class ProximitySettings : public IProximitySettings {
public:
    ProximitySettings() {
        std::string uuidText = getEnvOrDefault("PROXIMITY_BEACON_UUID", "550E8400-E29B-41D4-A716-446655440000");
        auto uuid = domain::BeaconUuid::parse(uuidText);
        if (!uuid || uuid->isNil()) {
            throw std::invalid_argument("PROXIMITY_BEACON_UUID must be a non-nil UUID: " + uuidText);
        }
        namespace_ = *uuid;

        txPower_ = static_cast<int8_t>(std::stoi(getEnvOrDefault("PROXIMITY_TX_POWER", "-57")));
        advertiseInterval_ = std::chrono::milliseconds(
            std::stol(getEnvOrDefault("PROXIMITY_ADVERTISE_INTERVAL_MS", "1000")));
        expiryCheckInterval_ = std::chrono::milliseconds(
            std::stol(getEnvOrDefault("PROXIMITY_EXPIRY_CHECK_INTERVAL_MS", "30000")));
        maxSessionSeconds_ = std::stoll(getEnvOrDefault("PROXIMITY_MAX_SESSION_SECONDS", "86400"));
        duplicateWindow_ = std::chrono::seconds(
            std::stol(getEnvOrDefault("PROXIMITY_DUPLICATE_WINDOW_SECONDS", "30")));
        minEntropyBits_ = std::stod(getEnvOrDefault("PROXIMITY_MIN_TOKEN_ENTROPY_BITS", "30"));
        orgCodes_ = parseOrganizationCodes(getEnvOrDefault("PROXIMITY_ORG_CODES", "nhs=1,nhsa=2"));
    }

    domain::BeaconUuid getBeaconNamespace() const override { return namespace_; }
    int8_t getTxPower() const override { return txPower_; }
    std::chrono::milliseconds getAdvertiseInterval() const override { return advertiseInterval_; }
    std::chrono::milliseconds getExpiryCheckInterval() const override { return expiryCheckInterval_; }
    int64_t getMaxSessionSeconds() const override { return maxSessionSeconds_; }
    std::chrono::seconds getDuplicateWindow() const override { return duplicateWindow_; }
    double getMinTokenEntropyBits() const override { return minEntropyBits_; }
    std::map<std::string, uint16_t> getOrganizationCodes() const override { return orgCodes_; }

    /**
     * @brief Разобрать "slug=code,slug=code"
     * @throws std::invalid_argument при неверном формате
     */
    static std::map<std::string, uint16_t> parseOrganizationCodes(const std::string& text) {
        std::map<std::string, uint16_t> result;
        std::istringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (item.empty()) continue;
            auto eq = item.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 >= item.size()) {
                throw std::invalid_argument("Invalid organization code entry: " + item);
            }
            int code = std::stoi(item.substr(eq + 1));
            if (code <= 0 || code > 0xFFFF) {
                throw std::invalid_argument("Organization code out of range: " + item);
            }
            result[item.substr(0, eq)] = static_cast<uint16_t>(code);
        }
        return result;
    }

private:
    domain::BeaconUuid namespace_;
    int8_t txPower_ = -57;
    std::chrono::milliseconds advertiseInterval_{1000};
    std::chrono::milliseconds expiryCheckInterval_{30000};
    int64_t maxSessionSeconds_ = 86400;
    std::chrono::seconds duplicateWindow_{30};
    double minEntropyBits_ = 30.0;
    std::map<std::string, uint16_t> orgCodes_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace proximity::settings
