#pragma once

#include "domain/BeaconUuid.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace proximity::settings {

/**
 * @brief Параметры протокола на устройстве
 */
class IProximitySettings {
public:
    virtual ~IProximitySettings() = default;

    virtual domain::BeaconUuid getBeaconNamespace() const = 0;
    virtual int8_t getTxPower() const = 0;
    virtual std::chrono::milliseconds getAdvertiseInterval() const = 0;
    virtual std::chrono::milliseconds getExpiryCheckInterval() const = 0;
    virtual int64_t getMaxSessionSeconds() const = 0;
    virtual std::chrono::seconds getDuplicateWindow() const = 0;
    virtual double getMinTokenEntropyBits() const = 0;

    /**
     * @brief Таблица slug → OrganizationCode
     */
    virtual std::map<std::string, uint16_t> getOrganizationCodes() const = 0;
};

} // namespace proximity::settings
