#pragma once

#include "domain/BeaconUuid.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace proximity::domain {

using OrganizationCode = uint16_t;  ///< Поле major
using TokenHash = uint16_t;         ///< Поле minor

/// Код компании Apple в manufacturer specific data (little-endian на проводе)
inline constexpr uint16_t IBEACON_COMPANY_ID = 0x004C;
inline constexpr uint8_t IBEACON_TYPE = 0x02;
inline constexpr uint8_t IBEACON_DATA_LENGTH = 0x15;
inline constexpr size_t IBEACON_MANUFACTURER_DATA_SIZE = 25;
inline constexpr int8_t DEFAULT_TX_POWER = -57;  ///< 0xC7, калиброванная мощность на 1 м

/**
 * @brief Содержимое одного рекламного пакета
 *
 * major = OrganizationCode, minor = TokenHash.
 * Раскладка iBeacon: m:2-3=0215, i:4-19, i:20-21, i:22-23, p:24-24.
 *
 * @example
 * ```
 * 4C 00 | 02 15 | <uuid 16 байт> | MM MM | mm mm | C7
 * ```
 */
struct BeaconPayload {
    BeaconUuid namespaceId;
    OrganizationCode major = 0;
    TokenHash minor = 0;
    int8_t txPower = DEFAULT_TX_POWER;

    std::vector<uint8_t> toManufacturerData() const {
        std::vector<uint8_t> data;
        data.reserve(IBEACON_MANUFACTURER_DATA_SIZE);

        data.push_back(static_cast<uint8_t>(IBEACON_COMPANY_ID & 0xFF));
        data.push_back(static_cast<uint8_t>(IBEACON_COMPANY_ID >> 8));
        data.push_back(IBEACON_TYPE);
        data.push_back(IBEACON_DATA_LENGTH);

        for (auto b : namespaceId.bytes()) {
            data.push_back(b);
        }

        data.push_back(static_cast<uint8_t>(major >> 8));
        data.push_back(static_cast<uint8_t>(major & 0xFF));
        data.push_back(static_cast<uint8_t>(minor >> 8));
        data.push_back(static_cast<uint8_t>(minor & 0xFF));
        data.push_back(static_cast<uint8_t>(txPower));

        return data;
    }

    /**
     * @brief Разобрать manufacturer data
     * @return std::nullopt при неверной длине, компании или типе
     */
    static std::optional<BeaconPayload> fromManufacturerData(const std::vector<uint8_t>& data) {
        if (data.size() != IBEACON_MANUFACTURER_DATA_SIZE) {
            return std::nullopt;
        }
        uint16_t company = static_cast<uint16_t>(data[0] | (data[1] << 8));
        if (company != IBEACON_COMPANY_ID || data[2] != IBEACON_TYPE || data[3] != IBEACON_DATA_LENGTH) {
            return std::nullopt;
        }

        BeaconUuid::Bytes uuid{};
        for (size_t i = 0; i < uuid.size(); ++i) {
            uuid[i] = data[4 + i];
        }

        BeaconPayload payload;
        payload.namespaceId = BeaconUuid(uuid);
        payload.major = static_cast<uint16_t>((data[20] << 8) | data[21]);
        payload.minor = static_cast<uint16_t>((data[22] << 8) | data[23]);
        payload.txPower = static_cast<int8_t>(data[24]);
        return payload;
    }

    bool operator==(const BeaconPayload& other) const {
        return namespaceId == other.namespaceId && major == other.major &&
               minor == other.minor && txPower == other.txPower;
    }
};

} // namespace proximity::domain
