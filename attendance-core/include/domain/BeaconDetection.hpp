#pragma once

#include "domain/BeaconUuid.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>

namespace proximity::domain {

/**
 * @brief Событие обнаружения маяка от платформенного радио
 *
 * rssi используется только для отображения, никогда для решений безопасности.
 */
struct BeaconDetection {
    BeaconUuid namespaceId;
    uint16_t major = 0;      ///< OrganizationCode
    uint16_t minor = 0;      ///< TokenHash
    int rssi = 0;            ///< dBm
    TimePoint detectedAt;
};

} // namespace proximity::domain
