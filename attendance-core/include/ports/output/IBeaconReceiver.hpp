#pragma once

#include "domain/BeaconDetection.hpp"
#include "domain/BeaconUuid.hpp"
#include <functional>

namespace proximity::ports::output {

using DetectionCallback = std::function<void(const domain::BeaconDetection&)>;

/**
 * @brief Платформенный поток обнаружений маяков
 *
 * Callback вызывается из потока платформы, возможно параллельно.
 * После stopListening() callback больше не вызывается.
 */
class IBeaconReceiver {
public:
    virtual ~IBeaconReceiver() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @throws RadioError
     */
    virtual void startListening(const domain::BeaconUuid& namespaceId, DetectionCallback callback) = 0;

    virtual void stopListening() = 0;
};

} // namespace proximity::ports::output
