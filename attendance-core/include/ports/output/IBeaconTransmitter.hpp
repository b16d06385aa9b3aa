#pragma once

#include "domain/BeaconPayload.hpp"
#include <stdexcept>
#include <string>

namespace proximity::ports::output {

/**
 * @brief Сбой платформенного радио (выключен Bluetooth, нет разрешений, нет железа)
 */
class RadioError : public std::runtime_error {
public:
    explicit RadioError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Платформенный передатчик рекламных пакетов
 */
class IBeaconTransmitter {
public:
    virtual ~IBeaconTransmitter() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Отправить (или обновить) рекламный пакет
     * @throws RadioError
     */
    virtual void advertise(const domain::BeaconPayload& payload) = 0;

    /**
     * @brief Прекратить передачу и освободить радио
     */
    virtual void halt() = 0;
};

} // namespace proximity::ports::output
