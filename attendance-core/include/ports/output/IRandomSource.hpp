#pragma once

#include <cstddef>
#include <cstdint>

namespace proximity::ports::output {

/**
 * @brief Источник случайных байт для генерации токенов
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief true, если источник криптографически стойкий
     */
    virtual bool isSecure() const = 0;

    virtual void fill(uint8_t* buffer, size_t size) = 0;
};

} // namespace proximity::ports::output
