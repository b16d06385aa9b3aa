#pragma once

#include "domain/Timestamp.hpp"

namespace proximity::ports::output {

/**
 * @brief Источник текущего времени (подменяется в тестах)
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::TimePoint now() const = 0;
};

} // namespace proximity::ports::output
