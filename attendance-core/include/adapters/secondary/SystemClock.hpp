#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace proximity::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace proximity::adapters::secondary
