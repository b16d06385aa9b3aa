#pragma once

#include <string>

namespace proximity::domain {

enum class ScannerState {
    IDLE,
    SCANNING,
    ERROR       ///< Радио недоступно, можно повторить start()
};

inline std::string toString(ScannerState state) {
    switch (state) {
        case ScannerState::IDLE:     return "IDLE";
        case ScannerState::SCANNING: return "SCANNING";
        case ScannerState::ERROR:    return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace proximity::domain
