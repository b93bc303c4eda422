#pragma once

#include <string>

namespace ordercore::resilience {

enum class CircuitState {
    CLOSED,     ///< Вызовы проходят
    OPEN,       ///< Вызовы сразу уходят в fallback
    HALF_OPEN   ///< Пропускается ограниченное число пробных вызовов
};

inline std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

} // namespace ordercore::resilience
