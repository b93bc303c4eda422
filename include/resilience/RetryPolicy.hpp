#pragma once

#include "domain/Errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

namespace ordercore::resilience {

struct RetryConfig {
    int maxAttempts = 3;                            ///< Всего попыток, включая первую
    std::chrono::milliseconds waitDuration{1000};   ///< Пауза перед второй попыткой
    double backoffMultiplier = 1.0;                 ///< 1.0 - фиксированная пауза
    std::chrono::milliseconds maxWaitDuration{30000};
};

/**
 * @brief Политика повторов
 *
 * Повторяются только транзиентные сбои шлюза (I/O, таймаут).
 * Ошибки класса валидации не повторяются никогда.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {}) : config_(config) {
        if (config_.maxAttempts < 1) {
            config_.maxAttempts = 1;
        }
        if (config_.backoffMultiplier < 1.0) {
            config_.backoffMultiplier = 1.0;
        }
    }

    int maxAttempts() const { return config_.maxAttempts; }

    /**
     * @brief Пауза после неудачной попытки attempt (нумерация с 1)
     */
    std::chrono::milliseconds backoffAfter(int attempt) const {
        double factor = std::pow(config_.backoffMultiplier, std::max(0, attempt - 1));
        auto wait = static_cast<long long>(static_cast<double>(config_.waitDuration.count()) * factor);
        return std::min(std::chrono::milliseconds(wait), config_.maxWaitDuration);
    }

    bool shouldRetry(int attempt, const std::exception& error) const {
        return attempt < config_.maxAttempts && isRetryable(error);
    }

    static bool isRetryable(const std::exception& error) {
        return dynamic_cast<const domain::GatewayTransientError*>(&error) != nullptr;
    }

private:
    RetryConfig config_;
};

} // namespace ordercore::resilience
