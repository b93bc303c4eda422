#pragma once

#include "resilience/CircuitBreaker.hpp"
#include "utils/ThreadSafeMap.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ordercore::resilience {

/**
 * @brief Реестр breaker'ов: один экземпляр на имя внешнего сервиса
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerConfig defaultConfig = {},
                                    TimeSource clock = steadyClock())
        : defaultConfig_(defaultConfig)
        , clock_(std::move(clock))
    {}

    std::shared_ptr<CircuitBreaker> circuitBreaker(const std::string& name) {
        return circuitBreaker(name, defaultConfig_);
    }

    /**
     * @brief config используется только при первом обращении к имени
     */
    std::shared_ptr<CircuitBreaker> circuitBreaker(const std::string& name,
                                                   const CircuitBreakerConfig& config) {
        return breakers_.findOrInsert(name, [&] {
            std::cout << "[CircuitBreakerRegistry] Created breaker: " << name << std::endl;
            return std::make_shared<CircuitBreaker>(name, config, clock_);
        });
    }

    std::shared_ptr<CircuitBreaker> find(const std::string& name) const {
        return breakers_.find(name);
    }

    std::vector<std::shared_ptr<CircuitBreaker>> all() const {
        return breakers_.values();
    }

private:
    CircuitBreakerConfig defaultConfig_;
    TimeSource clock_;
    utils::ThreadSafeMap<std::string, CircuitBreaker> breakers_;
};

} // namespace ordercore::resilience
