#pragma once

#include "domain/PaymentResult.hpp"
#include <cstdint>

namespace ordercore::ports::output {

/**
 * @brief Клиент внешнего платёжного шлюза
 *
 * Синхронный вызов, ненадёжный: может тормозить или лежать.
 * Устойчивость (breaker, retry, timeout) навешивает PaymentOrchestrator.
 * Таймаут оркестратора не прерывает capture, поэтому реализация сама
 * должна ограничивать время своего I/O.
 */
class IPaymentGateway {
public:
    virtual ~IPaymentGateway() = default;

    /**
     * @brief Захватить платёж по заказу
     * @throws GatewayTransientError I/O или 5xx
     * @throws GatewayTimeoutError истёк дедлайн
     * @throws GatewayRejectedError запрос отвергнут (4xx)
     */
    virtual domain::GatewayResponse capture(int64_t orderId) = 0;
};

} // namespace ordercore::ports::output
