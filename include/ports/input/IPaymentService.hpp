#pragma once

#include "domain/PaymentTask.hpp"
#include <cstdint>

namespace ordercore::ports::input {

/**
 * @brief Интерфейс асинхронной оплаты заказа
 */
class IPaymentService {
public:
    virtual ~IPaymentService() = default;

    /**
     * @brief Запустить захват платежа
     *
     * Никогда не бросает синхронно. Все отказы (шлюз лежит, breaker открыт,
     * ретраи исчерпаны) приходят как PaymentResult{success=false}.
     */
    virtual domain::PaymentTask processPayment(int64_t orderId) = 0;
};

} // namespace ordercore::ports::input
