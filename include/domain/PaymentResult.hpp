#pragma once

#include <string>
#include <optional>

namespace ordercore::domain {

/**
 * @brief Итог попытки оплаты (не персистится ядром)
 *
 * transactionId есть только при success, message - только при неуспехе.
 */
class PaymentResult {
public:
    static constexpr const char* FALLBACK_MESSAGE = "payment service temporarily unavailable";

    bool success = false;
    std::optional<std::string> transactionId;
    std::optional<std::string> message;

    static PaymentResult ok(const std::string& txnId) {
        PaymentResult r;
        r.success = true;
        r.transactionId = txnId;
        return r;
    }

    static PaymentResult failed(const std::string& reason) {
        PaymentResult r;
        r.success = false;
        r.message = reason;
        return r;
    }

    static PaymentResult fallback() {
        return failed(FALLBACK_MESSAGE);
    }
};

/**
 * @brief Ответ платёжного шлюза
 *
 * approved == false - это отказ банка, а не сбой шлюза.
 */
struct GatewayResponse {
    bool approved = false;
    std::string transactionId;
    std::string declineReason;
};

} // namespace ordercore::domain
