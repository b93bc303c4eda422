#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace ordercore::settings {

/**
 * @brief Настройки идемпотентного создания заказов
 *
 * Читает из ENV:
 * - IDEMPOTENCY_TTL_SECONDS (default: 86400) - жизнь завершённой записи
 * - IDEMPOTENCY_CLAIM_TTL_SECONDS (default: 30) - жизнь незавершённого claim
 * - IDEMPOTENCY_WAIT_TIMEOUT_MS (default: 5000) - сколько ждать чужой claim
 * - IDEMPOTENCY_POLL_INTERVAL_MS (default: 20)
 * - IDEMPOTENCY_MAX_KEY_LENGTH (default: 255)
 * - IDEMPOTENCY_PURGE_INTERVAL_SECONDS (default: 3600) - чистка просроченных записей
 */
class IdempotencySettings {
public:
    IdempotencySettings() {
        if (const char* val = std::getenv("IDEMPOTENCY_TTL_SECONDS")) {
            ttl_ = std::chrono::seconds(std::stoll(val));
        }
        if (const char* val = std::getenv("IDEMPOTENCY_CLAIM_TTL_SECONDS")) {
            claimTtl_ = std::chrono::seconds(std::stoll(val));
        }
        if (const char* val = std::getenv("IDEMPOTENCY_WAIT_TIMEOUT_MS")) {
            waitTimeout_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("IDEMPOTENCY_POLL_INTERVAL_MS")) {
            pollInterval_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("IDEMPOTENCY_MAX_KEY_LENGTH")) {
            maxKeyLength_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("IDEMPOTENCY_PURGE_INTERVAL_SECONDS")) {
            purgeInterval_ = std::chrono::seconds(std::stoll(val));
        }
    }

    /**
     * @brief Явные значения (тесты)
     */
    static IdempotencySettings custom(std::chrono::seconds ttl,
                                      std::chrono::seconds claimTtl,
                                      std::chrono::milliseconds waitTimeout,
                                      std::chrono::milliseconds pollInterval = std::chrono::milliseconds(5)) {
        IdempotencySettings s;
        s.ttl_ = ttl;
        s.claimTtl_ = claimTtl;
        s.waitTimeout_ = waitTimeout;
        s.pollInterval_ = pollInterval;
        return s;
    }

    std::chrono::seconds getTtl() const { return ttl_; }
    std::chrono::seconds getClaimTtl() const { return claimTtl_; }
    std::chrono::milliseconds getWaitTimeout() const { return waitTimeout_; }
    std::chrono::milliseconds getPollInterval() const { return pollInterval_; }
    size_t getMaxKeyLength() const { return maxKeyLength_; }
    std::chrono::seconds getPurgeInterval() const { return purgeInterval_; }

private:
    std::chrono::seconds ttl_{86400};
    std::chrono::seconds claimTtl_{30};
    std::chrono::milliseconds waitTimeout_{5000};
    std::chrono::milliseconds pollInterval_{20};
    size_t maxKeyLength_ = 255;
    std::chrono::seconds purgeInterval_{3600};
};

} // namespace ordercore::settings
