#pragma once

#include "domain/IdempotencyRecord.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace ordercore::ports::output {

/**
 * @brief Журнал ключей идемпотентности (Idempotency Ledger)
 *
 * registerKey обязан быть линеаризуемым для одного ключа: из двух
 * конкурентных регистраций побеждает ровно одна. Просроченная запись
 * ничем не отличается от отсутствующей.
 */
class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;

    /**
     * @brief Живая запись по ключу (в т.ч. незавершённый claim)
     */
    virtual std::optional<domain::IdempotencyRecord> lookup(const std::string& key) = 0;

    /**
     * @brief Атомарно вставить запись, если ключа нет или он просрочен
     * @return registered=false и existing=запись победителя при конфликте
     */
    virtual domain::RegistrationResult registerKey(const domain::IdempotencyRecord& record) = 0;

    /**
     * @brief Завершить claim: проставить resourceId и продлить до полного TTL
     * @return false если claim с этим токеном уже не существует
     *         (просрочен, перехвачен другим владельцем или завершён)
     */
    virtual bool complete(const std::string& key, const std::string& claimToken,
                          const std::string& resourceId, std::chrono::seconds ttl) = 0;

    /**
     * @brief Снять свой незавершённый claim (создание ресурса не удалось)
     */
    virtual void release(const std::string& key, const std::string& claimToken) = 0;

    /**
     * @brief Удалить просроченные записи (гигиена, на корректность не влияет)
     * @return Количество удалённых записей
     */
    virtual size_t purgeExpired() = 0;
};

} // namespace ordercore::ports::output
