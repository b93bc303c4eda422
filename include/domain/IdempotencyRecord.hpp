#pragma once

#include "Timestamp.hpp"
#include <string>
#include <optional>

/**
 * Идемпотентность создания ресурсов
 */
namespace ordercore::domain
{

    /**
     * @brief Запись "этот ключ уже породил этот ресурс"
     *
     * Пустой resourceId означает claim: владелец ключа ещё создаёт ресурс.
     * claimToken выдаётся владельцу claim'а, завершить или снять claim
     * можно только с этим токеном.
     */
    struct IdempotencyRecord
    {
        std::string key;
        std::string resourceType;
        std::string resourceId;
        std::string claimToken;
        Timestamp expiresAt;

        bool isPending() const { return resourceId.empty(); }

        bool isExpired(const Timestamp &now) const { return expiresAt <= now; }
    };

    /**
     * @brief Результат атомарной регистрации ключа
     *
     * registered == false означает конфликт, existing - запись победителя.
     */
    struct RegistrationResult
    {
        bool registered = false;
        std::optional<IdempotencyRecord> existing;
    };

} // namespace ordercore::domain
