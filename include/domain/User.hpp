#pragma once

#include <string>
#include <cstdint>

namespace ordercore::domain {

/**
 * @brief Аутентифицированный пользователь
 *
 * Приходит из слоя аутентификации уже проверенным, ядро ему доверяет.
 */
struct User {
    int64_t id = 0;
    std::string email;
    std::string displayName;

    User() = default;

    User(int64_t id_, const std::string& email_, const std::string& name = "")
        : id(id_), email(email_), displayName(name) {}
};

} // namespace ordercore::domain
