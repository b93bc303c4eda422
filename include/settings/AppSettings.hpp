#pragma once

#include <cstdlib>
#include <string>

namespace ordercore::settings {

/**
 * @brief Режим запуска сервиса
 *
 * ORDER_CORE_BACKEND:
 * - "infra" (default) - PostgreSQL, RabbitMQ, HTTP-шлюз
 * - "memory" - in-memory хранилища и шина, шлюз всё ещё HTTP
 */
class AppSettings {
public:
    AppSettings() {
        if (const char* backend = std::getenv("ORDER_CORE_BACKEND")) {
            backend_ = backend;
        }
    }

    std::string getBackend() const { return backend_; }
    bool isInMemory() const { return backend_ == "memory"; }

private:
    std::string backend_ = "infra";
};

} // namespace ordercore::settings
