#pragma once

#include <string>
#include <cstdlib>

namespace ordercore::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (Order Store и Idempotency Ledger)
     *
     * Читает параметры из переменных окружения (K8s ENV):
     * - ORDERS_DB_HOST (default: "orders-postgres")
     * - ORDERS_DB_PORT (default: 5432)
     * - ORDERS_DB_NAME (default: "orders_db")
     * - ORDERS_DB_USER / ORDERS_DB_PASSWORD
     * - ORDERS_DB_CONNECT_TIMEOUT_SECONDS (default: 5)
     * - ORDERS_DB_STATEMENT_TIMEOUT_MS (default: 5000) - потолок на каждый запрос
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("ORDERS_DB_HOST", "orders-postgres");
            port_ = std::stoi(getEnvOrDefault("ORDERS_DB_PORT", "5432"));
            name_ = getEnvOrDefault("ORDERS_DB_NAME", "orders_db");
            user_ = getEnvOrDefault("ORDERS_DB_USER", "orders_user");
            password_ = getEnvOrDefault("ORDERS_DB_PASSWORD", "orders_secret_password");
            connectTimeoutSeconds_ = std::stoi(getEnvOrDefault("ORDERS_DB_CONNECT_TIMEOUT_SECONDS", "5"));
            statementTimeoutMs_ = std::stoi(getEnvOrDefault("ORDERS_DB_STATEMENT_TIMEOUT_MS", "5000"));
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getStatementTimeoutMs() const { return statementTimeoutMs_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSeconds_;
        int statementTimeoutMs_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace ordercore::settings
