#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "domain/Errors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ordercore::adapters::secondary
{

    /**
     * @brief PostgreSQL Idempotency Ledger
     *
     * Таблица idempotency_keys(key TEXT PK, resource_type TEXT,
     * resource_id TEXT NULL, claim_token TEXT, expires_at TIMESTAMPTZ).
     *
     * Атомарность registerKey держится на PK: INSERT ... ON CONFLICT
     * перезаписывает строку только если она уже просрочена.
     */
    class PostgresIdempotencyRepository : public ordercore::ports::output::IIdempotencyRepository
    {
    public:
        explicit PostgresIdempotencyRepository(std::shared_ptr<ordercore::settings::DbSettings> s) : settings_(std::move(s))
        {
            // Проверяем соединение, но не создаём таблицу
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                std::cout << "[IdempotencyRepo] Connected to " << settings_->getName() << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[IdempotencyRepo] Connection failed: " << e.what() << std::endl;
                throw ordercore::domain::PersistenceError(std::string("Idempotency ledger unavailable: ") + e.what());
            }
        }

        std::optional<ordercore::domain::IdempotencyRecord> lookup(const std::string &key) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                applyStatementTimeout(t);
                auto r = t.exec_params(
                    "SELECT " + std::string(COLUMNS) + " FROM idempotency_keys "
                    "WHERE key=$1 AND expires_at > NOW()",
                    key);
                t.commit();
                if (r.empty())
                    return std::nullopt;
                return rowToRecord(r[0]);
            }
            catch (const std::exception &e)
            {
                throw failure("lookup", e);
            }
        }

        ordercore::domain::RegistrationResult registerKey(const ordercore::domain::IdempotencyRecord &record) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                applyStatementTimeout(t);

                auto inserted = t.exec_params(
                    "INSERT INTO idempotency_keys (key, resource_type, resource_id, claim_token, expires_at) "
                    "VALUES ($1, $2, NULLIF($3, ''), $4, to_timestamp($5::double precision / 1000.0)) "
                    "ON CONFLICT (key) DO UPDATE SET "
                    "resource_type = EXCLUDED.resource_type, "
                    "resource_id = EXCLUDED.resource_id, "
                    "claim_token = EXCLUDED.claim_token, "
                    "expires_at = EXCLUDED.expires_at "
                    "WHERE idempotency_keys.expires_at <= NOW() "
                    "RETURNING key",
                    record.key, record.resourceType, record.resourceId, record.claimToken,
                    record.expiresAt.toMillis());

                ordercore::domain::RegistrationResult result;
                if (!inserted.empty())
                {
                    t.commit();
                    result.registered = true;
                    std::cout << "[IdempotencyRepo] Registered key: " << record.key << std::endl;
                    return result;
                }

                // Конфликт: строка победителя уже заблокирована нашим INSERT
                auto existing = t.exec_params(
                    "SELECT " + std::string(COLUMNS) + " FROM idempotency_keys WHERE key=$1",
                    record.key);
                t.commit();

                result.registered = false;
                if (!existing.empty())
                    result.existing = rowToRecord(existing[0]);
                return result;
            }
            catch (const std::exception &e)
            {
                throw failure("registerKey", e);
            }
        }

        bool complete(const std::string &key, const std::string &claimToken,
                      const std::string &resourceId, std::chrono::seconds ttl) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                applyStatementTimeout(t);
                auto r = t.exec_params(
                    "UPDATE idempotency_keys SET resource_id=$3, "
                    "expires_at = NOW() + ($4 * INTERVAL '1 second') "
                    "WHERE key=$1 AND claim_token=$2 AND resource_id IS NULL AND expires_at > NOW()",
                    key, claimToken, resourceId, static_cast<int64_t>(ttl.count()));
                t.commit();
                return r.affected_rows() > 0;
            }
            catch (const std::exception &e)
            {
                throw failure("complete", e);
            }
        }

        void release(const std::string &key, const std::string &claimToken) override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                applyStatementTimeout(t);
                t.exec_params(
                    "DELETE FROM idempotency_keys WHERE key=$1 AND claim_token=$2 AND resource_id IS NULL",
                    key, claimToken);
                t.commit();
                std::cout << "[IdempotencyRepo] Released key: " << key << std::endl;
            }
            catch (const std::exception &e)
            {
                throw failure("release", e);
            }
        }

        size_t purgeExpired() override
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                applyStatementTimeout(t);
                auto r = t.exec("DELETE FROM idempotency_keys WHERE expires_at <= NOW()");
                t.commit();
                return static_cast<size_t>(r.affected_rows());
            }
            catch (const std::exception &e)
            {
                throw failure("purgeExpired", e);
            }
        }

    private:
        static constexpr const char *COLUMNS =
            "key, resource_type, resource_id, claim_token, "
            "(EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_ms";

        void applyStatementTimeout(pqxx::work &t) const
        {
            t.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
        }

        static ordercore::domain::IdempotencyRecord rowToRecord(const pqxx::row &row)
        {
            ordercore::domain::IdempotencyRecord record;
            record.key = row["key"].as<std::string>();
            record.resourceType = row["resource_type"].as<std::string>();
            record.resourceId = row["resource_id"].is_null() ? std::string() : row["resource_id"].as<std::string>();
            record.claimToken = row["claim_token"].is_null() ? std::string() : row["claim_token"].as<std::string>();
            record.expiresAt = ordercore::domain::Timestamp::fromMillis(row["expires_ms"].as<int64_t>());
            return record;
        }

        static ordercore::domain::PersistenceError failure(const char *operation, const std::exception &e)
        {
            std::cerr << "[IdempotencyRepo] " << operation << "() failed: " << e.what() << std::endl;
            return ordercore::domain::PersistenceError(std::string("Idempotency ledger ") + operation + " failed: " + e.what());
        }

        std::shared_ptr<ordercore::settings::DbSettings> settings_;
    };

} // namespace ordercore::adapters::secondary
