#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "domain/Errors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ordercore::adapters::secondary {

/**
 * @brief PostgreSQL реализация Order Store
 *
 * Ожидаемая таблица:
 * orders(id BIGSERIAL PK, order_number TEXT UNIQUE, user_id BIGINT, status TEXT,
 *        subtotal_units/_nano, shipping_units/_nano, tax_units/_nano,
 *        total_units/_nano, currency, payment_id, tracking_number,
 *        pending_reason, created_at, updated_at)
 *
 * Одно соединение под мьютексом. Каждый запрос ограничен
 * statement_timeout из DbSettings. Любая ошибка pqxx -> PersistenceError.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresOrderRepo] Connecting to " << settings_->getHost()
                  << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresOrderRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] Connection failed: " << e.what() << std::endl;
            throw domain::PersistenceError(std::string("Order store unavailable: ") + e.what());
        }
    }

    ~PostgresOrderRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::Order save(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            applyStatementTimeout(txn);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO orders (
                        order_number, user_id, status,
                        subtotal_units, subtotal_nano, shipping_units, shipping_nano,
                        tax_units, tax_nano, total_units, total_nano, currency,
                        payment_id, tracking_number, pending_reason,
                        created_at, updated_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12,
                            NULLIF($13, ''), NULLIF($14, ''), NULLIF($15, ''), NOW(), NOW())
                    RETURNING )" + std::string(COLUMNS),
                order.orderNumber,
                order.userId,
                domain::toString(order.status),
                order.subtotal.units, order.subtotal.nano,
                order.shipping.units, order.shipping.nano,
                order.tax.units, order.tax.nano,
                order.total.units, order.total.nano,
                order.total.currency,
                order.paymentId,
                order.trackingNumber,
                order.pendingReason
            );

            txn.commit();

            domain::Order saved = rowToOrder(result[0]);
            std::cout << "[PostgresOrderRepo] Saved order: " << saved.id << std::endl;
            return saved;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] save() failed: " << e.what() << std::endl;
            throw domain::PersistenceError(std::string("Failed to save order: ") + e.what());
        }
    }

    domain::Order update(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);

        pqxx::result result;
        try {
            pqxx::work txn(*connection_);
            applyStatementTimeout(txn);

            result = txn.exec_params(
                R"(
                    UPDATE orders SET
                        status = $2,
                        subtotal_units = $3, subtotal_nano = $4,
                        shipping_units = $5, shipping_nano = $6,
                        tax_units = $7, tax_nano = $8,
                        total_units = $9, total_nano = $10,
                        payment_id = NULLIF($11, ''),
                        tracking_number = NULLIF($12, ''),
                        pending_reason = NULLIF($13, ''),
                        updated_at = NOW()
                    WHERE id = $1
                    RETURNING )" + std::string(COLUMNS),
                order.id,
                domain::toString(order.status),
                order.subtotal.units, order.subtotal.nano,
                order.shipping.units, order.shipping.nano,
                order.tax.units, order.tax.nano,
                order.total.units, order.total.nano,
                order.paymentId,
                order.trackingNumber,
                order.pendingReason
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] update() failed: " << e.what() << std::endl;
            throw domain::PersistenceError(std::string("Failed to update order: ") + e.what());
        }

        if (result.empty()) {
            throw domain::OrderNotFoundError("Order not found: " + std::to_string(order.id));
        }
        return rowToOrder(result[0]);
    }

    std::optional<domain::Order> findById(int64_t id) override {
        auto rows = query("SELECT " + std::string(COLUMNS) + " FROM orders WHERE id = $1", id);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::optional<domain::Order> findByOrderNumber(const std::string& orderNumber) override {
        auto rows = query("SELECT " + std::string(COLUMNS) + " FROM orders WHERE order_number = $1",
                          orderNumber);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::vector<domain::Order> findByUserId(int64_t userId) override {
        return query("SELECT " + std::string(COLUMNS) +
                     " FROM orders WHERE user_id = $1 ORDER BY created_at DESC, id DESC", userId);
    }

    std::vector<domain::Order> findByStatus(domain::OrderStatus status) override {
        return query("SELECT " + std::string(COLUMNS) +
                     " FROM orders WHERE status = $1 ORDER BY created_at DESC, id DESC",
                     domain::toString(status));
    }

    bool isConnected() const {
        return connection_ && connection_->is_open();
    }

private:
    static constexpr const char* COLUMNS =
        "id, order_number, user_id, status, "
        "subtotal_units, subtotal_nano, shipping_units, shipping_nano, "
        "tax_units, tax_nano, total_units, total_nano, currency, "
        "payment_id, tracking_number, pending_reason, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
        "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms";

    template <typename Param>
    std::vector<domain::Order> query(const std::string& sql, const Param& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Order> orders;
        try {
            pqxx::work txn(*connection_);
            applyStatementTimeout(txn);

            auto result = txn.exec_params(sql, param);
            txn.commit();

            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] query failed: " << e.what() << std::endl;
            throw domain::PersistenceError(std::string("Order store query failed: ") + e.what());
        }
        return orders;
    }

    void applyStatementTimeout(pqxx::work& txn) const {
        txn.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
    }

    static domain::Money readMoney(const pqxx::row& row, const char* units, const char* nano,
                                   const std::string& currency) {
        domain::Money m;
        m.units = row[units].as<int64_t>();
        m.nano = row[nano].as<int32_t>();
        m.currency = currency;
        return m;
    }

    static std::string readOptional(const pqxx::row& row, const char* column) {
        return row[column].is_null() ? std::string() : row[column].as<std::string>();
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<int64_t>();
        order.orderNumber = row["order_number"].as<std::string>();
        order.userId = row["user_id"].as<int64_t>();
        order.status = domain::parseOrderStatus(row["status"].as<std::string>());

        std::string currency = row["currency"].as<std::string>();
        order.subtotal = readMoney(row, "subtotal_units", "subtotal_nano", currency);
        order.shipping = readMoney(row, "shipping_units", "shipping_nano", currency);
        order.tax = readMoney(row, "tax_units", "tax_nano", currency);
        order.total = readMoney(row, "total_units", "total_nano", currency);

        order.paymentId = readOptional(row, "payment_id");
        order.trackingNumber = readOptional(row, "tracking_number");
        order.pendingReason = readOptional(row, "pending_reason");

        order.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        order.updatedAt = domain::Timestamp::fromMillis(row["updated_ms"].as<int64_t>());
        return order;
    }

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace ordercore::adapters::secondary
