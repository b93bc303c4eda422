#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "domain/Errors.hpp"
#include "utils/ThreadSafeMap.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <unordered_map>

namespace ordercore::adapters::secondary {

/**
 * @brief In-memory реализация Order Store
 *
 * Для тестов и локального запуска. Уникальность orderNumber
 * проверяется так же, как unique-индекс в PostgreSQL.
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    domain::Order save(const domain::Order& order) override {
        domain::Order stored = order;

        std::lock_guard<std::mutex> lock(indexMutex_);
        if (numberIndex_.count(order.orderNumber) > 0) {
            throw domain::PersistenceError("Duplicate order number: " + order.orderNumber);
        }

        stored.id = nextId_++;
        stored.createdAt = domain::Timestamp::now();
        stored.updatedAt = stored.createdAt;

        orders_.insert(stored.id, std::make_shared<domain::Order>(stored));
        numberIndex_[stored.orderNumber] = stored.id;
        userOrders_[stored.userId].insert(stored.id);
        return stored;
    }

    domain::Order update(const domain::Order& order) override {
        auto existing = orders_.find(order.id);
        if (!existing) {
            throw domain::OrderNotFoundError("Order not found: " + std::to_string(order.id));
        }

        auto updated = std::make_shared<domain::Order>(order);
        updated->createdAt = existing->createdAt;
        updated->updatedAt = domain::Timestamp::now();
        orders_.insert(order.id, updated);
        return *updated;
    }

    std::optional<domain::Order> findById(int64_t id) override {
        auto order = orders_.find(id);
        return order ? std::optional(*order) : std::nullopt;
    }

    std::optional<domain::Order> findByOrderNumber(const std::string& orderNumber) override {
        int64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = numberIndex_.find(orderNumber);
            if (it == numberIndex_.end()) {
                return std::nullopt;
            }
            id = it->second;
        }
        return findById(id);
    }

    /**
     * @brief Заказы пользователя (новые первые)
     */
    std::vector<domain::Order> findByUserId(int64_t userId) override {
        std::set<int64_t> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = userOrders_.find(userId);
            if (it != userOrders_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Order> result;
        for (int64_t id : ids) {
            if (auto order = orders_.find(id)) {
                result.push_back(*order);
            }
        }
        sortNewestFirst(result);
        return result;
    }

    std::vector<domain::Order> findByStatus(domain::OrderStatus status) override {
        std::vector<domain::Order> result;
        for (const auto& order : orders_.values()) {
            if (order->status == status) {
                result.push_back(*order);
            }
        }
        sortNewestFirst(result);
        return result;
    }

    size_t count() const {
        return orders_.size();
    }

    void clear() {
        orders_.clear();
        std::lock_guard<std::mutex> lock(indexMutex_);
        numberIndex_.clear();
        userOrders_.clear();
    }

private:
    // При равном createdAt больший id считается новее
    static void sortNewestFirst(std::vector<domain::Order>& orders) {
        std::sort(orders.begin(), orders.end(),
            [](const domain::Order& a, const domain::Order& b) {
                if (a.createdAt == b.createdAt) {
                    return a.id > b.id;
                }
                return a.createdAt > b.createdAt;
            });
    }

    utils::ThreadSafeMap<int64_t, domain::Order> orders_;
    std::mutex indexMutex_;
    int64_t nextId_ = 1;
    std::unordered_map<std::string, int64_t> numberIndex_;
    std::unordered_map<int64_t, std::set<int64_t>> userOrders_;
};

} // namespace ordercore::adapters::secondary
