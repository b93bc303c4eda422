#pragma once

#include "domain/Order.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ordercore::ports::output {

/**
 * @brief Интерфейс хранилища заказов (Order Store)
 *
 * Все методы бросают PersistenceError при сбое хранилища.
 * Удаления нет: заказ отменяется статусом.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Вставить новый заказ
     * @return Заказ с присвоенным id и createdAt/updatedAt
     */
    virtual domain::Order save(const domain::Order& order) = 0;

    /**
     * @brief Обновить существующий заказ
     * @throws OrderNotFoundError если заказа с таким id нет
     */
    virtual domain::Order update(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findById(int64_t id) = 0;

    virtual std::optional<domain::Order> findByOrderNumber(const std::string& orderNumber) = 0;

    /**
     * @brief Заказы пользователя, новые первыми
     */
    virtual std::vector<domain::Order> findByUserId(int64_t userId) = 0;

    virtual std::vector<domain::Order> findByStatus(domain::OrderStatus status) = 0;
};

} // namespace ordercore::ports::output
