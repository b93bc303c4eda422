#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "domain/events/OrderEvent.hpp"
#include "domain/events/IdempotencyEvent.hpp"
#include "domain/Errors.hpp"
#include "settings/IdempotencySettings.hpp"
#include "utils/OrderNumberGenerator.hpp"
#include "utils/UuidGenerator.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace ordercore::application {

/**
 * @brief Сервис заказов
 *
 * Создание заказа идемпотентно по ключу клиента:
 * 1. lookup в Idempotency Ledger: завершённая запись -> возвращаем её заказ
 * 2. registerKey(claim) - атомарный захват ключа, проигравший ждёт победителя
 * 3. save в Order Store (при ошибке claim снимается, событий нет)
 * 4. complete(claim) с TTL 24ч
 * 5. ORDER_CREATED и регистрация ключа в Event Bus
 *
 * Claim принадлежит токену владельца. Если save пережил TTL claim'а
 * и complete не прошёл, ключ разрешается заново: заказ победителя
 * возвращается вместо своего, свой заказ отменяется.
 *
 * Ошибки хранилищ пробрасываются вызывающему. Ошибки публикации
 * только логируются: заказ уже долговечен.
 */
class OrderService : public ports::input::IOrderService {
public:
    static constexpr const char* RESOURCE_TYPE = "order";

    OrderService(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::IIdempotencyRepository> idempotencyRepository,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        settings::IdempotencySettings settings
    ) : orderRepository_(std::move(orderRepository))
      , idempotencyRepository_(std::move(idempotencyRepository))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(settings)
    {
        std::cout << "[OrderService] Created" << std::endl;
    }

    domain::Order createOrder(
        const domain::User& user,
        const std::optional<std::string>& idempotencyKey) override
    {
        validateUser(user);

        if (!idempotencyKey) {
            domain::Order order = persistNew(user);
            publishCreated(order, std::nullopt);
            return order;
        }

        const std::string& key = *idempotencyKey;
        validateKey(key);

        std::string claimToken;
        if (auto replayed = claimOrReplay(key, claimToken)) {
            return *replayed;
        }

        domain::Order order;
        try {
            order = persistNew(user);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to persist order for key " << key
                      << ": " << e.what() << std::endl;
            releaseClaim(key, claimToken);
            throw;
        }

        if (auto winner = completeClaim(key, claimToken, order)) {
            return *winner;
        }
        publishCreated(order, key);
        publishKeyRegistered(key, order);
        return order;
    }

    std::optional<domain::Order> getOrder(int64_t orderId) override {
        return orderRepository_->findById(orderId);
    }

    std::optional<domain::Order> getOrderByNumber(const std::string& orderNumber) override {
        return orderRepository_->findByOrderNumber(orderNumber);
    }

    std::vector<domain::Order> getOrdersForUser(int64_t userId) override {
        return orderRepository_->findByUserId(userId);
    }

    domain::Order applyPaymentResult(int64_t orderId, const domain::PaymentResult& result) override {
        domain::Order order;
        domain::OrderEventType eventType;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            order = requireOrder(orderId);

            if (result.success) {
                std::string txn = result.transactionId.value_or("");
                // Повторная доставка того же результата
                if (order.isPaid() && order.paymentId == txn) {
                    return order;
                }
                order.transitionTo(domain::OrderStatus::PAID);
                order.paymentId = txn;
                order.pendingReason.clear();
                eventType = domain::OrderEventType::ORDER_PAID;
            } else {
                if (order.status == domain::OrderStatus::FAILED) {
                    return order;
                }
                order.transitionTo(domain::OrderStatus::FAILED);
                order.pendingReason = result.message.value_or("payment failed");
                eventType = domain::OrderEventType::ORDER_PAYMENT_FAILED;
            }
            order = orderRepository_->update(order);
        }

        std::cout << "[OrderService] Order " << order.id << " -> "
                  << domain::toString(order.status) << std::endl;

        domain::OrderEvent event(eventType, order);
        event.metadata = result.success ? result.transactionId : result.message;
        publishSafely(event);
        return order;
    }

    domain::Order cancelOrder(int64_t orderId) override {
        domain::Order order;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            order = requireOrder(orderId);
            order.transitionTo(domain::OrderStatus::CANCELLED);
            order = orderRepository_->update(order);
        }

        std::cout << "[OrderService] Order " << order.id << " cancelled" << std::endl;
        publishSafely(domain::OrderEvent(domain::OrderEventType::ORDER_CANCELLED, order));
        return order;
    }

    domain::Order markShipped(int64_t orderId, const std::string& trackingNumber) override {
        if (trackingNumber.empty()) {
            throw domain::ValidationError("Tracking number is required");
        }

        domain::Order order;
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            order = requireOrder(orderId);
            order.transitionTo(domain::OrderStatus::SHIPPED);
            order.trackingNumber = trackingNumber;
            order = orderRepository_->update(order);
        }

        std::cout << "[OrderService] Order " << order.id << " shipped: " << trackingNumber << std::endl;

        domain::OrderEvent event(domain::OrderEventType::ORDER_SHIPPED, order);
        event.metadata = trackingNumber;
        publishSafely(event);
        return order;
    }

private:
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::IIdempotencyRepository> idempotencyRepository_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    settings::IdempotencySettings settings_;
    std::mutex lifecycleMutex_;

    static void validateUser(const domain::User& user) {
        if (user.id <= 0) {
            throw domain::ValidationError("User must have a stable id");
        }
    }

    void validateKey(const std::string& key) const {
        if (key.empty()) {
            throw domain::ValidationError("Idempotency key must not be empty");
        }
        if (key.size() > settings_.getMaxKeyLength()) {
            throw domain::ValidationError("Idempotency key is longer than " +
                                          std::to_string(settings_.getMaxKeyLength()));
        }
    }

    /**
     * @brief Захватить ключ или вернуть заказ, уже созданный по нему
     * @param claimToken [out] токен нового claim'а, если ключ захвачен
     * @return std::nullopt - ключ наш, можно создавать заказ
     * @throws IdempotencyConflictError владелец claim не завершил за waitTimeout
     */
    std::optional<domain::Order> claimOrReplay(const std::string& key, std::string& claimToken) {
        auto deadline = std::chrono::steady_clock::now() + settings_.getWaitTimeout();

        while (true) {
            auto existing = idempotencyRepository_->lookup(key);

            if (!existing) {
                domain::IdempotencyRecord claim;
                claim.key = key;
                claim.resourceType = RESOURCE_TYPE;
                claim.claimToken = utils::UuidGenerator::generate();
                claim.expiresAt = domain::Timestamp::now().plus(settings_.getClaimTtl());

                auto registration = idempotencyRepository_->registerKey(claim);
                if (registration.registered) {
                    claimToken = claim.claimToken;
                    return std::nullopt;
                }
                existing = registration.existing;
                if (!existing) {
                    continue;
                }
            }

            if (existing->resourceType != RESOURCE_TYPE) {
                throw domain::ValidationError("Idempotency key " + key + " is bound to " +
                                              existing->resourceType);
            }

            if (!existing->isPending()) {
                return replay(*existing);
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                throw domain::IdempotencyConflictError(
                    "Order creation for key " + key + " is still in progress");
            }
            std::this_thread::sleep_for(settings_.getPollInterval());
        }
    }

    domain::Order replay(const domain::IdempotencyRecord& record) {
        int64_t orderId = 0;
        try {
            orderId = std::stoll(record.resourceId);
        } catch (const std::exception&) {
            throw domain::PersistenceError("Idempotency key " + record.key +
                                           " references malformed id " + record.resourceId);
        }

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            throw domain::OrderNotFoundError("Idempotency key " + record.key +
                                             " references missing order " + record.resourceId);
        }

        std::cout << "[OrderService] Idempotent replay: key=" << record.key
                  << " order=" << order->id << std::endl;
        return *order;
    }

    domain::Order persistNew(const domain::User& user) {
        domain::Order order(utils::OrderNumberGenerator::generate(), user.id);
        order.setAmounts(domain::Money::zero(), domain::Money::zero(), domain::Money::zero());

        domain::Order saved = orderRepository_->save(order);
        std::cout << "[OrderService] Created order " << saved.id << " "
                  << saved.orderNumber << " for user " << saved.userId << std::endl;
        return saved;
    }

    /**
     * @brief Привязать ключ к сохранённому заказу
     * @return заказ другого владельца, если ключ завершили раньше нас
     * @throws IdempotencyConflictError чужой claim не завершился за waitTimeout
     */
    std::optional<domain::Order> completeClaim(const std::string& key, std::string& claimToken,
                                               const domain::Order& order) {
        while (true) {
            try {
                if (idempotencyRepository_->complete(key, claimToken, std::to_string(order.id),
                                                     settings_.getTtl())) {
                    return std::nullopt;
                }
            } catch (const std::exception& e) {
                // Заказ уже долговечен, ключ останется claim'ом до истечения
                std::cerr << "[OrderService] Failed to complete key " << key
                          << " for order " << order.id << ": " << e.what() << std::endl;
                return std::nullopt;
            }

            std::cerr << "[OrderService] Claim for key " << key
                      << " lost before completion, order " << order.id << std::endl;

            std::optional<domain::Order> winner;
            try {
                winner = claimOrReplay(key, claimToken);
            } catch (const std::exception&) {
                discardOrphan(order);
                throw;
            }
            if (winner) {
                discardOrphan(order);
                return winner;
            }
        }
    }

    /// Отменить заказ, который проиграл ключ другому владельцу
    void discardOrphan(const domain::Order& orphan) {
        try {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            auto order = orderRepository_->findById(orphan.id);
            if (order && order->status == domain::OrderStatus::PENDING) {
                order->transitionTo(domain::OrderStatus::CANCELLED);
                order->pendingReason = "idempotency key taken by another order";
                orderRepository_->update(*order);
            }
            std::cout << "[OrderService] Orphan order " << orphan.id << " cancelled" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to cancel orphan order " << orphan.id
                      << ": " << e.what() << std::endl;
        }
    }

    void releaseClaim(const std::string& key, const std::string& claimToken) {
        try {
            idempotencyRepository_->release(key, claimToken);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to release key " << key << ": " << e.what() << std::endl;
        }
    }

    void publishCreated(const domain::Order& order, const std::optional<std::string>& key) {
        publishSafely(domain::OrderEvent(domain::OrderEventType::ORDER_CREATED, order, key));
    }

    void publishKeyRegistered(const std::string& key, const domain::Order& order) {
        domain::IdempotencyEvent event(key, RESOURCE_TYPE, std::to_string(order.id),
                                       static_cast<int64_t>(settings_.getTtl().count()));
        publishSafely(event);
    }

    void publishSafely(const domain::DomainEvent& event) {
        try {
            eventPublisher_->publish(event.topic(), event.key(), event.toJson());
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to publish to " << event.topic()
                      << " key=" << event.key() << ": " << e.what() << std::endl;
        }
    }

    domain::Order requireOrder(int64_t orderId) {
        auto order = orderRepository_->findById(orderId);
        if (!order) {
            throw domain::OrderNotFoundError("Order not found: " + std::to_string(orderId));
        }
        return *order;
    }
};

} // namespace ordercore::application
