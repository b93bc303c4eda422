#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/input/IPaymentService.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "domain/events/OrderEvent.hpp"
#include "domain/Timestamp.hpp"
#include "utils/ThreadSafeMap.hpp"
#include <atomic>
#include <iostream>
#include <memory>

namespace ordercore::application {

/**
 * @brief Запуск оплаты по событию ORDER_CREATED
 *
 * Слушает order-events. На каждый созданный заказ вызывает processPayment,
 * итог оплаты отражается в заказе через applyPaymentResult. Остальные
 * типы событий пропускаются.
 *
 * Доставка at-least-once: оплата запускается только для заказа в статусе
 * PENDING и не больше одной на заказ одновременно. Повторная доставка
 * ORDER_CREATED после оплаты ничего не списывает.
 */
class PaymentEventHandler {
public:
    PaymentEventHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::input::IOrderService> orderService,
        std::shared_ptr<ports::input::IPaymentService> paymentService
    ) : eventConsumer_(std::move(eventConsumer))
      , orderService_(std::move(orderService))
      , paymentService_(std::move(paymentService))
      , inFlight_(std::make_shared<InFlightPayments>())
    {
        std::cout << "[PaymentEventHandler] Created" << std::endl;
        subscribe();
    }

    /// Сколько оплат запущено (для тестов и логов)
    int triggeredCount() const { return triggered_.load(); }

    /// Сколько ORDER_CREATED пропущено как повторные
    int skippedCount() const { return skipped_.load(); }

private:
    /// orderId -> момент запуска оплаты
    using InFlightPayments = utils::ThreadSafeMap<int64_t, domain::Timestamp>;

    void subscribe() {
        eventConsumer_->subscribe(
            {domain::OrderEvent::TOPIC},
            [this](const std::string& topic, const std::string& message) {
                handleEvent(topic, message);
            }
        );
        std::cout << "[PaymentEventHandler] Subscribed to " << domain::OrderEvent::TOPIC << std::endl;
    }

    void handleEvent(const std::string& topic, const std::string& message) {
        try {
            auto event = domain::OrderEvent::fromJson(message);
            if (event.eventType != domain::OrderEventType::ORDER_CREATED) {
                return;
            }

            int64_t orderId = event.orderId;
            auto order = orderService_->getOrder(orderId);
            if (!order) {
                std::cerr << "[PaymentEventHandler] ORDER_CREATED for unknown order " << orderId << std::endl;
                ++skipped_;
                return;
            }
            if (order->status != domain::OrderStatus::PENDING) {
                std::cout << "[PaymentEventHandler] Order " << orderId << " already "
                          << domain::toString(order->status) << ", redelivery skipped" << std::endl;
                ++skipped_;
                return;
            }
            if (!inFlight_->insertIfAbsent(orderId, std::make_shared<domain::Timestamp>(domain::Timestamp::now()))) {
                std::cout << "[PaymentEventHandler] Payment for order " << orderId
                          << " already in progress, redelivery skipped" << std::endl;
                ++skipped_;
                return;
            }

            std::cout << "[PaymentEventHandler] " << topic << ": ORDER_CREATED "
                      << orderId << ", starting payment" << std::endl;
            ++triggered_;

            auto task = paymentService_->processPayment(orderId);
            auto orderService = orderService_;
            auto inFlight = inFlight_;
            // Выполняется на executor'е оплаты, не на потоке потребителя
            task.then([orderService, inFlight, orderId](const domain::PaymentResult& result) {
                try {
                    orderService->applyPaymentResult(orderId, result);
                } catch (const std::exception& e) {
                    std::cerr << "[PaymentEventHandler] Failed to apply payment for order "
                              << orderId << ": " << e.what() << std::endl;
                }
                inFlight->erase(orderId);
            });

        } catch (const std::exception& e) {
            std::cerr << "[PaymentEventHandler] Error: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::input::IOrderService> orderService_;
    std::shared_ptr<ports::input::IPaymentService> paymentService_;
    std::shared_ptr<InFlightPayments> inFlight_;
    std::atomic<int> triggered_{0};
    std::atomic<int> skipped_{0};
};

} // namespace ordercore::application
