// include/OrderCoreApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/AppSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/IdempotencySettings.hpp"
#include "settings/PaymentGatewaySettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/ResilienceSettings.hpp"

// Ports
#include "ports/input/IOrderService.hpp"
#include "ports/input/IPaymentService.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IPaymentGateway.hpp"

// Application
#include "application/IdempotencyPurger.hpp"
#include "application/OrderService.hpp"
#include "application/PaymentEventHandler.hpp"
#include "application/PaymentOrchestrator.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/payment/HttpPaymentGateway.hpp"
#include "adapters/secondary/persistence/InMemoryIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace di = boost::di;

namespace ordercore
{

    /**
     * @brief Order Core Service Application (Event-Driven)
     *
     * Публикует: order-events, idempotency-keys (в orders.events)
     * Слушает: order-events (ORDER_CREATED -> оплата)
     * Входящий HTTP-слой внешний: он вызывает IOrderService / IPaymentService.
     */
    class OrderCoreApp
    {
    public:
        OrderCoreApp() { std::cout << "[OrderCoreApp] Initializing..." << std::endl; }
        ~OrderCoreApp() { std::cout << "[OrderCoreApp] Shutting down..." << std::endl; }

        /**
         * @brief Собрать зависимости, запустить потребителя и ждать stop()
         */
        int run()
        {
            configureInjection();

            purger_->start(std::chrono::duration_cast<std::chrono::milliseconds>(
                idempotencySettings_.getPurgeInterval()));

            std::cout << "[OrderCoreApp] Ready" << std::endl;
            while (!stopRequested_.load())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }

            shutdown();
            return 0;
        }

        /// Безопасно вызывать из обработчика сигнала: только выставляет флаг
        void stop() { stopRequested_.store(true); }

        std::shared_ptr<ports::input::IOrderService> orderService() const { return orderService_; }
        std::shared_ptr<ports::input::IPaymentService> paymentService() const { return paymentService_; }

    protected:
        void configureInjection()
        {
            std::cout << "[OrderCoreApp] Configuring DI (backend=" << appSettings_.getBackend() << ")..." << std::endl;

            // Один реестр breaker'ов на процесс
            auto breakers = std::make_shared<resilience::CircuitBreakerRegistry>();

            if (appSettings_.isInMemory())
            {
                configureInMemory(breakers);
            }
            else
            {
                configureInfrastructure(breakers);
            }
        }

    private:
        void configureInfrastructure(const std::shared_ptr<resilience::CircuitBreakerRegistry> &breakers)
        {
            // Шаг 1: RabbitMQAdapter через DI (один экземпляр для Publisher и Consumer)
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            auto rabbitMQAdapter = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: основной injector с instance binding для RabbitMQ и реестра
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::IdempotencySettings>().in(di::singleton),
                di::bind<settings::ResilienceSettings>().in(di::singleton),
                di::bind<settings::PaymentGatewaySettings>().in(di::singleton),

                di::bind<ports::output::IOrderRepository>()
                    .to<adapters::secondary::PostgresOrderRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IIdempotencyRepository>()
                    .to<adapters::secondary::PostgresIdempotencyRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IPaymentGateway>()
                    .to<adapters::secondary::HttpPaymentGateway>()
                    .in(di::singleton),

                di::bind<resilience::CircuitBreakerRegistry>().to(breakers),

                // RabbitMQ - один экземпляр для обоих интерфейсов
                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter),
                di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter),

                di::bind<ports::input::IOrderService>().to<application::OrderService>().in(di::singleton),
                di::bind<ports::input::IPaymentService>().to<application::PaymentOrchestrator>().in(di::singleton));

            resolve(injector);
        }

        void configureInMemory(const std::shared_ptr<resilience::CircuitBreakerRegistry> &breakers)
        {
            auto eventBus = std::make_shared<adapters::secondary::InMemoryEventBus>();
            auto idempotencyRepo = std::make_shared<adapters::secondary::InMemoryIdempotencyRepository>();

            auto injector = di::make_injector(
                di::bind<settings::IdempotencySettings>().in(di::singleton),
                di::bind<settings::ResilienceSettings>().in(di::singleton),
                di::bind<settings::PaymentGatewaySettings>().in(di::singleton),

                di::bind<ports::output::IOrderRepository>()
                    .to<adapters::secondary::InMemoryOrderRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IIdempotencyRepository>().to(idempotencyRepo),
                di::bind<ports::output::IPaymentGateway>()
                    .to<adapters::secondary::HttpPaymentGateway>()
                    .in(di::singleton),

                di::bind<resilience::CircuitBreakerRegistry>().to(breakers),

                di::bind<ports::output::IEventPublisher>().to(eventBus),
                di::bind<ports::output::IEventConsumer>().to(eventBus),

                di::bind<ports::input::IOrderService>().to<application::OrderService>().in(di::singleton),
                di::bind<ports::input::IPaymentService>().to<application::PaymentOrchestrator>().in(di::singleton));

            resolve(injector);
        }

        template <typename Injector>
        void resolve(Injector &injector)
        {
            idempotencySettings_ = injector.template create<settings::IdempotencySettings>();
            orderService_ = injector.template create<std::shared_ptr<ports::input::IOrderService>>();
            paymentService_ = injector.template create<std::shared_ptr<ports::input::IPaymentService>>();
            eventConsumer_ = injector.template create<std::shared_ptr<ports::output::IEventConsumer>>();

            // Шаг 3: PaymentEventHandler вызывает subscribe() в конструкторе
            paymentEventHandler_ = injector.template create<std::shared_ptr<application::PaymentEventHandler>>();

            purger_ = std::make_unique<application::IdempotencyPurger>(
                injector.template create<std::shared_ptr<ports::output::IIdempotencyRepository>>());

            // Шаг 4: запускаем потребителя ПОСЛЕ регистрации всех handlers
            std::cout << "[OrderCoreApp] Starting event consumer..." << std::endl;
            eventConsumer_->start();
        }

        void shutdown()
        {
            if (purger_)
            {
                purger_->stop();
            }
            if (eventConsumer_)
            {
                eventConsumer_->stop();
            }
        }

        settings::AppSettings appSettings_;
        settings::IdempotencySettings idempotencySettings_;
        std::atomic<bool> stopRequested_{false};

        std::shared_ptr<ports::input::IOrderService> orderService_;
        std::shared_ptr<ports::input::IPaymentService> paymentService_;
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
        std::shared_ptr<application::PaymentEventHandler> paymentEventHandler_;
        std::unique_ptr<application::IdempotencyPurger> purger_;
    };

} // namespace ordercore
