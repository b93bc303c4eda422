#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "domain/Errors.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace ordercore::adapters::secondary {

/**
 * @brief RabbitMQ адаптер Event Bus
 *
 * Реализует IEventPublisher и IEventConsumer.
 *
 * Архитектура:
 * - Exchange: topic (orders.events), routing key = топик (order-events, idempotency-keys)
 * - Сообщения persistent, ключ партиционирования в заголовке message_key
 * - Publisher confirms: publish() ждёт ack брокера не дольше confirmTimeout
 * - Очередь потребителя durable (order-core.payments), ack после обработчиков
 *
 * AMQP-CPP не потокобезопасен: все операции с каналом выполняются на
 * потоке io_context, publish() только ставит их в очередь и ждёт.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , connected_(false)
        , ioContext_()
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        queueName_ = settings_->getQueue();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    /**
     * @brief Опубликовать событие и дождаться publisher confirm
     * @throws EventPublishError нет соединения, nack, потеря или таймаут
     */
    void publish(const std::string& topic, const std::string& key, const std::string& message) override {
        if (!running_ || !connected_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish: not connected" << std::endl;
            throw domain::EventPublishError("RabbitMQ not connected");
        }

        auto confirm = std::make_shared<PendingConfirm>();
        auto future = confirm->promise.get_future();

        boost::asio::post(ioContext_, [this, topic, key, message, confirm]() {
            if (!reliable_) {
                confirm->fail("channel closed");
                return;
            }

            AMQP::Envelope envelope(message.data(), message.size());
            envelope.setContentType("application/json");
            envelope.setPersistent(true);

            AMQP::Table headers;
            headers["message_key"] = key;
            envelope.setHeaders(headers);

            reliable_->publish(exchangeName_, topic, envelope)
                .onAck([confirm]() { confirm->succeed(); })
                .onNack([confirm]() { confirm->fail("nacked by broker"); })
                .onLost([confirm]() { confirm->fail("confirm lost"); })
                .onError([confirm](const char* msg) { confirm->fail(msg); });
        });

        auto timeout = std::chrono::milliseconds(settings_->getConfirmTimeoutMs());
        if (future.wait_for(timeout) != std::future_status::ready) {
            std::cerr << "[RabbitMQAdapter] Confirm timeout for " << topic << " key=" << key << std::endl;
            throw domain::EventPublishError("RabbitMQ confirm timeout after " +
                                            std::to_string(timeout.count()) + "ms");
        }
        future.get();

        std::cout << "[RabbitMQAdapter] Published " << topic << " key=" << key
                  << ": " << message.substr(0, 100) << "..." << std::endl;
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    void subscribe(const std::vector<std::string>& topics,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& topic : topics) {
            handlers_[topic].push_back(handler);
            pendingBindings_.push_back(topic);
        }
    }

    void start() override {
        if (running_) return;

        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
            connected_ = false;
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_) return;

        running_ = false;
        connected_ = false;
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        reliable_.reset();
        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

    bool isConnected() const { return connected_; }

private:
    /**
     * @brief Ожидание подтверждения одной публикации
     *
     * Колбэки AMQP-CPP могут прийти больше одного раза (nack + error),
     * promise выставляется только первым.
     */
    struct PendingConfirm {
        std::promise<void> promise;
        std::atomic<bool> settled{false};

        void succeed() {
            if (!settled.exchange(true)) {
                promise.set_value();
            }
        }

        void fail(const std::string& reason) {
            if (!settled.exchange(true)) {
                promise.set_exception(std::make_exception_ptr(
                    domain::EventPublishError("RabbitMQ publish failed: " + reason)));
            }
        }
    };

    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        workGuard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioContext_));

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());
        reliable_ = std::make_unique<AMQP::Reliable<>>(*channel_);

        channel_->onError([this](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
            connected_ = false;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                connected_ = true;
                setupBindings();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void setupBindings() {
        std::vector<std::string> topics;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            topics.swap(pendingBindings_);
        }
        if (topics.empty()) {
            return;
        }

        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this, topics](const std::string& name, uint32_t, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << name << std::endl;

                for (const auto& topic : topics) {
                    channel_->bindQueue(exchangeName_, name, topic);
                    std::cout << "[RabbitMQAdapter] Bound: " << topic << std::endl;
                }

                startConsuming(name);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue error: " << msg << std::endl;
            });
    }

    void startConsuming(const std::string& queue) {
        channel_->consume(queue)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool) {
                std::string topic = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::cout << "[RabbitMQAdapter] Received " << topic << std::endl;

                std::vector<ports::output::EventHandler> handlers;
                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    auto it = handlers_.find(topic);
                    if (it != handlers_.end()) {
                        handlers = it->second;
                    }
                }

                for (const auto& handler : handlers) {
                    try {
                        handler(topic, body);
                    } catch (const std::exception& e) {
                        std::cerr << "[RabbitMQAdapter] Handler error: " << e.what() << std::endl;
                    }
                }

                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string queueName_;

    std::atomic<bool> running_;
    std::atomic<bool> connected_;
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;
    std::unique_ptr<WorkGuard> workGuard_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::unique_ptr<AMQP::Reliable<>> reliable_;

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> pendingBindings_;
};

} // namespace ordercore::adapters::secondary
