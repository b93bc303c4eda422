#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ordercore::adapters::secondary {

/**
 * @brief In-memory Event Bus: партиционированный лог в памяти процесса
 *
 * Запись попадает в партицию hash(key) % partitions и получает в ней
 * монотонный offset. Подписчикам сообщение доставляется синхронно, на
 * потоке публикующего, пока шина запущена. Для тестов и локального запуска.
 */
class InMemoryEventBus : public ports::output::IEventPublisher,
                         public ports::output::IEventConsumer {
public:
    struct Record {
        std::string topic;
        std::string key;
        std::string message;
        size_t partition = 0;
        uint64_t offset = 0;
    };

    explicit InMemoryEventBus(size_t partitions = 4)
        : partitions_(partitions == 0 ? 1 : partitions)
        , running_(false)
    {}

    ~InMemoryEventBus() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& topic, const std::string& key, const std::string& message) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            Record record;
            record.topic = topic;
            record.key = key;
            record.message = message;
            record.partition = partitionFor(key);
            record.offset = nextOffset_[topic + "#" + std::to_string(record.partition)]++;
            log_.push_back(record);

            if (running_) {
                auto it = handlers_.find(topic);
                if (it != handlers_.end()) {
                    handlers = it->second;
                }
            }
        }

        // Вне lock: обработчик может сам публиковать
        for (const auto& handler : handlers) {
            try {
                handler(topic, message);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler error on " << topic << ": " << e.what() << std::endl;
            }
        }
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    void subscribe(const std::vector<std::string>& topics, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& topic : topics) {
            handlers_[topic].push_back(handler);
        }
    }

    void start() override {
        running_ = true;
    }

    void stop() override {
        running_ = false;
    }

    bool isRunning() const {
        return running_;
    }

    // =========================================================================
    // Инспекция (тесты)
    // =========================================================================

    size_t partitionFor(const std::string& key) const {
        return std::hash<std::string>{}(key) % partitions_;
    }

    size_t partitionCount() const { return partitions_; }

    /// Все записи топика в порядке публикации
    std::vector<Record> records(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Record> result;
        for (const auto& r : log_) {
            if (r.topic == topic) {
                result.push_back(r);
            }
        }
        return result;
    }

    std::vector<Record> records(const std::string& topic, size_t partition) const {
        std::vector<Record> result;
        for (auto& r : records(topic)) {
            if (r.partition == partition) {
                result.push_back(std::move(r));
            }
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_.size();
    }

    size_t subscriberCount(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(topic);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.clear();
        nextOffset_.clear();
    }

private:
    size_t partitions_;
    std::atomic<bool> running_;

    mutable std::mutex mutex_;
    std::vector<Record> log_;
    std::unordered_map<std::string, uint64_t> nextOffset_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
};

} // namespace ordercore::adapters::secondary
