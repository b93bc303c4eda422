#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace ordercore::application {

/**
 * @brief Фоновая чистка просроченных ключей идемпотентности
 *
 * На корректность не влияет (просроченная запись и так не видна),
 * только ограничивает рост таблицы.
 *
 * @example
 * ```cpp
 * IdempotencyPurger purger(idempotencyRepo);
 * purger.start(std::chrono::hours(1));
 * // ...
 * purger.stop();
 * ```
 */
class IdempotencyPurger {
public:
    explicit IdempotencyPurger(std::shared_ptr<ports::output::IIdempotencyRepository> repository)
        : repository_(std::move(repository))
        , running_(false)
        , purgedTotal_(0)
    {}

    ~IdempotencyPurger() {
        stop();
    }

    IdempotencyPurger(const IdempotencyPurger&) = delete;
    IdempotencyPurger& operator=(const IdempotencyPurger&) = delete;

    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) {
            return;
        }

        workerThread_ = std::thread([this, interval]() {
            runLoop(interval);
        });
        std::cout << "[IdempotencyPurger] Started, interval=" << interval.count() << "ms" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        cv_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[IdempotencyPurger] Stopped" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief Один проход вручную (для тестов)
     * @return Сколько записей удалено
     */
    size_t purgeOnce() {
        try {
            size_t removed = repository_->purgeExpired();
            purgedTotal_ += removed;
            if (removed > 0) {
                std::cout << "[IdempotencyPurger] Purged " << removed << " expired keys" << std::endl;
            }
            return removed;
        } catch (const std::exception& e) {
            std::cerr << "[IdempotencyPurger] Purge failed: " << e.what() << std::endl;
            return 0;
        }
    }

    uint64_t purgedTotal() const {
        return purgedTotal_.load();
    }

private:
    void runLoop(std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_.load()) {
            if (cv_.wait_for(lock, interval, [this] { return !running_.load(); })) {
                break;
            }
            lock.unlock();
            purgeOnce();
            lock.lock();
        }
    }

    std::shared_ptr<ports::output::IIdempotencyRepository> repository_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> purgedTotal_;
    std::thread workerThread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace ordercore::application
