#pragma once

#include "domain/Errors.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace ordercore::resilience {

/**
 * @brief Ограничение времени одного вызова
 *
 * Вызов выполняется на собственном пуле потоков. Если он не уложился
 * в timeout, вызывающий получает GatewayTimeoutError, а сам вызов
 * брошен: его результат никто не прочитает. Прервать вызов, уже
 * ушедший в сеть, нельзя.
 *
 * @warning Брошенный вызов продолжает занимать поток пула, пока не вернётся.
 * Зависшие вызовы в количестве threads исчерпывают пул: следующие попытки
 * ждут в очереди и тоже уходят в таймаут. Деструктор ждёт завершения всех
 * брошенных вызовов. Поэтому сам вызов обязан ограничивать своё I/O
 * (HttpPaymentGateway ставит дедлайн на сокет).
 */
class TimeLimiter {
public:
    TimeLimiter(std::chrono::milliseconds timeout, size_t threads)
        : timeout_(timeout)
        , pool_(threads == 0 ? 1 : threads)
    {}

    ~TimeLimiter() {
        pool_.join();
    }

    TimeLimiter(const TimeLimiter&) = delete;
    TimeLimiter& operator=(const TimeLimiter&) = delete;

    std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Выполнить call с дедлайном
     * @throws GatewayTimeoutError при превышении timeout
     * @throws всё, что бросил call
     */
    template <typename R>
    R execute(std::function<R()> call) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(call));
        std::future<R> result = task->get_future();

        boost::asio::post(pool_, [task]() { (*task)(); });

        if (result.wait_for(timeout_) != std::future_status::ready) {
            throw domain::GatewayTimeoutError(
                "call timed out after " + std::to_string(timeout_.count()) + "ms");
        }
        return result.get();
    }

private:
    std::chrono::milliseconds timeout_;
    boost::asio::thread_pool pool_;
};

} // namespace ordercore::resilience
