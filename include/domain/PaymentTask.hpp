#pragma once

#include "PaymentResult.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace ordercore::domain {

/**
 * @brief Хэндл асинхронной оплаты
 *
 * Возвращается из processPayment сразу, результат появляется на фоновом
 * executor'е. Можно ждать (get/waitFor), опрашивать (isReady) или повесить
 * продолжение (then).
 *
 * Продолжение, повешенное на уже завершённую задачу, уходит в dispatcher
 * состояния (у оркестратора это его executor), а не выполняется на потоке
 * вызывающего. Поэтому then() нельзя вызывать после разрушения оркестратора.
 *
 * cancel() - только совет: попытки между ретраями прекращаются, но уже
 * отправленный в шлюз вызов не отзывается. Отмена не является отказом платежа.
 */
class PaymentTask {
public:
    using Continuation = std::function<void(const PaymentResult&)>;
    using Dispatcher = std::function<void(std::function<void()>)>;

    /**
     * @brief Общее состояние задачи (executor пишет, вызывающий читает)
     */
    class State {
    public:
        explicit State(Dispatcher dispatcher = nullptr)
            : future_(promise_.get_future().share())
            , dispatcher_(std::move(dispatcher))
        {}

        void complete(const PaymentResult& result) {
            std::vector<Continuation> callbacks;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (settled_) return;
                settled_ = true;
                result_ = result;
                callbacks.swap(continuations_);
            }
            promise_.set_value(result);
            for (const auto& cb : callbacks) {
                invoke(cb, result);
            }
        }

        void fail(std::exception_ptr error) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (settled_) return;
                settled_ = true;
                continuations_.clear();
            }
            promise_.set_exception(error);
        }

        void addContinuation(Continuation cb) {
            std::optional<PaymentResult> ready;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!settled_) {
                    continuations_.push_back(std::move(cb));
                    return;
                }
                ready = result_;
            }
            if (!ready) {
                return;
            }
            if (dispatcher_) {
                PaymentResult result = *ready;
                dispatcher_([cb = std::move(cb), result]() { invoke(cb, result); });
            } else {
                invoke(cb, *ready);
            }
        }

        void cancel() { cancelled_ = true; }
        bool isCancelled() const { return cancelled_; }

        const std::shared_future<PaymentResult>& future() const { return future_; }

    private:
        static void invoke(const Continuation& cb, const PaymentResult& result) {
            try {
                cb(result);
            } catch (const std::exception& e) {
                std::cerr << "[PaymentTask] Continuation error: " << e.what() << std::endl;
            }
        }

        std::promise<PaymentResult> promise_;
        std::shared_future<PaymentResult> future_;
        Dispatcher dispatcher_;
        std::mutex mutex_;
        bool settled_ = false;
        std::optional<PaymentResult> result_;
        std::vector<Continuation> continuations_;
        std::atomic<bool> cancelled_{false};
    };

    explicit PaymentTask(std::shared_ptr<State> state) : state_(std::move(state)) {}

    static std::shared_ptr<State> makeState(Dispatcher dispatcher = nullptr) {
        return std::make_shared<State>(std::move(dispatcher));
    }

    /**
     * @brief Дождаться результата
     * @throws PaymentCancelledError если задача отменена до завершения
     */
    PaymentResult get() const {
        return state_->future().get();
    }

    bool isReady() const {
        return state_->future().wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        return state_->future().wait_for(timeout) == std::future_status::ready;
    }

    /**
     * @brief Продолжение вызывается на потоке, завершившем задачу, или
     *        через dispatcher, если задача уже готова (без dispatcher - сразу)
     */
    void then(Continuation cb) {
        state_->addContinuation(std::move(cb));
    }

    void cancel() { state_->cancel(); }
    bool isCancelled() const { return state_->isCancelled(); }

private:
    std::shared_ptr<State> state_;
};

} // namespace ordercore::domain
