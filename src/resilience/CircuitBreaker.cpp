#include "resilience/CircuitBreaker.hpp"
#include <iostream>

namespace ordercore::resilience {

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config, TimeSource clock)
    : name_(std::move(name))
    , config_(config)
    , clock_(std::move(clock))
{
    if (config_.slidingWindowSize == 0) {
        config_.slidingWindowSize = 1;
    }
    if (config_.minimumNumberOfCalls > config_.slidingWindowSize) {
        config_.minimumNumberOfCalls = config_.slidingWindowSize;
    }
    if (config_.permittedCallsInHalfOpenState == 0) {
        config_.permittedCallsInHalfOpenState = 1;
    }
}

std::optional<CircuitBreaker::Permit> CircuitBreaker::tryAcquirePermission() {
    std::vector<Transition> transitions;
    std::optional<Permit> permit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refreshLocked(transitions);

        switch (state_) {
            case CircuitState::CLOSED:
                permit = Permit{generation_, state_};
                break;
            case CircuitState::HALF_OPEN:
                if (halfOpenInFlight_ + halfOpenSuccesses_ < config_.permittedCallsInHalfOpenState) {
                    ++halfOpenInFlight_;
                    permit = Permit{generation_, state_};
                } else {
                    ++notPermitted_;
                }
                break;
            case CircuitState::OPEN:
                ++notPermitted_;
                break;
        }
    }
    notify(transitions);
    return permit;
}

void CircuitBreaker::onSuccess(const Permit& permit) {
    record(permit, false);
}

void CircuitBreaker::onError(const Permit& permit) {
    record(permit, true);
}

void CircuitBreaker::onIgnored(const Permit& permit) {
    releaseHalfOpenSlot(permit);
}

void CircuitBreaker::record(const Permit& permit, bool failed) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (permit.generation != generation_) {
            return;
        }

        if (state_ == CircuitState::CLOSED) {
            window_.push_back(failed);
            while (window_.size() > config_.slidingWindowSize) {
                window_.pop_front();
            }
            if (window_.size() >= config_.minimumNumberOfCalls &&
                failureRateLocked() >= config_.failureRateThreshold) {
                transitionLocked(CircuitState::OPEN, transitions);
            }
        } else if (state_ == CircuitState::HALF_OPEN) {
            if (halfOpenInFlight_ > 0) {
                --halfOpenInFlight_;
            }
            if (failed) {
                transitionLocked(CircuitState::OPEN, transitions);
            } else if (++halfOpenSuccesses_ >= config_.permittedCallsInHalfOpenState) {
                transitionLocked(CircuitState::CLOSED, transitions);
            }
        }
    }
    notify(transitions);
}

void CircuitBreaker::releaseHalfOpenSlot(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permit.generation == generation_ && state_ == CircuitState::HALF_OPEN && halfOpenInFlight_ > 0) {
        --halfOpenInFlight_;
    }
}

CircuitState CircuitBreaker::state() {
    std::vector<Transition> transitions;
    CircuitState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refreshLocked(transitions);
        current = state_;
    }
    notify(transitions);
    return current;
}

CircuitBreakerMetrics CircuitBreaker::metrics() {
    std::vector<Transition> transitions;
    CircuitBreakerMetrics m;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refreshLocked(transitions);
        m.state = state_;
        m.bufferedCalls = window_.size();
        m.failedCalls = failedCallsLocked();
        m.failureRate = window_.size() >= config_.minimumNumberOfCalls ? failureRateLocked() : -1.0;
        m.notPermittedCalls = notPermitted_;
    }
    notify(transitions);
    return m;
}

void CircuitBreaker::transitionToOpen() {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transitionLocked(CircuitState::OPEN, transitions);
    }
    notify(transitions);
}

void CircuitBreaker::reset() {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transitionLocked(CircuitState::CLOSED, transitions);
        notPermitted_ = 0;
    }
    notify(transitions);
}

void CircuitBreaker::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void CircuitBreaker::refreshLocked(std::vector<Transition>& transitions) {
    if (state_ == CircuitState::OPEN &&
        clock_() - openedAt_ >= config_.waitDurationInOpenState) {
        transitionLocked(CircuitState::HALF_OPEN, transitions);
    }
}

void CircuitBreaker::transitionLocked(CircuitState to, std::vector<Transition>& transitions) {
    CircuitState from = state_;
    state_ = to;
    ++generation_;
    window_.clear();
    halfOpenInFlight_ = 0;
    halfOpenSuccesses_ = 0;
    if (to == CircuitState::OPEN) {
        openedAt_ = clock_();
    }
    if (from != to) {
        transitions.push_back({from, to});
    }
}

double CircuitBreaker::failureRateLocked() const {
    if (window_.empty()) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(failedCallsLocked()) / static_cast<double>(window_.size());
}

size_t CircuitBreaker::failedCallsLocked() const {
    size_t failed = 0;
    for (bool f : window_) {
        if (f) ++failed;
    }
    return failed;
}

void CircuitBreaker::notify(const std::vector<Transition>& transitions) {
    if (transitions.empty()) {
        return;
    }
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    for (const auto& t : transitions) {
        std::cout << "[CircuitBreaker] " << name_ << ": "
                  << toString(t.from) << " -> " << toString(t.to) << std::endl;
        if (listener) {
            listener(name_, t.from, t.to);
        }
    }
}

} // namespace ordercore::resilience
