#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>

namespace ordercore::adapters::secondary {

/**
 * @brief In-memory Idempotency Ledger
 *
 * Один мьютекс на всю таблицу: registerKey линеаризуем.
 * Часы подменяются в тестах, чтобы проверять истечение TTL без sleep.
 */
class InMemoryIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    using Clock = std::function<domain::Timestamp()>;

    InMemoryIdempotencyRepository()
        : clock_([] { return domain::Timestamp::now(); })
    {}

    explicit InMemoryIdempotencyRepository(Clock clock)
        : clock_(std::move(clock))
    {}

    std::optional<domain::IdempotencyRecord> lookup(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(key);
        if (it == records_.end() || it->second.isExpired(clock_())) {
            return std::nullopt;
        }
        return it->second;
    }

    domain::RegistrationResult registerKey(const domain::IdempotencyRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::RegistrationResult result;

        auto it = records_.find(record.key);
        if (it != records_.end() && !it->second.isExpired(clock_())) {
            result.registered = false;
            result.existing = it->second;
            return result;
        }

        records_[record.key] = record;
        result.registered = true;
        return result;
    }

    bool complete(const std::string& key, const std::string& claimToken,
                  const std::string& resourceId, std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        auto it = records_.find(key);
        if (it == records_.end() || it->second.isExpired(now) || !it->second.isPending() ||
            it->second.claimToken != claimToken) {
            return false;
        }
        it->second.resourceId = resourceId;
        it->second.expiresAt = now.plus(ttl);
        return true;
    }

    void release(const std::string& key, const std::string& claimToken) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(key);
        if (it != records_.end() && it->second.isPending() && it->second.claimToken == claimToken) {
            records_.erase(it);
        }
    }

    size_t purgeExpired() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (it->second.isExpired(now)) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /// Всего записей, включая просроченные
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::IdempotencyRecord> records_;
};

} // namespace ordercore::adapters::secondary
