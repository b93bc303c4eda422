#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

namespace ordercore::utils {

/**
 * @brief Потокобезопасная map с shared_ptr значениями
 *
 * Чтения берут shared_lock, записи - unique_lock.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить, только если ключа ещё нет
     * @return true если вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    /**
     * @brief Вернуть существующее значение или атомарно создать через factory
     */
    template <typename Factory>
    std::shared_ptr<V> findOrInsert(const K &key, Factory &&factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
                return it->second;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
            return it->second;
        auto value = factory();
        map_.emplace(key, value);
        return value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
            result.push_back(entry.second);
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

} // namespace ordercore::utils
