#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

/**
 * @brief Словарь с разделяемыми значениями под shared_mutex
 *
 * Значения отдаются как shared_ptr на неизменяемую копию: читатель
 * держит снимок, писатель заменяет его целиком через update().
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

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Атомарно заменить значение: mutate получает копию текущего (или V{})
     */
    void update(const K &key, const std::function<void(V &)> &mutate)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        auto next = (it != map_.end() && it->second) ? std::make_shared<V>(*it->second)
                                                     : std::make_shared<V>();
        mutate(*next);
        map_[key] = next;
    }

    std::vector<K> keys() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
            result.push_back(entry.first);
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
