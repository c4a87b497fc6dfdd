#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасная таблица разделяемых объектов
 *
 * Значения живут в shared_ptr: найденный объект остаётся валидным,
 * даже если запись в таблице будет заменена.
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

    /**
     * @brief Найти значение или создать V по умолчанию
     *
     * Два потока, запросившие один ключ, всегда получают один и тот же объект.
     */
    std::shared_ptr<V> getOrCreate(const K &key)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.try_emplace(key, nullptr);
        if (inserted)
        {
            it->second = std::make_shared<V>();
        }
        return it->second;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
        {
            result.push_back(value);
        }
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
