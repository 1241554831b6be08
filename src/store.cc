#include "kvwire/store.h"

#include <mutex>

namespace kvwire
{
    using lock_guard = std::lock_guard<photon_std::mutex>;

    std::optional<Frame> MemoryStore::get(const std::string& key)
    {
        lock_guard lock(mu_);
        if (const auto it = data_.find(key); it != data_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void MemoryStore::set(std::string key, Frame value)
    {
        lock_guard lock(mu_);
        data_.insert_or_assign(std::move(key), std::move(value));
    }

    bool MemoryStore::del(const std::string& key)
    {
        lock_guard lock(mu_);
        return data_.erase(key) > 0;
    }

    size_t MemoryStore::clear()
    {
        lock_guard lock(mu_);
        const auto removed = data_.size();
        data_.clear();
        return removed;
    }

    std::vector<std::optional<Frame>> MemoryStore::multi_get(const std::vector<std::string>& keys)
    {
        std::vector<std::optional<Frame>> values;
        values.reserve(keys.size());
        lock_guard lock(mu_);
        for (const auto& key: keys)
        {
            if (const auto it = data_.find(key); it != data_.end())
            {
                values.emplace_back(it->second);
            }
            else
            {
                values.emplace_back(std::nullopt);
            }
        }
        return values;
    }

    size_t MemoryStore::multi_set(std::vector<std::pair<std::string, Frame>> pairs)
    {
        lock_guard lock(mu_);
        for (auto& [key, value]: pairs)
        {
            data_.insert_or_assign(std::move(key), std::move(value));
        }
        return pairs.size();
    }

    size_t MemoryStore::size()
    {
        lock_guard lock(mu_);
        return data_.size();
    }
}  // namespace kvwire
