#pragma once

#include <cstddef>
#include <list>
#include <unordered_map>
#include <utility>

namespace utils
{

// Count-bounded LRU map. Capacity 0 means unbounded.
// Not thread-safe; owners serialize access.
template <typename K, typename V>
class LRUCache
{
public:
    explicit LRUCache(std::size_t capacity = 0)
        : capacity_(capacity)
    {
    }

    std::size_t size() const { return items_.size(); }
    bool contains(const K& key) const { return map_.find(key) != map_.end(); }

    bool get(const K& key, V& out)
    {
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        items_.splice(items_.begin(), items_, it->second);
        out = it->second->second;
        return true;
    }

    // Returns true when the key was not present before.
    bool put(const K& key, V val)
    {
        auto it = map_.find(key);
        if (it != map_.end())
        {
            it->second->second = std::move(val);
            items_.splice(items_.begin(), items_, it->second);
            return false;
        }
        items_.emplace_front(key, std::move(val));
        map_[items_.front().first] = items_.begin();
        trim();
        return true;
    }

    void clear()
    {
        items_.clear();
        map_.clear();
    }

private:
    void trim()
    {
        while (capacity_ > 0 && items_.size() > capacity_)
        {
            map_.erase(items_.back().first);
            items_.pop_back();
        }
    }

    std::size_t capacity_;
    std::list<std::pair<K, V>> items_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
};

} // namespace utils
