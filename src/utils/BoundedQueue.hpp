#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace utils
{

// Blocking multi-producer/multi-consumer queue with a fixed capacity.
// push() waits for space, pop() waits for an item. After close(), push()
// fails and pop() drains what is left before returning std::nullopt.
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(m_);
        not_full_.wait(lock, [this] { return closed_ || q_.size() < capacity_; });
        if (closed_)
            return false;
        q_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(m_);
        not_empty_.wait(lock, [this] { return closed_ || !q_.empty(); });
        if (q_.empty())
            return std::nullopt;
        T item = std::move(q_.front());
        q_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> q_;
    std::size_t capacity_;
    bool closed_ = false;
};

} // namespace utils
