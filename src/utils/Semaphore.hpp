#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace utils
{

// Counting semaphore with an RAII slot guard. Used for the pending-batch
// and request-concurrency limits, which are sized at runtime.
class Semaphore
{
public:
    explicit Semaphore(std::size_t slots)
        : available_(slots == 0 ? 1 : slots)
    {
    }

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    void acquire()
    {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [this] { return available_ > 0; });
        --available_;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            ++available_;
        }
        cv_.notify_one();
    }

    // Owns one slot until destroyed or released early.
    class Guard
    {
    public:
        explicit Guard(Semaphore& sem)
            : sem_(&sem)
        {
            sem_->acquire();
        }

        // Takes over a slot that was acquired earlier, possibly on another thread.
        Guard(Semaphore& sem, std::adopt_lock_t)
            : sem_(&sem)
        {
        }

        Guard(Guard&& other) noexcept
            : sem_(other.sem_)
        {
            other.sem_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() { release(); }

        void release()
        {
            if (sem_)
            {
                sem_->release();
                sem_ = nullptr;
            }
        }

    private:
        Semaphore* sem_;
    };

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::size_t available_;
};

} // namespace utils
