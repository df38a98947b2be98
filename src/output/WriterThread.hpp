#pragma once

#include "ISink.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <queue>
#include <set>
#include <thread>

namespace output
{

// Owns every filesystem write of a run. Tasks are applied in submission order on
// one background thread; close() waits until the queue is empty.
class WriterThread : public ISink
{
public:
    WriterThread();
    ~WriterThread() override;

    WriterThread(const WriterThread&) = delete;
    WriterThread& operator=(const WriterThread&) = delete;

    void start();
    void submit(WriteTask task) override;
    void close();

    std::size_t failedWrites() const { return failed_writes_.load(std::memory_order_relaxed); }
    std::size_t completedWrites() const { return completed_writes_.load(std::memory_order_relaxed); }

private:
    void workerLoop();
    void apply(const WriteTask& task);

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<WriteTask> queue_;
    bool closing_ = false;
    bool started_ = false;

    // Only touched by the worker thread.
    std::set<std::filesystem::path> backed_up_;

    std::atomic<std::size_t> failed_writes_{ 0 };
    std::atomic<std::size_t> completed_writes_{ 0 };
};

} // namespace output
