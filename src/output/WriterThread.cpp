#include "WriterThread.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/FileUtils.hpp"

#include <plog/Log.h>

namespace output
{

WriterThread::WriterThread() = default;

WriterThread::~WriterThread()
{
    close();
}

void WriterThread::start()
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (started_)
        return;
    started_ = true;
    closing_ = false;
    worker_ = std::thread(&WriterThread::workerLoop, this);
}

void WriterThread::submit(WriteTask task)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closing_ || !started_)
        {
            PLOG_ERROR << "WriterThread: dropping write to " << task.path.string() << " (writer not running)";
            failed_writes_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void WriterThread::close()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!started_)
            return;
        closing_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable())
        worker_.join();

    std::lock_guard<std::mutex> lk(mutex_);
    started_ = false;
}

void WriterThread::workerLoop()
{
    while (true)
    {
        WriteTask task;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this] { return closing_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop();
        }
        apply(task);
    }
}

void WriterThread::apply(const WriteTask& task)
{
    std::string error;
    bool ok = false;
    if (task.mode == WriteMode::Append)
    {
        ok = utils::append_text(task.path, task.content, error);
    }
    else
    {
        const bool effective_backup = task.backup && backed_up_.find(task.path) == backed_up_.end();
        ok = utils::atomic_write(task.path, task.content, effective_backup, error);
        if (ok && effective_backup)
            backed_up_.insert(task.path);
    }

    if (!ok)
    {
        failed_writes_.fetch_add(1, std::memory_order_relaxed);
        PLOG_ERROR << "Failed to write " << task.path.string() << ": " << error;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Output, "Failed to write " + task.path.string(),
                                          error);
        return;
    }
    completed_writes_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace output
