#pragma once

#include "output/ISink.hpp"

#include <mutex>
#include <vector>

namespace test_utils {

// Collects every write instead of touching the filesystem.
class RecordingSink : public output::ISink {
public:
    void submit(output::WriteTask task) override {
        std::lock_guard<std::mutex> lk(mutex_);
        tasks_.push_back(std::move(task));
    }

    std::vector<output::WriteTask> tasks() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return tasks_;
    }

    // Replays the recorded writes the way the writer thread would apply them.
    std::string contentOf(const std::filesystem::path& path) const {
        std::lock_guard<std::mutex> lk(mutex_);
        std::string content;
        for (const auto& task : tasks_) {
            if (task.path != path)
                continue;
            if (task.mode == output::WriteMode::Replace)
                content = task.content;
            else
                content += task.content;
        }
        return content;
    }

private:
    mutable std::mutex mutex_;
    std::vector<output::WriteTask> tasks_;
};

}  // namespace test_utils
