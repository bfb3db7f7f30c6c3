#include "tooldock/task_runner.hpp"
#include "tooldock/logger.hpp"

namespace tooldock {

TaskRunner& TaskRunner::instance() {
    static TaskRunner instance;
    return instance;
}

size_t TaskRunner::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap();
    return workers_.size();
}

void TaskRunner::shutdown() {
    std::vector<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(workers_);
    }
    if (pending.empty()) return;

    LOG_INFO("Waiting for " + std::to_string(pending.size()) + " background task(s)...");
    // jthread joins on destruction
    pending.clear();
    LOG_INFO("TaskRunner shutdown complete.");
}

TaskRunner::~TaskRunner() {
    // The logger may already be gone during static destruction, so join
    // quietly here.
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.clear();
}

} // namespace tooldock
