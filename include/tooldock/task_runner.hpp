#ifndef TOOLDOCK_TASK_RUNNER_HPP
#define TOOLDOCK_TASK_RUNNER_HPP

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace tooldock {

// Runs each submitted command on its own managed thread. Finished threads
// are reaped on the next submission, the rest are joined on shutdown.
class TaskRunner {
public:
    static TaskRunner& instance();

    // Runs f on a new thread and returns a future for its result. Exceptions
    // thrown by f surface from future::get().
    template<typename F>
    auto async(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using return_type = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = task->get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::lock_guard<std::mutex> lock(mutex_);
        reap();
        workers_.push_back(Worker{std::jthread([task, done]() {
                                      (*task)();
                                      done->store(true);
                                  }),
                                  done});
        return res;
    }

    // Number of tasks not yet reaped (running or finished).
    size_t size();

    // Ensures all threads are joined. Called on app shutdown.
    void shutdown();

    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

private:
    TaskRunner() = default;

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Caller holds mutex_
    void reap() {
        std::erase_if(workers_, [](const Worker& w) { return w.done->load(); });
    }

    std::vector<Worker> workers_;
    std::mutex mutex_;
};

} // namespace tooldock

#endif // TOOLDOCK_TASK_RUNNER_HPP
