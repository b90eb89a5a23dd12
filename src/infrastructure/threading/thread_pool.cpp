// EN: Implementation of the ThreadPool class.
// FR: Implémentation de la classe ThreadPool.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace SSD {

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : config_(config) {
    if (config_.threads == 0) {
        config_.threads = std::max(1u, std::thread::hardware_concurrency());
    }

    workers_.reserve(config_.threads);
    for (size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    SSD_LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }
    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    SSD_LOG_DEBUG("threadpool", "Thread pool stopped after " +
                  std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    ThreadPoolStats stats;
    stats.total_threads = workers_.size();
    stats.active_threads = active_threads_.load();
    stats.queued_tasks = task_queue_.size();
    stats.completed_tasks = completed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_;
    return stats;
}

// EN: Exceptions thrown by a task are stored in its future by packaged_task.
// FR: Les exceptions levées par une tâche sont stockées dans son future par packaged_task.
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> function;
        std::string name;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });
            if (task_queue_.empty()) {
                return;
            }
            function = std::move(const_cast<detail::Task&>(task_queue_.top()).function);
            name = task_queue_.top().name;
            task_queue_.pop();
            active_threads_++;
        }

        if (!name.empty()) {
            SSD_LOG_DEBUG("threadpool", "Running task: " + name);
        }
        function();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
            completed_tasks_++;
        }
        idle_condition_.notify_all();
    }
}

} // namespace SSD
