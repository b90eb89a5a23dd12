#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace SSD {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

// EN: Thread pool statistics.
// FR: Statistiques du pool de threads.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t peak_queue_size = 0;
};

struct ThreadPoolConfig {
    // EN: Number of worker threads (0 means hardware concurrency).
    // FR: Nombre de threads workers (0 signifie la concurrence matérielle).
    size_t threads = 0;

    // EN: Maximum number of queued tasks (0 means unbounded).
    // FR: Nombre maximum de tâches en queue (0 signifie illimité).
    size_t max_queue_size = 0;
};

namespace detail {
    // EN: Internal task wrapper. Equal priorities run in submission order.
    // FR: Wrapper interne de tâche. À priorité égale, l'ordre de soumission est respecté.
    struct Task {
        std::function<void()> function;
        TaskPriority priority;
        uint64_t sequence;
        std::string name;

        Task(std::function<void()> f, TaskPriority p, uint64_t seq, std::string n)
            : function(std::move(f)), priority(p), sequence(seq), name(std::move(n)) {}

        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Fixed-size worker pool executing collaborator I/O. Results are delivered through std::future.
// FR: Pool de workers de taille fixe exécutant les E/S des collaborateurs. Résultats livrés via std::future.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor drains the queue then joins all workers.
    // FR: Le destructeur vide la queue puis joint tous les workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task; the name shows up in debug logs.
    // FR: Soumet une tâche nommée ; le nom apparaît dans les logs de debug.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Block until the queue is empty and no worker is busy.
    // FR: Bloque jusqu'à ce que la queue soit vide et qu'aucun worker ne soit occupé.
    void waitForAll();

    // EN: Graceful shutdown: queued tasks still run. Idempotent.
    // FR: Arrêt gracieux : les tâches en queue s'exécutent encore. Idempotent.
    void shutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }
    size_t threadCount() const { return workers_.size(); }
    ThreadPoolStats getStats() const;

private:
    void workerLoop();

    ThreadPoolConfig config_;
    std::vector<std::thread> workers_;
    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    size_t peak_queue_size_ = 0;
    uint64_t next_sequence_ = 0;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }
        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }
        task_queue_.emplace([task]() { (*task)(); }, priority, next_sequence_++, name);
        if (task_queue_.size() > peak_queue_size_) {
            peak_queue_size_ = task_queue_.size();
        }
    }

    queue_condition_.notify_one();
    return result;
}

} // namespace SSD
