#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace DPF {

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    size_t thread_count = std::thread::hardware_concurrency();  // EN: Worker threads / FR: Threads workers
    size_t max_queue_size = 0;                                   // EN: 0 = unbounded / FR: 0 = illimité
    std::string name = "threadpool";                             // EN: Used as log module / FR: Utilisé comme module de log
};

namespace detail {
    // EN: Internal task wrapper with metadata.
    // FR: Wrapper interne de tâche avec métadonnées.
    struct Task {
        std::function<void()> function;
        std::string name;
        std::chrono::steady_clock::time_point created_at;

        Task() = default;
        Task(std::function<void()> f, std::string n)
            : function(std::move(f)), name(std::move(n)), created_at(std::chrono::steady_clock::now()) {}
    };
}

// EN: Fixed-size worker pool with a FIFO queue. Tasks return their result through std::future.
// FR: Pool de workers de taille fixe avec queue FIFO. Les tâches retournent leur résultat via std::future.
class ThreadPool {
public:
    using TaskCallback = std::function<void(const std::string&, bool, std::chrono::milliseconds)>;

    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for queued tasks to complete and stops all threads.
    // FR: Destructeur - attend la fin des tâches en queue et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task; the name shows up in logs and in the completion callback.
    // FR: Soumet une tâche nommée ; le nom apparaît dans les logs et le callback de completion.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait for all currently queued and running tasks to complete.
    // FR: Attend que toutes les tâches en queue et en cours se terminent.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (queued tasks still run).
    // FR: Arrête le pool de threads de manière gracieuse (les tâches en queue s'exécutent).
    void shutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }

    ThreadPoolStats getStats() const;

    const ThreadPoolConfig& getConfig() const { return config_; }

    // EN: Set callback for task completion events (task name, success, duration).
    // FR: Définit le callback de completion des tâches (nom, succès, durée).
    void setTaskCallback(TaskCallback callback);

private:
    void workerLoop();
    void enqueue(detail::Task task);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    std::mutex threads_mutex_;

    std::deque<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    size_t peak_queue_size_ = 0;
    std::chrono::system_clock::time_point start_time_;

    TaskCallback task_callback_;
    std::mutex callback_mutex_;
};

// EN: Template method implementations.
// FR: Implémentations des méthodes templates.
template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    enqueue(detail::Task([task]() { (*task)(); }, name));
    return result;
}

} // namespace DPF
