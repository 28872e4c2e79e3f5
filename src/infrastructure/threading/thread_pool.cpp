// EN: Implementation of the ThreadPool class. Fixed worker set draining a FIFO task queue.
// FR: Implémentation de la classe ThreadPool. Ensemble fixe de workers vidant une queue FIFO.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace DPF {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    if (config_.thread_count == 0) {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    std::lock_guard<std::mutex> lock(threads_mutex_);
    workers_.reserve(config_.thread_count);
    for (size_t i = 0; i < config_.thread_count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG(config_.name, "Thread pool started with " + std::to_string(config_.thread_count) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(detail::Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_.load()) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.push_back(std::move(task));
        peak_queue_size_ = std::max(peak_queue_size_, task_queue_.size());
    }

    queue_condition_.notify_one();
}

// EN: Wait until the queue is empty and no worker is busy.
// FR: Attend que la queue soit vide et qu'aucun worker ne soit occupé.
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

    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG(config_.name, "Thread pool shutdown completed - processed " +
              std::to_string(completed_tasks_.load() + failed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    ThreadPoolStats stats;
    stats.created_at = start_time_;
    stats.total_threads = config_.thread_count;
    stats.active_threads = active_threads_.load();
    stats.idle_threads = stats.total_threads - std::min(stats.total_threads, stats.active_threads);
    stats.queued_tasks = task_queue_.size();
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_queue_size = peak_queue_size_;
    stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);
    return stats;
}

void ThreadPool::setTaskCallback(TaskCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    task_callback_ = std::move(callback);
}

// EN: Worker thread function. Exits once shutdown is requested and the queue is drained.
// FR: Fonction du thread worker. Sort quand l'arrêt est demandé et la queue vidée.
void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop_front();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;

        // EN: packaged_task stores exceptions in the future; this only catches wrapper failures.
        // FR: packaged_task stocke les exceptions dans le future ; ceci n'attrape que les échecs du wrapper.
        try {
            task.function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR(config_.name, "Task execution failed: " + std::string(e.what()));
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (success) {
            completed_tasks_++;
        } else {
            failed_tasks_++;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (task_callback_) {
                task_callback_(task.name, success, duration);
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace DPF
