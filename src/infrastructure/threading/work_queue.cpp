// EN: Bounded work queue implementation.
// FR: Implémentation de la file de travail bornée.

#include "infrastructure/threading/work_queue.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <exception>

namespace CKW {

WorkQueue::WorkQueue(const WorkQueueConfig& config) : config_(config) {
    if (config_.capacity == 0) {
        config_.capacity = 1;
    }
    const size_t workers = std::max<size_t>(1, config_.worker_count);
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&WorkQueue::workerLoop, this);
    }
    LOG_DEBUG("work_queue", "Work queue '" + config_.name + "' started with " +
              std::to_string(workers) + " worker(s), capacity " + std::to_string(config_.capacity));
}

WorkQueue::~WorkQueue() {
    shutdown();
}

bool WorkQueue::tryPost(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load() || tasks_.size() >= config_.capacity) {
            stats_.rejected_tasks++;
            return false;
        }
        tasks_.push_back(std::move(task));
        stats_.peak_queue_size = std::max(stats_.peak_queue_size, tasks_.size());
    }
    queue_condition_.notify_one();
    return true;
}

void WorkQueue::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && active_tasks_ == 0; });
}

void WorkQueue::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    queue_condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

WorkQueueStats WorkQueue::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    WorkQueueStats current = stats_;
    current.queued_tasks = tasks_.size();
    return current;
}

// EN: Workers keep draining after shutdown is requested so no accepted task is lost.
// FR: Les workers continuent de vider la file après l'arrêt pour ne perdre aucune tâche acceptée.
void WorkQueue::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] { return shutdown_requested_.load() || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            active_tasks_++;
        }

        bool failed = false;
        try {
            task();
        } catch (const std::exception& e) {
            failed = true;
            LOG_ERROR("work_queue", "Task in '" + config_.name + "' failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
            if (failed) {
                stats_.failed_tasks++;
            } else {
                stats_.completed_tasks++;
            }
        }
        idle_condition_.notify_all();
    }
}

} // namespace CKW
