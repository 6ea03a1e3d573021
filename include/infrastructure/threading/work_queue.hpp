#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace CKW {

// EN: Work queue statistics for monitoring.
// FR: Statistiques de la file de travail pour le monitoring.
struct WorkQueueStats {
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t rejected_tasks = 0;
    size_t peak_queue_size = 0;
};

// EN: Configuration for the bounded work queue.
// FR: Configuration de la file de travail bornée.
struct WorkQueueConfig {
    // EN: Maximum number of pending tasks; tryPost() refuses beyond this.
    // FR: Nombre maximum de tâches en attente ; tryPost() refuse au-delà.
    size_t capacity = 256;

    // EN: Number of worker threads (1 keeps task order).
    // FR: Nombre de threads workers (1 conserve l'ordre des tâches).
    size_t worker_count = 1;

    std::string name = "work_queue";
};

// EN: Bounded FIFO executed by a small set of background workers. Used to take bookkeeping
//     updates off the caller's critical path without letting them pile up without bound.
// FR: FIFO bornée exécutée par quelques workers en arrière-plan. Sert à sortir les mises à jour
//     de suivi du chemin critique sans accumulation illimitée.
class WorkQueue {
public:
    explicit WorkQueue(const WorkQueueConfig& config = WorkQueueConfig{});
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;
    WorkQueue(WorkQueue&&) = delete;
    WorkQueue& operator=(WorkQueue&&) = delete;

    // EN: Enqueue a task. Returns false when the queue is full or shut down.
    // FR: Met une tâche en file. Retourne false si la file est pleine ou arrêtée.
    bool tryPost(std::function<void()> task);

    // EN: Wait until every queued task has run.
    // FR: Attend que toutes les tâches en file aient été exécutées.
    void waitForAll();

    // EN: Drain remaining tasks, then stop and join the workers.
    // FR: Vide les tâches restantes, puis arrête et joint les workers.
    void shutdown();

    size_t size() const;
    size_t capacity() const { return config_.capacity; }
    bool isShutdown() const { return shutdown_requested_.load(); }
    WorkQueueStats getStats() const;

private:
    void workerLoop();

    WorkQueueConfig config_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> shutdown_requested_{false};
    size_t active_tasks_ = 0;
    WorkQueueStats stats_;
};

} // namespace CKW
