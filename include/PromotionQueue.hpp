// === include/PromotionQueue.hpp ===
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Background worker pool for volatile re-population after durable hits.
// Tasks are fire-and-forget; a task that throws is logged and dropped.
class PromotionQueue {
public:
    using Task = std::function<void()>;

    PromotionQueue() = default;
    ~PromotionQueue();
    PromotionQueue(const PromotionQueue&) = delete;
    PromotionQueue& operator=(const PromotionQueue&) = delete;

    void start(size_t num_workers);
    // Returns false once the queue is stopped (the task is not run).
    bool enqueue(Task task);
    // Block until the queue is empty and no task is running.
    void wait_idle();
    void stop_and_join();

    bool running() const;
    size_t pending() const;

private:
    bool wait_dequeue(Task& out);
    void worker_loop();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> q_;
    std::vector<std::thread> workers_;
    size_t active_{0};
    bool started_{false};
    bool shutdown_{false};
};
