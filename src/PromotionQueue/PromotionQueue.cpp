#include "PromotionQueue.hpp"
#include "Logger.hpp"

#include <exception>
#include <utility>


PromotionQueue::~PromotionQueue() {
    stop_and_join();
}


// Desc: spawn worker threads (no-op if already started)
// In: size_t num_workers
// Out: void
void PromotionQueue::start(size_t num_workers) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (started_) return;
    if (num_workers == 0) num_workers = 1;
    started_ = true;
    shutdown_ = false;
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this]{ worker_loop(); });
    }
}


// Desc: enqueue a promotion task
// In: Task task
// Out: bool (false if the queue is stopped)
bool PromotionQueue::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!started_ || shutdown_) return false;
        q_.emplace_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}


// Desc: wait for and pop one task
// In: Task& out
// Out: bool (false if shutdown and empty)
bool PromotionQueue::wait_dequeue(Task& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this]{ return shutdown_ || !q_.empty(); });
    if (shutdown_ && q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    ++active_;
    return true;
}

void PromotionQueue::worker_loop() {
    for (;;) {
        Task t;
        if (!wait_dequeue(t)) break;
        try {
            t();
        } catch (const std::exception& e) {
            log_warn("PromotionQueue", std::string("promotion task failed: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --active_;
            if (q_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

void PromotionQueue::wait_idle() {
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [this]{ return q_.empty() && active_ == 0; });
}


// Desc: signal shutdown, let workers drain the queue, join them
// In: (none)
// Out: void
void PromotionQueue::stop_and_join() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!started_) return;
        shutdown_ = true;
        started_ = false;
        workers.swap(workers_);
    }
    cv_.notify_all();
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }
    idle_cv_.notify_all();
}

bool PromotionQueue::running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_ && !shutdown_;
}

size_t PromotionQueue::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size() + active_;
}
