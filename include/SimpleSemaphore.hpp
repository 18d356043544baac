#pragma once
#include <condition_variable>
#include <mutex>

// Counting semaphore bounding how many warm items fetch at the same time.
class SimpleSemaphore {
public:
    explicit SimpleSemaphore(int count) : count_(count > 0 ? count : 1) {}
    SimpleSemaphore(const SimpleSemaphore&) = delete;
    SimpleSemaphore& operator=(const SimpleSemaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return count_ > 0; });
        --count_;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lk(m_);
            ++count_;
        }
        cv_.notify_one();
    }

    // Holds one permit for the lifetime of the guard.
    class Permit {
    public:
        explicit Permit(SimpleSemaphore& s) : s_(s) { s_.acquire(); }
        ~Permit() { s_.release(); }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
    private:
        SimpleSemaphore& s_;
    };

private:
    std::mutex m_;
    std::condition_variable cv_;
    int count_;
};
