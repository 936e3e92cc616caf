#include "worker_pool.hpp"

#include <boost/asio/post.hpp>
#include <exception>
#include <iostream>

namespace multichat {

WorkerPool::WorkerPool(std::size_t threads)
    : pool_(threads == 0 ? 1 : threads), threads_(threads == 0 ? 1 : threads) {}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        ++in_flight_;
    }

    boost::asio::post(pool_, [this, task = std::move(task)]() {
        struct Done {
            WorkerPool* pool;
            ~Done() { pool->finish_task(); }
        } done{this};

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[worker-pool] Task threw: " << e.what() << "\n";
        }
    });
    return true;
}

void WorkerPool::finish_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (joined_) return;
        stopping_ = true;
    }
    wait_idle();
    pool_.join();
    std::lock_guard<std::mutex> lock(mutex_);
    joined_ = true;
}

std::size_t WorkerPool::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

} // namespace multichat
