#pragma once
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace multichat {

// Fixed-size pool of worker threads backed by boost::asio::thread_pool.
// Tracks in-flight tasks so owners can wait for the pool to drain.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. Returns false (and drops the task) once stop() was called.
    bool post(std::function<void()> task);

    // Block until every queued and running task has finished.
    // Must not be called from a pool thread.
    void wait_idle();

    // Refuse new work, let queued work finish, join the threads. Idempotent.
    void stop();

    std::size_t threads() const { return threads_; }
    std::size_t in_flight() const;

private:
    void finish_task();

    boost::asio::thread_pool pool_;
    std::size_t threads_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
    bool stopping_ = false;
    bool joined_ = false;
};

} // namespace multichat
