// ThreadPool.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "threadpool/Task.hpp"
#include "threadpool/TaskQueue.hpp"

// Fixed number of workers pulling Tasks from a FIFO queue. A Task must not
// throw.
class ThreadPool {
public:
    explicit ThreadPool(int threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t getWorkerCount() const { return workers.size(); }

    // false after shutdown()
    bool submit(Task task);

    // queued + running
    std::size_t getPendingTaskCount() const {
        return pendingTasks.load(std::memory_order_relaxed);
    }

    // Stops accepting tasks, runs what is queued, joins the workers.
    void shutdown();

private:
    void workerLoop();

    TaskQueue queue;
    std::vector<std::thread> workers;
    std::atomic<std::size_t> pendingTasks{0};
};
