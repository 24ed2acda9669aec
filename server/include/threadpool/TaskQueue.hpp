#pragma once

#include "threadpool/Task.hpp"
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

// FIFO hand-off between the accept loop and the workers.
class TaskQueue {
public:
    TaskQueue() = default;

    // false once closed
    bool push(Task task) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (closed) return false;
            tasks.push(std::move(task));
        }
        cv.notify_one();
        return true;
    }

    // Blocks until a task is available. Empty once closed and drained.
    std::optional<Task> pop() {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this]() {
            return closed || !tasks.empty();
        });

        if (tasks.empty()) return std::nullopt;

        Task t = std::move(tasks.front());
        tasks.pop();
        return t;
    }

    // Already queued tasks are still handed out.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            closed = true;
        }
        cv.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return tasks.size();
    }

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::queue<Task> tasks;
    bool closed = false;
};
