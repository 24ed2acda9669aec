#include "threadpool/ThreadPool.hpp"

#include <stdexcept>
#include <utility>

ThreadPool::ThreadPool(int threads) {
    if (threads <= 0) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }

    workers.reserve(static_cast<std::size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this]() {
            workerLoop();
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(Task task) {
    pendingTasks.fetch_add(1, std::memory_order_relaxed);
    if (!queue.push(std::move(task))) {
        pendingTasks.fetch_sub(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void ThreadPool::shutdown() {
    queue.close();
    for (auto& w : workers) {
        if (w.joinable() && w.get_id() != std::this_thread::get_id()) {
            w.join();
        }
    }
}

void ThreadPool::workerLoop() {
    while (auto t = queue.pop()) {
        if (t->fn) {
            t->fn();
        }
        pendingTasks.fetch_sub(1, std::memory_order_relaxed);
    }
}
