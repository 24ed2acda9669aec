#include "fetch/BufferPool.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

BufferPool::Buffer::Buffer(BufferPool* pool, std::vector<char> data)
    : pool_(pool), data_(std::move(data)) {}

BufferPool::Buffer::Buffer(Buffer&& other) noexcept
    : pool_(other.pool_), data_(std::move(other.data_)), size_(other.size_) {
    other.pool_ = nullptr;
    other.size_ = 0;
}

BufferPool::Buffer& BufferPool::Buffer::operator=(Buffer&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.pool_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

BufferPool::Buffer::~Buffer() {
    release();
}

void BufferPool::Buffer::release() {
    if (pool_) {
        pool_->giveBack(std::move(data_));
        pool_ = nullptr;
    }
    data_.clear();
    size_ = 0;
}

std::size_t BufferPool::Buffer::append(const char* src, std::size_t len) {
    std::size_t take = std::min(len, room());
    if (take > 0) {
        std::memcpy(data_.data() + size_, src, take);
        size_ += take;
    }
    return take;
}

BufferPool::BufferPool(std::size_t bufferSize, std::size_t maxIdle, bool pooled)
    : bufferSize_(bufferSize), maxIdle_(maxIdle), pooled_(pooled) {
    if (bufferSize_ == 0) {
        throw std::invalid_argument("BufferPool buffer size must be > 0");
    }
}

BufferPool::Buffer BufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!idle_.empty()) {
            std::vector<char> data = std::move(idle_.back());
            idle_.pop_back();
            return Buffer(this, std::move(data));
        }
        allocations_++;
    }
    return Buffer(this, std::vector<char>(bufferSize_));
}

void BufferPool::giveBack(std::vector<char>&& data) {
    if (!pooled_ || data.size() != bufferSize_) return;

    std::lock_guard<std::mutex> lock(mtx_);
    if (idle_.size() < maxIdle_) {
        idle_.push_back(std::move(data));
    }
}

std::size_t BufferPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return idle_.size();
}

std::size_t BufferPool::allocations() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return allocations_;
}
