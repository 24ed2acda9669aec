#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

// Fixed-size byte buffers handed out per transfer. With pooling enabled a
// released buffer goes back to an idle list (bounded by maxIdle) instead of
// being freed.
class BufferPool {
public:
    class Buffer {
    public:
        Buffer() = default;
        Buffer(Buffer&& other) noexcept;
        Buffer& operator=(Buffer&& other) noexcept;
        ~Buffer();

        Buffer(const Buffer&) = delete;
        Buffer& operator=(const Buffer&) = delete;

        char* data() { return data_.data(); }
        const char* data() const { return data_.data(); }

        std::size_t size() const { return size_; }
        std::size_t capacity() const { return data_.size(); }
        std::size_t room() const { return data_.size() - size_; }
        bool full() const { return size_ == data_.size(); }
        bool empty() const { return size_ == 0; }

        // copies at most room() bytes, returns how many were taken
        std::size_t append(const char* src, std::size_t len);
        void clear() { size_ = 0; }

    private:
        friend class BufferPool;
        Buffer(BufferPool* pool, std::vector<char> data);

        void release();

        BufferPool* pool_ = nullptr;
        std::vector<char> data_;
        std::size_t size_ = 0;
    };

    BufferPool(std::size_t bufferSize, std::size_t maxIdle, bool pooled);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    Buffer acquire();

    std::size_t bufferSize() const { return bufferSize_; }
    bool pooled() const { return pooled_; }

    std::size_t idleCount() const;
    std::size_t allocations() const;

private:
    void giveBack(std::vector<char>&& data);

    std::size_t bufferSize_;
    std::size_t maxIdle_;
    bool pooled_;

    mutable std::mutex mtx_;
    std::vector<std::vector<char>> idle_;
    std::size_t allocations_ = 0;
};
