#pragma once
#include <atomic>
#include <cstddef>
#include <vector>

namespace gpc {

// fixed size ring buffer for one producer thread and one consumer thread.
// non blocking: try_push fails when full or closed, try_pop fails when empty.
// one slot is kept free so head == tail always means empty
template <typename T>
class SpscQueue {
public:
    explicit SpscQueue(std::size_t capacity) : slots_(capacity + 1) {}

    bool try_push(const T& item){
        if (closed_.load(std::memory_order_acquire)) return false;
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        const std::size_t next = (tail + 1) % slots_.size();
        if (next == head_.load(std::memory_order_acquire)) return false;    //full
        slots_[tail] = item;
        tail_.store(next, std::memory_order_release);
        return true;
    }

    bool try_pop(T& out){
        const std::size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) return false;    //empty
        out = slots_[head];
        head_.store((head + 1) % slots_.size(), std::memory_order_release);
        return true;
    }

    // producer is done, the consumer still drains what is left
    void close() {closed_.store(true, std::memory_order_release);}
    bool closed() const {return closed_.load(std::memory_order_acquire);}

    std::size_t size() const {
        const std::size_t h = head_.load(std::memory_order_acquire);
        const std::size_t t = tail_.load(std::memory_order_acquire);
        return (t + slots_.size() - h) % slots_.size();
    }
    std::size_t capacity() const {return slots_.size() - 1;}
    bool empty() const {return size() == 0;}

private:
    std::vector<T> slots_;
    std::atomic<std::size_t> head_{0};     //consumer side
    std::atomic<std::size_t> tail_{0};     //producer side
    std::atomic<bool> closed_{false};
};

}   // namespace gpc
