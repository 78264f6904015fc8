#pragma once

/**
 * BoundedQueue.hpp
 *
 * Fixed-capacity blocking FIFO shared by producers (enqueuers) and the
 * download workers.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace trackdl::core::downloader {

/**
 * BoundedQueue - multi-producer / multi-consumer FIFO
 *
 * - push() blocks while the queue is full (backpressure)
 * - pop() blocks while the queue is empty
 * - close() wakes everyone; pushes are refused and pops return nullopt
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : m_capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Append an item, waiting for space if necessary
     * @return false if the queue is (or becomes) closed; the item is not stored
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] {
            return m_closed || m_items.size() < m_capacity;
        });

        if (m_closed) {
            return false;
        }

        m_items.push_back(std::move(item));
        lock.unlock();
        m_notEmpty.notify_one();
        return true;
    }

    /**
     * Remove the oldest item, waiting until one is available
     * @return nullopt once the queue is closed
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] {
            return m_closed || !m_items.empty();
        });

        if (m_closed) {
            return std::nullopt;
        }

        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return item;
    }

    /**
     * Refuse further pushes and release every blocked caller.
     * Items still buffered stay until clear() or reopen().
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notFull.notify_all();
        m_notEmpty.notify_all();
    }

    /**
     * Discard buffered items and accept pushes again
     */
    void reopen() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_items.clear();
            m_closed = false;
        }
        m_notFull.notify_all();
    }

    /**
     * Drop buffered items
     * @return Number of items dropped
     */
    size_t clear() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            dropped = m_items.size();
            m_items.clear();
        }
        m_notFull.notify_all();
        return dropped;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    std::deque<T> m_items;
    bool m_closed{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_notFull;
    std::condition_variable m_notEmpty;
};

} // namespace trackdl::core::downloader
