#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

namespace host_sweep::common
{
    // FIFO shared between one producer and several consumers. Push blocks while
    // the queue holds `capacity` items; Pop blocks until an item arrives or the
    // queue is closed and drained.
    template <typename T>
    class BoundedQueue
    {
    private:
        std::queue<T> m_queue;
        const std::size_t m_capacity;
        mutable std::mutex m_mutex;
        std::condition_variable m_notEmpty;
        std::condition_variable m_notFull;
        bool m_closed = false;

    public:
        explicit BoundedQueue(std::size_t capacity) : m_capacity(capacity)
        {
            if (capacity == 0)
                throw std::invalid_argument("BoundedQueue capacity must be at least 1");
        }

        BoundedQueue(const BoundedQueue &) = delete;
        BoundedQueue &operator=(const BoundedQueue &) = delete;

        // Returns false if the queue was closed before the item could be stored.
        bool Push(T value)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notFull.wait(lock, [this]
                           { return m_queue.size() < m_capacity || m_closed; });

            if (m_closed)
                return false;

            m_queue.push(std::move(value));
            lock.unlock();
            m_notEmpty.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_notEmpty.wait(lock, [this]
                            { return !m_queue.empty() || m_closed; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            lock.unlock();
            m_notFull.notify_one();
            return value;
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_notEmpty.notify_all();
            m_notFull.notify_all();
        }

        bool Closed() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_closed;
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

        std::size_t Capacity() const { return m_capacity; }
    };
}
