#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Blocking multi-producer, multi-consumer queue
template <typename T>
class Channel {
public:
    Channel() : m_closed{ false } {}

    // Returns false once the channel is closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_items.push_back(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    // Blocks until an item arrives. Returns nothing once the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this]() { return m_closed || !m_items.empty(); });
        if (m_items.empty()) {
            return std::nullopt;
        }

        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_items;
    bool m_closed;
};

#endif // CHANNEL_HPP
