/**
 * @file DeliveryQueue.hpp
 * @brief Unbounded FIFO between the capture thread and the delivery worker.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>
#include "domain/AudioSegment.hpp"

namespace audiovault::application {

/** @brief Tells the worker that no further segments will be produced. */
struct ShutdownSignal {};

using QueueEntry = std::variant<domain::PendingSegment, ShutdownSignal>;

/**
 * @class DeliveryQueue
 * @brief Blocking queue; push never waits, pop sleeps on a condition variable.
 */
class DeliveryQueue {
public:
    void push(QueueEntry entry) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_entries.push_back(std::move(entry));
        }
        m_cv.notify_one();
    }

    /** @brief Blocks until an entry is available and removes the oldest one. */
    QueueEntry pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_entries.empty(); });
        QueueEntry entry = std::move(m_entries.front());
        m_entries.pop_front();
        return entry;
    }

    /** @brief Non-blocking variant of pop(). */
    std::optional<QueueEntry> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_entries.empty()) return std::nullopt;
        QueueEntry entry = std::move(m_entries.front());
        m_entries.pop_front();
        return entry;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<QueueEntry> m_entries;
};

} // namespace audiovault::application
