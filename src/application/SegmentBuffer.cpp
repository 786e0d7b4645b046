/**
 * @file SegmentBuffer.cpp
 * @brief Implementation of SegmentBuffer.
 */

#include "application/SegmentBuffer.hpp"
#include <algorithm>
#include <stdexcept>

namespace audiovault::application {

SegmentBuffer::SegmentBuffer(int sampleRate, int segmentSeconds, SegmentSink sink)
    : m_samplesPerSegment(static_cast<std::size_t>(sampleRate) * static_cast<std::size_t>(segmentSeconds))
    , m_sink(std::move(sink))
    , m_segmentStart(std::chrono::system_clock::now()) {
    if (m_samplesPerSegment == 0) {
        throw std::invalid_argument("sample rate and segment length must be positive");
    }
    m_samples.reserve(m_samplesPerSegment);
}

void SegmentBuffer::reset(std::chrono::system_clock::time_point segmentStart) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.clear();
    m_segmentStart = segmentStart;
    m_closed = false;
}

bool SegmentBuffer::append(const float* samples, std::size_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) return false;
    if (!samples || count == 0) return true;

    m_samples.insert(m_samples.end(), samples, samples + count);

    while (m_samples.size() >= m_samplesPerSegment) {
        cutLocked(m_samplesPerSegment);
    }
    return true;
}

bool SegmentBuffer::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    if (m_samples.empty()) return false;
    cutLocked(m_samples.size());
    return true;
}

std::size_t SegmentBuffer::bufferedSamples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_samples.size();
}

bool SegmentBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

void SegmentBuffer::cutLocked(std::size_t count) {
    domain::PendingSegment segment;
    segment.startedAt = m_segmentStart;

    if (count >= m_samples.size()) {
        segment.samples.swap(m_samples);
        m_samples.clear();
        m_samples.reserve(m_samplesPerSegment);
    } else {
        auto split = m_samples.begin() + static_cast<std::ptrdiff_t>(count);
        segment.samples.assign(m_samples.begin(), split);
        m_samples.erase(m_samples.begin(), split);
    }

    m_segmentStart = std::chrono::system_clock::now();
    if (m_sink) {
        m_sink(std::move(segment));
    }
}

} // namespace audiovault::application
