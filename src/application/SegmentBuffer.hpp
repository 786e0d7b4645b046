/**
 * @file SegmentBuffer.hpp
 * @brief Accumulates captured chunks and cuts them into exact-length segments.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>
#include "domain/AudioSegment.hpp"

namespace audiovault::application {

/**
 * @class SegmentBuffer
 * @brief Producer-side buffer. append() only copies memory under a short lock.
 *
 * Every full segment holds exactly samplesPerSegment() samples; the excess is
 * kept as the start of the next one. Cut segments are handed to the sink
 * while the lock is held, so capture order is preserved.
 *
 * flush() closes the buffer: later chunks are rejected until reset(), so a
 * chunk either lands in the final segment or is refused, never stranded.
 */
class SegmentBuffer {
public:
    using SegmentSink = std::function<void(domain::PendingSegment&&)>;

    SegmentBuffer(int sampleRate, int segmentSeconds, SegmentSink sink);

    /** @brief Drops buffered samples, reopens the buffer and starts timing a new segment. */
    void reset(std::chrono::system_clock::time_point segmentStart);

    /**
     * @brief Appends a chunk; emits one segment per full boundary reached.
     * @return False if the chunk was refused because the buffer is closed.
     */
    bool append(const float* samples, std::size_t count);

    /**
     * @brief Emits whatever is buffered as one final, possibly short, segment, and closes the buffer.
     * @return False if the buffer was empty and nothing was emitted.
     */
    bool flush();

    std::size_t bufferedSamples() const;
    bool isClosed() const;
    std::size_t samplesPerSegment() const { return m_samplesPerSegment; }

private:
    void cutLocked(std::size_t count);

    const std::size_t m_samplesPerSegment;
    SegmentSink m_sink;

    mutable std::mutex m_mutex;
    std::vector<float> m_samples;
    std::chrono::system_clock::time_point m_segmentStart;
    bool m_closed = false;
};

} // namespace audiovault::application
