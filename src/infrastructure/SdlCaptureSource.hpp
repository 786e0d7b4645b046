/**
 * @file SdlCaptureSource.hpp
 * @brief Microphone capture through SDL2, delivering fixed-size mono float chunks.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace audiovault::infrastructure {

class SdlCaptureSource {
public:
    /** @brief Called from SDL's audio thread; must return quickly. */
    using ChunkCallback = std::function<void(const float* samples, std::size_t count)>;

    SdlCaptureSource(int sampleRate, int chunkSamples, ChunkCallback callback);
    ~SdlCaptureSource();

    SdlCaptureSource(const SdlCaptureSource&) = delete;
    SdlCaptureSource& operator=(const SdlCaptureSource&) = delete;

    /**
     * @brief Opens the default capture device and starts it.
     * @param error Populated on failure.
     */
    bool open(std::string& error);

    void close();

    int obtainedSampleRate() const { return m_obtainedRate; }

private:
    static void AudioCallback(void* userdata, unsigned char* stream, int len);

    int m_sampleRate;
    int m_chunkSamples;
    ChunkCallback m_callback;
    unsigned int m_device = 0;
    int m_obtainedRate = 0;
    bool m_sdlInitialized = false;
};

} // namespace audiovault::infrastructure
