#pragma once

#include <string>
#include <vector>

namespace audiovault::infrastructure {

/**
 * @brief Utilities for audio files.
 */
class AudioUtils {
public:
    /**
     * @brief Writes mono float samples as a 16-bit PCM WAV file.
     *
     * Samples are clipped to [-1, 1] and scaled by 32767.
     * @return True if the whole file was written.
     */
    static bool WriteWavFile(const std::vector<float>& samples, int sampleRate, const std::string& path);

    /** @brief Size in bytes of the WAV file WriteWavFile produces for n samples. */
    static std::size_t WavFileSize(std::size_t numSamples);

    /**
     * @brief Loads a WAV file as float32 mono at its native sample rate.
     * @param fname Path to WAV file.
     * @param pcmf32 Resulting samples.
     * @param sampleRate Populated with the file's sample rate.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool LoadWavSDL(const std::string& fname, std::vector<float>& pcmf32, int& sampleRate, std::string& error);
};

} // namespace audiovault::infrastructure
