#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <algorithm>
#include <cstdint>
#include <fstream>

namespace audiovault::infrastructure {

namespace {

constexpr std::size_t kWavHeaderBytes = 44;

void PutLE16(std::ofstream& out, std::uint16_t v) {
    char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    out.write(b, 2);
}

void PutLE32(std::ofstream& out, std::uint32_t v) {
    char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                 static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    out.write(b, 4);
}

} // namespace

std::size_t AudioUtils::WavFileSize(std::size_t numSamples) {
    return kWavHeaderBytes + numSamples * sizeof(std::int16_t);
}

bool AudioUtils::WriteWavFile(const std::vector<float>& samples, int sampleRate, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }

    const std::uint16_t channels = 1;
    const std::uint16_t bitsPerSample = 16;
    const std::uint32_t dataBytes = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    const std::uint32_t byteRate = static_cast<std::uint32_t>(sampleRate) * channels * bitsPerSample / 8;

    out.write("RIFF", 4);
    PutLE32(out, 36 + dataBytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    PutLE32(out, 16);
    PutLE16(out, 1); // PCM
    PutLE16(out, channels);
    PutLE32(out, static_cast<std::uint32_t>(sampleRate));
    PutLE32(out, byteRate);
    PutLE16(out, static_cast<std::uint16_t>(channels * bitsPerSample / 8));
    PutLE16(out, bitsPerSample);
    out.write("data", 4);
    PutLE32(out, dataBytes);

    std::vector<char> pcm(samples.size() * 2);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        float clipped = std::clamp(samples[i], -1.0f, 1.0f);
        auto value = static_cast<std::int16_t>(clipped * 32767.0f);
        auto u = static_cast<std::uint16_t>(value);
        pcm[2 * i] = static_cast<char>(u & 0xff);
        pcm[2 * i + 1] = static_cast<char>((u >> 8) & 0xff);
    }
    out.write(pcm.data(), static_cast<std::streamsize>(pcm.size()));
    out.flush();
    return !out.fail();
}

bool AudioUtils::LoadWavSDL(const std::string& fname, std::vector<float>& pcmf32, int& sampleRate, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    // Keep the native rate; only the sample format and channel count change.
    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          AUDIO_F32SYS, 1, wavSpec.freq) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = static_cast<int>(wavLength);
    cvt.buf = static_cast<Uint8*>(SDL_malloc(static_cast<size_t>(cvt.len) * cvt.len_mult));
    if (!cvt.buf) {
        error = "Out of memory converting " + fname;
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    std::size_t sampleCount = static_cast<std::size_t>(cvt.len_cvt) / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, sampleCount * sizeof(float));
    sampleRate = wavSpec.freq;

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);
    return true;
}

} // namespace audiovault::infrastructure
