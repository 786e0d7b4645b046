#include "infrastructure/SdlCaptureSource.hpp"
#include <SDL.h>
#include <iostream>

namespace audiovault::infrastructure {

SdlCaptureSource::SdlCaptureSource(int sampleRate, int chunkSamples, ChunkCallback callback)
    : m_sampleRate(sampleRate)
    , m_chunkSamples(chunkSamples)
    , m_callback(std::move(callback))
{}

SdlCaptureSource::~SdlCaptureSource() {
    close();
}

bool SdlCaptureSource::open(std::string& error) {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        error = "SDL_InitSubSystem(AUDIO) failed: " + std::string(SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    SDL_AudioSpec want;
    SDL_zero(want);
    want.freq = m_sampleRate;
    want.format = AUDIO_F32SYS;
    want.channels = 1;
    want.samples = static_cast<Uint16>(m_chunkSamples);
    want.callback = &SdlCaptureSource::AudioCallback;
    want.userdata = this;

    SDL_AudioSpec have;
    // No allowed changes: SDL converts to exactly the requested format.
    m_device = SDL_OpenAudioDevice(nullptr, 1, &want, &have, 0);
    if (m_device == 0) {
        error = "SDL_OpenAudioDevice failed: " + std::string(SDL_GetError());
        close();
        return false;
    }

    m_obtainedRate = have.freq;
    std::cout << "[SdlCaptureSource] Capturing " << have.freq << "Hz mono, "
              << have.samples << " samples per chunk" << std::endl;
    SDL_PauseAudioDevice(m_device, 0);
    return true;
}

void SdlCaptureSource::close() {
    if (m_device != 0) {
        SDL_PauseAudioDevice(m_device, 1);
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }
    if (m_sdlInitialized) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_sdlInitialized = false;
    }
}

void SdlCaptureSource::AudioCallback(void* userdata, unsigned char* stream, int len) {
    auto* self = static_cast<SdlCaptureSource*>(userdata);
    if (!self->m_callback || len <= 0) return;
    self->m_callback(static_cast<const float*>(static_cast<const void*>(stream)), static_cast<std::size_t>(len) / sizeof(float));
}

} // namespace audiovault::infrastructure
