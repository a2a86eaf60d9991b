#include "sdl3_audio_stream.hh"
#include <algorithm>
#include <failsafe/failsafe.hh>

namespace audiopipe {

namespace {
    constexpr size_t k_scratch_bytes = 32 * 1024;
}

// SDL_Quit() already destroyed every stream if the subsystem is gone
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

SDL_AudioFormat sdl3_audio_stream::to_sdl_format(audio_format fmt) {
    switch (fmt) {
        case audio_format::u8:     return SDL_AUDIO_U8;
        case audio_format::s8:     return SDL_AUDIO_S8;
        case audio_format::s16le:  return SDL_AUDIO_S16LE;
        case audio_format::s16be:  return SDL_AUDIO_S16BE;
        case audio_format::s32le:  return SDL_AUDIO_S32LE;
        case audio_format::s32be:  return SDL_AUDIO_S32BE;
        case audio_format::f32le:  return SDL_AUDIO_F32LE;
        case audio_format::f32be:  return SDL_AUDIO_F32BE;
        default:                   return SDL_AUDIO_UNKNOWN;
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                                     audio_callback_t callback, void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata)
    , m_scratch(k_scratch_bytes - k_scratch_bytes % (audio_format_byte_size(spec.format) * std::max<size_t>(spec.channels, 1)))
    , m_bound(false) {

    if (!m_callback) {
        THROW_RUNTIME("SDL3 stream needs a data callback");
    }

    SDL_AudioSpec sdl_spec;
    sdl_spec.format = to_sdl_format(spec.format);
    sdl_spec.channels = spec.channels;
    sdl_spec.freq = static_cast<int>(spec.freq);
    if (sdl_spec.format == SDL_AUDIO_UNKNOWN) {
        THROW_RUNTIME("SDL3 stream: unsupported sample format");
    }

    SDL_AudioSpec device_spec;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, nullptr)) {
        THROW_RUNTIME("Failed to get device format: ", SDL_GetError());
    }

    // The stream converts from the pipeline format to whatever the device negotiated
    m_stream = std::shared_ptr<SDL_AudioStream>(
        SDL_CreateAudioStream(&sdl_spec, &device_spec),
        safe_destroy_audio_stream
    );
    if (!m_stream) {
        THROW_RUNTIME("Failed to create audio stream: ", SDL_GetError());
    }

    if (!SDL_SetAudioStreamGetCallback(m_stream.get(), sdl_callback, this)) {
        THROW_RUNTIME("Failed to set stream callback: ", SDL_GetError());
    }

    if (!SDL_BindAudioStream(m_device_id, m_stream.get())) {
        THROW_RUNTIME("Failed to bind stream to device: ", SDL_GetError());
    }
    m_bound = true;
}

sdl3_audio_stream::~sdl3_audio_stream() {
    unbind_from_device();
}

void sdl3_audio_stream::sdl_callback(void* userdata,
    SDL_AudioStream* stream,
    int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0) {
        return;
    }

    auto remaining = static_cast<size_t>(additional_amount);
    while (remaining > 0) {
        const size_t chunk = std::min(remaining, self->m_scratch.size());
        self->m_callback(self->m_userdata, self->m_scratch.data(), static_cast<int>(chunk));
        SDL_PutAudioStreamData(stream, self->m_scratch.data(), static_cast<int>(chunk));
        remaining -= chunk;
    }
}

void sdl3_audio_stream::clear() {
    SDL_ClearAudioStream(m_stream.get());
}

bool sdl3_audio_stream::pause() {
    return SDL_PauseAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::resume() {
    return SDL_ResumeAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::is_paused() const {
    return SDL_AudioStreamDevicePaused(m_stream.get());
}

size_t sdl3_audio_stream::get_queued_size() const {
    int result = SDL_GetAudioStreamQueued(m_stream.get());
    return result > 0 ? static_cast<size_t>(result) : 0;
}

void sdl3_audio_stream::unbind_from_device() {
    if (m_bound && m_stream) {
        SDL_UnbindAudioStream(m_stream.get());
        m_bound = false;
    }
}

} // namespace audiopipe
