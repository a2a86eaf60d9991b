/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef AUDIOPIPE_SDL3_BACKEND_IMPL_HH
#define AUDIOPIPE_SDL3_BACKEND_IMPL_HH

#include <audiopipe/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace audiopipe {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio backend interface
 * @ingroup sdl3_backend
 *
 * Devices are opened through SDL_OpenAudioDevice() and addressed by small
 * integer handles. Each handle maps to the SDL device id and the format
 * SDL granted. Playback data flows through SDL_AudioStream objects created
 * by create_stream(), which convert from the requested format to the
 * device format.
 *
 * A device that SDL reports as removed stops answering
 * SDL_GetAudioDeviceFormat(); is_device_lost() relies on that.
 *
 * @note Internal class. Use create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
private:
    bool m_initialized = false;

    struct device_state {
        SDL_AudioDeviceID sdl_id = 0;
        audio_spec spec;
    };

    std::map<uint32_t, device_state> m_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;

    static audio_format sdl_to_audiopipe_format(SDL_AudioFormat sdl_fmt);
    static SDL_AudioFormat audiopipe_to_sdl_format(audio_format fmt);

    SDL_AudioDeviceID find_sdl_device(uint32_t handle) const;

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices() override;
    device_info get_default_device() override;

    uint32_t open_device(const std::string& device_id,
                        const audio_spec& spec,
                        audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    audio_format get_device_format(uint32_t device_handle) override;
    sample_rate_t get_device_frequency(uint32_t device_handle) override;
    channels_t get_device_channels(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;
    bool is_device_lost(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;
};

} // namespace audiopipe

#endif // AUDIOPIPE_SDL3_BACKEND_IMPL_HH
