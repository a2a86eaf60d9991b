#ifndef AUDIOPIPE_SDL3_AUDIO_STREAM_HH
#define AUDIOPIPE_SDL3_AUDIO_STREAM_HH

#include <audiopipe/sdk/audio_backend.hh>
#include <audiopipe/sdk/audio_stream_interface.hh>
#include <audiopipe/sdk/audio_format.hh>
#include <audiopipe/sdk/buffer.hh>
#include "sdl3.hh"
#include <memory>

namespace audiopipe {

/**
 * SDL_AudioStream bound to an opened device. SDL asks for more data from its
 * audio thread; the request is served in slices of a byte area allocated
 * once here, each slice a whole number of frames.
 */
class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                      audio_callback_t callback, void* userdata);
    ~sdl3_audio_stream() override;

    void clear() override;
    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    size_t get_queued_size() const override;
    void unbind_from_device() override;

private:
    static void sdl_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
    static SDL_AudioFormat to_sdl_format(audio_format fmt);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    audio_callback_t m_callback;
    void* m_userdata;
    buffer<uint8_t> m_scratch;
    bool m_bound;
};

} // namespace audiopipe

#endif // AUDIOPIPE_SDL3_AUDIO_STREAM_HH
