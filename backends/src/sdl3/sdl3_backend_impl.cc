#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <audiopipe/sdk/audio_stream_interface.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <stdexcept>

namespace audiopipe {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }

        constexpr SDL_AudioDeviceID default_playback_device() {
#if defined(AUDIOPIPE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AUDIOPIPE_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
            return SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK;
#if defined(AUDIOPIPE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AUDIOPIPE_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
        }

        // Identifiers are the decimal SDL device ids handed out by enumerate_devices()
        SDL_AudioDeviceID get_sdl_device_id(const std::string& device_id) {
            if (device_id.empty() || device_id == "default") {
                return default_playback_device();
            }
            try {
                return static_cast<SDL_AudioDeviceID>(std::stoul(device_id));
            } catch (const std::logic_error&) {
                LOG_WARN("SDL3", "device id", device_id, "is not numeric, using the default device");
                return default_playback_device();
            }
        }

        device_info fallback_device() {
            device_info info;
            info.name = "Default Playback";
            info.id = "default";
            info.is_default = true;
            info.channels = 2;
            info.sample_rate = 44100;
            return info;
        }
    }

    audio_format sdl3_backend::sdl_to_audiopipe_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_U8: return audio_format::u8;
            case SDL_AUDIO_S8: return audio_format::s8;
            case SDL_AUDIO_S16LE: return audio_format::s16le;
            case SDL_AUDIO_S16BE: return audio_format::s16be;
            case SDL_AUDIO_S32LE: return audio_format::s32le;
            case SDL_AUDIO_S32BE: return audio_format::s32be;
            case SDL_AUDIO_F32LE: return audio_format::f32le;
            case SDL_AUDIO_F32BE: return audio_format::f32be;
            default: return audio_format::unknown;
        }
    }

    SDL_AudioFormat sdl3_backend::audiopipe_to_sdl_format(audio_format fmt) {
        switch (fmt) {
            case audio_format::u8: return SDL_AUDIO_U8;
            case audio_format::s8: return SDL_AUDIO_S8;
            case audio_format::s16le: return SDL_AUDIO_S16LE;
            case audio_format::s16be: return SDL_AUDIO_S16BE;
            case audio_format::s32le: return SDL_AUDIO_S32LE;
            case audio_format::s32be: return SDL_AUDIO_S32BE;
            case audio_format::f32le: return SDL_AUDIO_F32LE;
            case audio_format::f32be: return SDL_AUDIO_F32BE;
            default: return SDL_AUDIO_F32LE;
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            THROW_RUNTIME("Failed to initialize SDL3 audio: " + get_sdl_error());
        }
        m_initialized = true;
        LOG_INFO("SDL3", "audio driver", SDL_GetCurrentAudioDriver() ? SDL_GetCurrentAudioDriver() : "none");
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            for (const auto& [handle, info] : m_devices) {
                SDL_CloseAudioDevice(info.sdl_id);
            }
            m_devices.clear();
        }
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector<device_info> sdl3_backend::enumerate_devices() {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        std::vector<device_info> devices;

        int count = 0;
        SDL_AudioDeviceID* sdl_devices = SDL_GetAudioPlaybackDevices(&count);

        // Opening the default device tells which physical device it resolves to
        std::string default_device_name;
        SDL_AudioSpec probe_spec;
        SDL_zero(probe_spec);
        probe_spec.freq = 44100;
        probe_spec.format = SDL_AUDIO_F32LE;
        probe_spec.channels = 2;
        SDL_AudioDeviceID probe = SDL_OpenAudioDevice(default_playback_device(), &probe_spec);
        if (probe != 0) {
            if (const char* opened_name = SDL_GetAudioDeviceName(probe)) {
                default_device_name = opened_name;
            }
            SDL_CloseAudioDevice(probe);
        }

        if (sdl_devices) {
            for (size_t i = 0; i < static_cast<size_t>(count); i++) {
                const char* name = SDL_GetAudioDeviceName(sdl_devices[i]);
                if (!name) continue;

                SDL_AudioSpec spec;
                if (SDL_GetAudioDeviceFormat(sdl_devices[i], &spec, nullptr)) {
                    device_info info;
                    info.name = name;
                    info.id = std::to_string(sdl_devices[i]);
                    info.is_default = (!default_device_name.empty() && info.name == default_device_name);
                    info.channels = static_cast<channels_t>(spec.channels);
                    info.sample_rate = static_cast<sample_rate_t>(spec.freq);
                    devices.push_back(info);
                }
            }
            SDL_free(sdl_devices);
        }

        auto default_it = std::find_if(devices.begin(), devices.end(),
            [](const device_info& dev) { return dev.is_default; });
        if (default_it == devices.end()) {
            if (!devices.empty()) {
                devices[0].is_default = true;
            }
        } else if (default_it != devices.begin()) {
            device_info default_device = *default_it;
            devices.erase(default_it);
            devices.insert(devices.begin(), default_device);
        }

        if (devices.empty()) {
            devices.push_back(fallback_device());
        }
        return devices;
    }

    device_info sdl3_backend::get_default_device() {
        auto devices = enumerate_devices();
        if (!devices.empty()) {
            return devices[0];
        }
        return fallback_device();
    }

    uint32_t sdl3_backend::open_device(const std::string& device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.freq = static_cast<int>(spec.freq);
        wanted.format = audiopipe_to_sdl_format(spec.format);
        wanted.channels = spec.channels;

        SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(get_sdl_device_id(device_id), &wanted);
        if (sdl_id == 0) {
            THROW_RUNTIME("Failed to open audio device: " + get_sdl_error());
        }

        SDL_AudioSpec obtained;
        if (!SDL_GetAudioDeviceFormat(sdl_id, &obtained, nullptr)) {
            SDL_CloseAudioDevice(sdl_id);
            THROW_RUNTIME("Failed to get audio device format: " + get_sdl_error());
        }

        obtained_spec.freq = static_cast<sample_rate_t>(obtained.freq);
        obtained_spec.format = sdl_to_audiopipe_format(obtained.format);
        obtained_spec.channels = static_cast<channels_t>(obtained.channels);

        uint32_t handle = 0;
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            handle = m_next_handle++;
            device_state& info = m_devices[handle];
            info.sdl_id = sdl_id;
            info.spec = obtained_spec;
        }
        LOG_INFO("SDL3", "opened", SDL_GetAudioDeviceName(sdl_id) ? SDL_GetAudioDeviceName(sdl_id) : "device",
                 obtained.freq, "Hz", obtained.channels, "ch");
        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it != m_devices.end()) {
            SDL_CloseAudioDevice(it->second.sdl_id);
            m_devices.erase(it);
        }
    }

    audio_format sdl3_backend::get_device_format(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return it->second.spec.format;
    }

    sample_rate_t sdl3_backend::get_device_frequency(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return it->second.spec.freq;
    }

    channels_t sdl3_backend::get_device_channels(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return it->second.spec.channels;
    }

    SDL_AudioDeviceID sdl3_backend::find_sdl_device(uint32_t handle) const {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_devices.find(handle);
        return it == m_devices.end() ? 0 : it->second.sdl_id;
    }

    bool sdl3_backend::pause_device(uint32_t device_handle) {
        const auto id = find_sdl_device(device_handle);
        return id != 0 && SDL_PauseAudioDevice(id);
    }

    bool sdl3_backend::resume_device(uint32_t device_handle) {
        const auto id = find_sdl_device(device_handle);
        return id != 0 && SDL_ResumeAudioDevice(id);
    }

    bool sdl3_backend::is_device_paused(uint32_t device_handle) {
        const auto id = find_sdl_device(device_handle);
        if (id == 0) {
            THROW_RUNTIME("Invalid device handle");
        }
        return SDL_AudioDevicePaused(id);
    }

    bool sdl3_backend::is_device_lost(uint32_t device_handle) {
        const auto id = find_sdl_device(device_handle);
        if (id == 0) {
            return true;
        }
        SDL_AudioSpec spec;
        return !SDL_GetAudioDeviceFormat(id, &spec, nullptr);
    }

    std::unique_ptr<audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) {
        const auto id = find_sdl_device(device_handle);
        if (id == 0) {
            THROW_RUNTIME("Invalid device handle");
        }
        return std::make_unique<sdl3_audio_stream>(id, spec, callback, userdata);
    }

} // namespace audiopipe
