/**
 * @file audio_backend.hh
 * @brief Platform audio backend interface
 * @ingroup backends
 */

#ifndef AUDIOPIPE_SDK_AUDIO_BACKEND_HH
#define AUDIOPIPE_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <audiopipe/sdk/audio_format.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/sdk/audio_stream_interface.hh>
#include <audiopipe/sdk/export_audiopipe_sdk.h>

namespace audiopipe {

/**
 * @struct device_info
 * @brief Playback device description
 * @ingroup backends
 */
struct device_info {
    std::string name;           ///< Human-readable device name
    std::string id;             ///< Identifier accepted by open_device()
    bool is_default = false;    ///< True for the system default device
    channels_t channels = 0;    ///< Native channel count
    sample_rate_t sample_rate = 0; ///< Native sample rate in Hz
};

inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "name=\"" << info.name << "\", "
       << "id=\"" << info.id << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "channels=" << static_cast<int>(info.channels) << ", "
       << "sample_rate=" << info.sample_rate
       << "}";
    return os;
}

/**
 * @brief Device callback: fill exactly @p len bytes at @p stream
 *
 * Runs on the platform audio thread. Implementations must not block,
 * allocate or log.
 */
using audio_callback_t = void (*)(void* userdata, uint8_t* stream, int len);

/**
 * @class audio_backend
 * @brief Abstract interface over a platform audio API
 * @ingroup backends
 *
 * The device sink is the only component that talks to a backend. It opens
 * one playback device, creates one callback-driven stream on it and polls
 * is_device_lost() from the UI thread.
 *
 * ## Thread Safety
 *
 * - init()/shutdown() are called from the thread that owns the transport
 * - device queries are safe from any thread after init()
 * - the stream callback runs on a platform thread
 *
 * @see create_sdl3_backend(), device_sink
 */
class AUDIOPIPE_SDK_EXPORT audio_backend {
public:
    virtual ~audio_backend() = default;

    /**
     * @brief Initialise the audio subsystem
     * @throws std::runtime_error if initialisation fails
     */
    virtual void init() = 0;

    /**
     * @brief Close every open device and release the subsystem
     */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string get_name() const = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;

    /**
     * @brief List playback devices, default device first
     */
    virtual std::vector<device_info> enumerate_devices() = 0;

    virtual device_info get_default_device() = 0;

    /**
     * @brief Open a playback device
     * @param device_id Identifier from enumerate_devices(), empty for default
     * @param spec Desired format
     * @param obtained_spec Format actually granted by the device
     * @return Handle for the other device calls
     * @throws std::runtime_error if the device cannot be opened
     */
    virtual uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    virtual void close_device(uint32_t device_handle) = 0;

    virtual audio_format get_device_format(uint32_t device_handle) = 0;
    virtual sample_rate_t get_device_frequency(uint32_t device_handle) = 0;
    virtual channels_t get_device_channels(uint32_t device_handle) = 0;

    /**
     * @return true on success
     */
    virtual bool pause_device(uint32_t device_handle) = 0;

    /**
     * @return true on success
     */
    virtual bool resume_device(uint32_t device_handle) = 0;

    virtual bool is_device_paused(uint32_t device_handle) = 0;

    /**
     * @brief Whether the device disappeared (unplugged, driver reset)
     *
     * Backends without hot-plug reporting keep the default.
     */
    virtual bool is_device_lost(uint32_t device_handle) {
        (void)device_handle;
        return false;
    }

    /**
     * @brief Create a pull stream on an open device
     * @param device_handle Handle returned by open_device()
     * @param spec Format of the bytes the callback produces
     * @param callback Called whenever the device needs more data
     * @param userdata Passed back to @p callback
     * @throws std::runtime_error if the stream cannot be created
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata
    ) = 0;
};

} // namespace audiopipe

#endif // AUDIOPIPE_SDK_AUDIO_BACKEND_HH
