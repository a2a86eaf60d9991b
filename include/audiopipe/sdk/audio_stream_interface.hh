#ifndef AUDIOPIPE_AUDIO_STREAM_INTERFACE_HH
#define AUDIOPIPE_AUDIO_STREAM_INTERFACE_HH

#include <cstddef>
#include <cstdint>
#include <audiopipe/sdk/export_audiopipe_sdk.h>

namespace audiopipe {

/**
 * Data path from a device sink to an opened device.
 * The stream is bound to its device on creation and pulls data through the
 * callback given to audio_backend::create_stream().
 */
class AUDIOPIPE_SDK_EXPORT audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    /**
     * Drop bytes already handed to the platform but not yet played.
     */
    virtual void clear() = 0;

    /**
     * @return true on success
     */
    virtual bool pause() = 0;

    /**
     * @return true on success
     */
    virtual bool resume() = 0;

    virtual bool is_paused() const = 0;

    /**
     * Bytes converted by the platform but not yet played.
     */
    virtual size_t get_queued_size() const = 0;

    /**
     * Detach from the device so the callback is no longer invoked.
     */
    virtual void unbind_from_device() = 0;
};

} // namespace audiopipe

#endif // AUDIOPIPE_AUDIO_STREAM_INTERFACE_HH
