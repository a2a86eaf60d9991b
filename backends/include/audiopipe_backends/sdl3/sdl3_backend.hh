/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef AUDIOPIPE_BACKENDS_SDL3_BACKEND_HH
#define AUDIOPIPE_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Include generated export header
#include "export_audiopipe_backend_sdl3.h"

namespace audiopipe {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Output devices through SDL3's stream-based audio API
 *
 * Each stream created by the backend is an SDL_AudioStream bound to the
 * opened device. SDL converts from the stream format to whatever the device
 * negotiated, so the pipeline always renders in the format it asked for.
 * The data callback runs on SDL's audio thread and hands the device_sink a
 * pre-allocated byte area; nothing is allocated per callback.
 *
 * ## Configuration
 *
 * SDL3 respects its usual environment variables:
 * - `SDL_AUDIO_DRIVER`: Force specific driver
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: Device buffer size
 *
 * @{
 */

// Forward declaration
class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 * @return New SDL3 backend instance, not yet initialized
 *
 * @code
 * #include <audiopipe_backends/sdl3/sdl3_backend.hh>
 * #include <audiopipe/transport.hh>
 *
 * auto backend = audiopipe::create_sdl3_backend();
 * backend->init();
 * audiopipe::transport player(std::move(backend), cfg, registry);
 * @endcode
 *
 * @see audio_backend, device_sink
 */
AUDIOPIPE_BACKEND_SDL3_EXPORT std::unique_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace audiopipe

#endif // AUDIOPIPE_BACKENDS_SDL3_BACKEND_HH
