/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef AUDIOPIPE_SDK_TYPES_H
#define AUDIOPIPE_SDK_TYPES_H

#include <cstdint>
#include <cstddef>

namespace audiopipe {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * The pipeline counts time in frames. A frame is one sample per channel at
 * a single instant, so a stereo frame holds two floats. Every position,
 * duration and capacity in the public API is expressed in frames unless the
 * name says otherwise (`_samples`, `_bytes`, `_ms`).
 *
 * @code
 * sample_rate_t rate = 44100;   // CD quality
 * channels_t channels = 2;      // Stereo
 * frame_index_t pos = 3 * rate; // three seconds into the track
 * @endcode
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates in Hz
 *
 * Common values are 44100 (CD) and 48000 (professional audio).
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 *
 * 1 is mono, 2 is stereo. The pipeline itself supports any layout the
 * device accepts, decoders convert between mono and stereo.
 */
using channels_t = uint8_t;

/**
 * @typedef frame_index_t
 * @brief Absolute frame position or frame count inside a stream
 *
 * 64 bits so that monotonically increasing counters never wrap during a
 * playback session.
 */
using frame_index_t = uint64_t;

/** @} */ // end of sdk_types group

} // namespace audiopipe

#endif // AUDIOPIPE_SDK_TYPES_H
