/**
 * @file device_sink.hh
 * @brief Real-time consumer feeding the output device from the ring buffer
 */

#ifndef AUDIOPIPE_DEVICE_SINK_HH
#define AUDIOPIPE_DEVICE_SINK_HH

#include <audiopipe/config.hh>
#include <audiopipe/ring_buffer.hh>
#include <audiopipe/sdk/audio_backend.hh>
#include <audiopipe/export_audiopipe.h>

#include <memory>

namespace audiopipe {

    /**
     * @struct sink_stats
     * @brief Counters maintained by the device callback
     */
    struct sink_stats {
        uint64_t callbacks = 0;
        uint64_t bytes_rendered = 0;
        uint64_t underruns = 0;
    };

    /**
     * @class device_sink
     * @brief Opens one playback device and drains the output ring buffer into it
     *
     * The backend is initialised on demand, the device is opened with the
     * configured format and a stream is created whose callback lands in
     * render(). The device format must match the requested one; conversion
     * from float happens here with a converter from the SDK.
     *
     * render() honours the real-time contract: it fills exactly the number
     * of bytes requested, reads from the ring buffer without locking, uses
     * scratch memory allocated in the constructor and never logs.
     *
     * The sink starts paused.
     */
    class AUDIOPIPE_EXPORT device_sink {
        public:
            /**
             * @throws device_error if the device cannot be opened or its format has no converter
             */
            device_sink(std::shared_ptr<audio_backend> backend, output_ring_buffer& ring,
                        const pipeline_config& config);
            ~device_sink();

            device_sink(const device_sink&) = delete;
            device_sink& operator=(const device_sink&) = delete;

            /// Resume the device stream
            void start();

            /// Pause the device stream; the ring buffer keeps its contents
            void stop();

            [[nodiscard]] bool is_started() const;

            /**
             * @brief False once the backend reports the device lost
             */
            [[nodiscard]] bool is_healthy() const;

            /**
             * @brief Fill @p len bytes of device memory
             *
             * Called by the stream callback. Exposed for backends without a
             * thread of their own and for tests.
             */
            void render(uint8_t* out, std::size_t len) noexcept;

            [[nodiscard]] sink_stats stats() const noexcept;

            [[nodiscard]] const audio_spec& obtained_spec() const noexcept;

            [[nodiscard]] const audio_backend& backend() const noexcept;

        private:
            static void audio_callback(void* userdata, uint8_t* stream, int len);

            struct impl;
            const std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_DEVICE_SINK_HH
