/**
 * @file pipeline.hh
 * @brief Producer thread turning a decoder adapter into ring buffer frames
 */

#ifndef AUDIOPIPE_PIPELINE_HH
#define AUDIOPIPE_PIPELINE_HH

#include <audiopipe/config.hh>
#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/parameter_bus.hh>
#include <audiopipe/ring_buffer.hh>
#include <audiopipe/visualization_tap.hh>
#include <audiopipe/export_audiopipe.h>

#include <memory>
#include <string>
#include <vector>

namespace audiopipe {

    enum class pipeline_state {
        idle,       ///< nothing to do, producer parked
        decoding,   ///< pulling, processing and pushing blocks
        paused,     ///< not pulling; ring buffer contents kept
        draining    ///< source exhausted, waiting for the ring buffer to empty
    };

    AUDIOPIPE_EXPORT const char* to_string(pipeline_state s) noexcept;

    /**
     * @struct pipeline_event
     * @brief Notification queued by the producer for the control thread
     */
    struct pipeline_event {
        enum class kind {
            track_complete,     ///< every frame of the track reached the device
            decode_error        ///< the decoder failed, the producer stopped
        };

        kind type;
        std::string message;
        frame_index_t position = 0;
    };

    /**
     * @class processing_pipeline
     * @brief Owns the producer thread and the effect chain
     *
     * Each decoding cycle reads the latest parameter snapshot once, pulls one
     * block, runs time stretch, equalizer, fade and gain, pushes the result
     * into the ring buffer (waiting while it is full) and copies it to the
     * visualization tap. A parameter change therefore takes effect exactly at
     * the next block boundary.
     *
     * Control methods are called from one control thread (the transport).
     * Structural changes go through quiesce(): the producer parks at a cycle
     * boundary and acknowledges, a write blocked on a full ring buffer is
     * abandoned. While quiesced, seek() may reposition the source.
     *
     * @code
     * processing_pipeline p(cfg, bus, ring, tap);
     * p.set_source(std::move(adapter));
     * p.start();
     * ...
     * p.quiesce();
     * p.seek(frame);
     * p.release();
     * @endcode
     */
    class AUDIOPIPE_EXPORT processing_pipeline {
        public:
            processing_pipeline(const pipeline_config& config, parameter_bus& bus,
                                output_ring_buffer& ring, visualization_tap& tap);
            ~processing_pipeline();

            processing_pipeline(const processing_pipeline&) = delete;
            processing_pipeline& operator=(const processing_pipeline&) = delete;

            /**
             * @brief Install the source for the next start()
             * @throws state_error while the producer runs
             */
            void set_source(std::unique_ptr<decoder_adapter> source);

            [[nodiscard]] bool has_source() const;

            /**
             * @brief Launch the producer thread in the decoding state
             * @throws state_error without a source or while already running
             */
            void start();

            /**
             * @brief Stop and join the producer, flush the ring buffer, release the source
             *
             * Safe to call in any state; a no-op when nothing runs.
             */
            void stop();

            /// decoding or draining to paused; ignored otherwise
            void pause();

            /// paused back to the state it was paused from
            void resume();

            /**
             * @brief Park the producer at a cycle boundary and wait for its acknowledgement
             */
            void quiesce();

            /// Let a quiesced producer continue
            void release();

            [[nodiscard]] bool is_quiesced() const;

            /**
             * @brief Reposition the source while quiesced
             *
             * Flushes the ring buffer, clears the visualization tap and resets
             * the time stretch and equalizer history. A finished or draining
             * pipeline goes back to decoding when released; a paused one stays
             * paused. A queued track_complete event is discarded.
             *
             * @return Frame actually reached
             * @throws state_error unless quiesced (or not running)
             * @throws decoder_error if the source cannot seek
             */
            frame_index_t seek(frame_index_t frame);

            [[nodiscard]] pipeline_state state() const;
            [[nodiscard]] bool is_running() const;

            /// Source frames consumed, at the pipeline rate
            [[nodiscard]] frame_index_t position() const noexcept;

            /// Track length at the pipeline rate, when known
            [[nodiscard]] std::optional<frame_index_t> total_frames() const;

            /// Blocks pushed into the ring buffer since start()
            [[nodiscard]] uint64_t blocks_processed() const noexcept;

            /**
             * @brief Take every queued event, oldest first
             */
            std::vector<pipeline_event> drain_events();

        private:
            struct impl;
            const std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_PIPELINE_HH
