/**
 * @file ring_buffer.hh
 * @brief Single-producer single-consumer frame queue between pipeline and device
 */

#ifndef AUDIOPIPE_RING_BUFFER_HH
#define AUDIOPIPE_RING_BUFFER_HH

#include <audiopipe/sdk/buffer.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/export_audiopipe.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>

namespace audiopipe {

    enum class write_status {
        ok,             ///< every frame was accepted
        buffer_full,    ///< timeout expired with frames left over
        aborted         ///< abort predicate fired while waiting
    };

    struct write_result {
        write_status status = write_status::ok;
        std::size_t frames_written = 0;
    };

    struct read_result {
        std::size_t frames_read = 0;    ///< real frames, the rest of the request is silence
        bool underrun = false;
    };

    /**
     * @class output_ring_buffer
     * @brief Bounded interleaved float queue with one writer and one reader
     *
     * The writer is the pipeline producer thread, the reader is the device
     * callback. Both sides only touch their own monotonically increasing
     * frame counter, so neither side locks. The read side is additionally
     * allocation free and noexcept and may be called from a real-time
     * audio thread.
     *
     * Invariants:
     * - 0 <= written_frames() - read_frames() == size() <= capacity()
     * - frames come out in exactly the order they went in
     * - a short read is padded with silence and counted as one underrun
     *
     * A flush (used for seeking) is requested by the control side and applied
     * by the reader at the start of its next read: everything written before
     * the request is discarded, anything written afterwards survives. The
     * writer may reuse the flushed space right away unless a read that
     * started before the request is still copying; then it waits for that
     * read to finish.
     */
    class AUDIOPIPE_EXPORT output_ring_buffer {
        public:
            using abort_predicate_t = std::function<bool()>;

            /**
             * @param capacity_frames Number of frames the buffer holds (> 0)
             * @param channels Interleaved channels per frame (> 0)
             * @throws std::invalid_argument on a zero capacity or channel count
             */
            output_ring_buffer(std::size_t capacity_frames, channels_t channels);

            output_ring_buffer(const output_ring_buffer&) = delete;
            output_ring_buffer& operator=(const output_ring_buffer&) = delete;

            /**
             * @brief Copy as many of @p frames as currently fit
             * @return Frames copied, possibly 0
             */
            std::size_t try_write(const float* frames, std::size_t count);

            /**
             * @brief Copy all @p count frames, waiting for space up to @p timeout
             *
             * The wait polls for space in short sleeps. @p abort, when set, is
             * checked on every poll and terminates the wait early; it lets a
             * controller pull a blocked producer out without draining the
             * buffer first.
             */
            write_result write(const float* frames, std::size_t count,
                               std::chrono::milliseconds timeout,
                               const abort_predicate_t& abort = {});

            /**
             * @brief Fill @p out with exactly @p count frames
             *
             * Missing frames are written as silence. Never blocks, allocates
             * or throws.
             */
            read_result read(float* out, std::size_t count) noexcept;

            /**
             * @brief Discard every frame written so far, applied by the reader
             */
            void request_flush() noexcept;

            /**
             * @brief Return to the empty state and clear the statistics
             *
             * Only valid while neither the writer nor the reader is active.
             */
            void reset() noexcept;

            /// Frames currently readable, with a pending flush already applied
            [[nodiscard]] std::size_t size() const noexcept;
            /// Frames that can be written without waiting
            [[nodiscard]] std::size_t available() const noexcept;
            [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }
            [[nodiscard]] bool empty() const noexcept { return size() == 0; }

            /// Total frames accepted since construction or reset()
            [[nodiscard]] uint64_t written_frames() const noexcept;
            /// Read counter: frames consumed by the reader, flushed frames included
            [[nodiscard]] uint64_t read_frames() const noexcept;
            /// Total real frames handed to the reader
            [[nodiscard]] uint64_t delivered_frames() const noexcept;
            [[nodiscard]] uint64_t underruns() const noexcept;

        private:
            [[nodiscard]] uint64_t effective_read_index() const noexcept;
            [[nodiscard]] uint64_t writer_read_index() const noexcept;

            buffer<float> m_data;
            const std::size_t m_capacity;
            const channels_t m_channels;

            alignas(64) std::atomic<uint64_t> m_write_index{0};
            alignas(64) std::atomic<uint64_t> m_read_index{0};
            alignas(64) std::atomic<uint64_t> m_flush_target{0};
            std::atomic<bool> m_flush_pending{false};
            std::atomic<bool> m_reading{false};
            std::atomic<uint64_t> m_frames_delivered{0};
            std::atomic<uint64_t> m_underruns{0};
    };

} // namespace audiopipe

#endif // AUDIOPIPE_RING_BUFFER_HH
