/**
 * @file pcm_block.hh
 * @brief Reusable block of interleaved float frames
 */

#ifndef AUDIOPIPE_PCM_BLOCK_HH
#define AUDIOPIPE_PCM_BLOCK_HH

#include <audiopipe/sdk/buffer.hh>
#include <audiopipe/sdk/types.hh>

#include <algorithm>
#include <cstddef>

namespace audiopipe {

    /**
     * @class pcm_block
     * @brief Fixed-capacity group of interleaved frames processed as one unit
     *
     * A pipeline allocates a single block when it is built and reuses it for
     * every cycle. The capacity covers the longest output the time-stretch
     * stage can produce, so no stage ever reallocates.
     *
     * Besides the samples a block carries the source position of its first
     * frame and the number of source frames it represents. The latter differs
     * from frames() once the time-stretch stage changed the block length.
     */
    class pcm_block {
        public:
            pcm_block(std::size_t capacity_frames, channels_t channels, sample_rate_t rate)
                : m_samples(capacity_frames * channels),
                  m_capacity(capacity_frames),
                  m_channels(channels),
                  m_rate(rate) {
            }

            [[nodiscard]] float* data() noexcept { return m_samples.data(); }
            [[nodiscard]] const float* data() const noexcept { return m_samples.data(); }

            /// Valid frames
            [[nodiscard]] std::size_t frames() const noexcept { return m_frames; }
            [[nodiscard]] std::size_t samples() const noexcept { return m_frames * m_channels; }
            [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }
            [[nodiscard]] sample_rate_t rate() const noexcept { return m_rate; }
            [[nodiscard]] bool empty() const noexcept { return m_frames == 0; }

            /**
             * @brief Change the valid frame count, clamped to capacity()
             */
            void set_frames(std::size_t frames) noexcept {
                m_frames = std::min(frames, m_capacity);
            }

            [[nodiscard]] frame_index_t source_position() const noexcept { return m_source_position; }
            void set_source_position(frame_index_t pos) noexcept { m_source_position = pos; }

            /// Source frames consumed to produce this block
            [[nodiscard]] std::size_t source_frames() const noexcept { return m_source_frames; }
            void set_source_frames(std::size_t n) noexcept { m_source_frames = n; }

            float& sample(std::size_t frame, channels_t ch) noexcept {
                return m_samples[frame * m_channels + ch];
            }

            [[nodiscard]] float sample(std::size_t frame, channels_t ch) const noexcept {
                return m_samples[frame * m_channels + ch];
            }

            void clear() noexcept {
                m_frames = 0;
                m_source_frames = 0;
            }

        private:
            buffer<float> m_samples;
            std::size_t m_capacity;
            channels_t m_channels;
            sample_rate_t m_rate;
            std::size_t m_frames = 0;
            std::size_t m_source_frames = 0;
            frame_index_t m_source_position = 0;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_PCM_BLOCK_HH
