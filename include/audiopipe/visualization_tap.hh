/**
 * @file visualization_tap.hh
 * @brief Non-blocking copy of the most recent output blocks for display
 */

#ifndef AUDIOPIPE_VISUALIZATION_TAP_HH
#define AUDIOPIPE_VISUALIZATION_TAP_HH

#include <audiopipe/pcm_block.hh>
#include <audiopipe/export_audiopipe.h>

#include <memory>
#include <vector>

namespace audiopipe {

    /**
     * @struct visualization_snapshot
     * @brief The last few processed blocks, oldest first, as one interleaved run
     */
    struct visualization_snapshot {
        std::vector<float> samples;
        channels_t channels = 0;
        sample_rate_t rate = 0;
        frame_index_t position = 0;     ///< source position of the newest block
        std::size_t blocks = 0;

        [[nodiscard]] std::size_t frames() const noexcept {
            return channels ? samples.size() / channels : 0;
        }

        [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
    };

    /**
     * @struct channel_levels
     * @brief Peak and RMS amplitude of one channel
     */
    struct channel_levels {
        float peak = 0.0f;
        float rms = 0.0f;
    };

    /**
     * @brief Per-channel peak and RMS over the whole snapshot
     * @return One entry per channel, empty for an empty snapshot
     */
    AUDIOPIPE_EXPORT std::vector<channel_levels> compute_levels(const visualization_snapshot& snapshot);

    /**
     * @class visualization_tap
     * @brief Fixed ring of block slots written by the producer, read by the UI
     *
     * push() is called once per block from the producer thread and never
     * waits: each slot carries its own try-lock and a block is dropped
     * (and counted) when the UI happens to be copying the slot that would be
     * overwritten. The oldest slot is always the one overwritten.
     *
     * snapshot() is called from the UI thread and copies the slots in write
     * order. The producer holds a slot lock only for one memcpy of a block,
     * so the reader spins on it.
     */
    class AUDIOPIPE_EXPORT visualization_tap {
        public:
            /**
             * @param slots Number of blocks retained (> 0)
             * @param max_block_frames Largest block push() accepts; longer blocks are truncated
             * @param channels Channels of the blocks
             */
            visualization_tap(std::size_t slots, std::size_t max_block_frames, channels_t channels);
            ~visualization_tap();

            visualization_tap(const visualization_tap&) = delete;
            visualization_tap& operator=(const visualization_tap&) = delete;

            /**
             * @brief Copy @p block into the oldest slot
             * @return false if the block was dropped or the tap is disabled
             */
            bool push(const pcm_block& block) noexcept;

            [[nodiscard]] visualization_snapshot snapshot() const;

            /**
             * @brief Forget every retained block
             *
             * Called on seek and stop so stale audio is not displayed.
             */
            void clear() noexcept;

            void set_enabled(bool enabled) noexcept;
            [[nodiscard]] bool is_enabled() const noexcept;

            [[nodiscard]] std::size_t slots() const noexcept;
            [[nodiscard]] uint64_t dropped_blocks() const noexcept;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_VISUALIZATION_TAP_HH
