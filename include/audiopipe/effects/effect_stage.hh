/**
 * @file effect_stage.hh
 * @brief Interface of the per-block processing stages
 * @ingroup effects
 */

#pragma once

#include <audiopipe/effect_params.hh>
#include <audiopipe/pcm_block.hh>
#include <audiopipe/export_audiopipe.h>

namespace audiopipe {

    /**
     * @class effect_stage
     * @brief Abstract base class for the processing stages of the pipeline
     * @ingroup effects
     *
     * A stage transforms one pcm_block in place, given the parameter snapshot
     * read for that block. Output is fully determined by the block, the
     * snapshot and the stage's own history, so feeding the same material in
     * different block sizes gives the same samples.
     *
     * ## Real-Time Constraints
     *
     * process() runs on the producer thread once per block:
     * - **No allocation** - every scratch area is sized by the constructor
     * - **No locking** - the snapshot is immutable
     * - **History stays inside the stage** - filter memory, interpolation
     *   phase and envelope counters survive between blocks
     *
     * The pipeline runs the stages in a fixed order:
     * time stretch, equalizer, fade, gain.
     */
    class AUDIOPIPE_EXPORT effect_stage {
        public:
            effect_stage() = default;
            virtual ~effect_stage();

            effect_stage(const effect_stage&) = delete;
            effect_stage& operator=(const effect_stage&) = delete;

            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Process @p block in place
             * @param block Frames to transform; a stage may change its length
             * @param params Snapshot observed for this block
             */
            virtual void process(pcm_block& block, const effect_params& params) = 0;

            /**
             * @brief Forget all history, as after a seek
             */
            virtual void reset() = 0;
    };

} // namespace audiopipe
