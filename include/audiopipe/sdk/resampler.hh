/**
 * @file resampler.hh
 * @brief Sample rate conversion between a decoder and the pipeline
 * @ingroup sdk_resampling
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOPIPE_RESAMPLER
#define AUDIOPIPE_RESAMPLER

#include <cstddef>
#include <memory>
#include <audiopipe/sdk/export_audiopipe_sdk.h>
#include <audiopipe/sdk/types.hh>

namespace audiopipe {
    class decoder;

    /**
     * @class resampler
     * @brief Pulls frames from a decoder and delivers them at the pipeline rate
     * @ingroup sdk_resampling
     *
     * The resampler owns two staging buffers sized by set_spec(). resample()
     * keeps decoding into the input buffer and converting into the output
     * buffer until the caller's request is satisfied or the decoder is
     * exhausted. When source and destination rates match the samples are
     * copied unchanged.
     *
     * Subclasses provide the conversion kernel:
     *
     * @code
     * class my_resampler : public resampler {
     * protected:
     *     int adjust_for_output_spec(sample_rate_t dst_rate, sample_rate_t src_rate,
     *                                channels_t channels) override;
     *     void do_resampling(float dst[], const float src[],
     *                        size_t& dst_len, size_t& src_len) override;
     *     void do_discard_pending_samples() override;
     * };
     * @endcode
     *
     * @see resampler_speex, decoder_adapter
     */
    class AUDIOPIPE_SDK_EXPORT resampler {
        public:
            resampler();
            virtual ~resampler();

            resampler(const resampler&) = delete;
            auto operator=(const resampler&) -> resampler& = delete;

            /**
             * @brief Set the source decoder (must be open)
             */
            void set_decoder(std::shared_ptr <decoder> decoder);

            /**
             * @brief Configure output rate, channel layout and chunk size
             * @param dst_rate Target rate in Hz
             * @param channels Output channels; the decoder is asked for this layout
             * @param chunk_size Frames converted per internal pass
             * @throws std::runtime_error if the kernel rejects the configuration
             */
            void set_spec(sample_rate_t dst_rate, channels_t channels, size_t chunk_size);

            [[nodiscard]] sample_rate_t get_current_rate() const;
            [[nodiscard]] sample_rate_t get_source_rate() const;
            [[nodiscard]] channels_t get_current_channels() const;
            [[nodiscard]] size_t get_current_chunk_size() const;

            /**
             * @brief Fill @p dst with up to @p dst_len interleaved samples
             * @return Samples written; fewer than requested only at the end
             *         of the source, 0 once it is exhausted
             * @throws decoder_error propagated from the decoder
             */
            std::size_t resample(float dst[], std::size_t dst_len);

            /**
             * @brief Drop staged samples, e.g. after the decoder was repositioned
             */
            void discard_pending_samples();

        protected:
            /**
             * @return 0 on success, negative if the rates are not supported
             */
            virtual int adjust_for_output_spec(sample_rate_t dst_rate, sample_rate_t src_rate, channels_t channels) = 0;

            /**
             * @param[out] dst Destination samples
             * @param[in] src Source samples
             * @param[in,out] dst_len Capacity in, samples produced out
             * @param[in,out] src_len Samples available in, samples consumed out
             */
            virtual void do_resampling(float dst[], const float src[], std::size_t& dst_len, std::size_t& src_len) = 0;

            virtual void do_discard_pending_samples() = 0;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };
}
#endif

/*
 * Copyright (C) 2025
 *
 * This file is part of audiopipe.
 *
 * audiopipe is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audiopipe is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audiopipe.  If not, see <http://www.gnu.org/licenses/>.
 */
