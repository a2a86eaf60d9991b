// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audiopipe/sdk/resampler.hh>

namespace audiopipe {
    /*!
     * \brief Speex DSP resampler, used by the decoder adapter whenever the
     * track rate differs from the pipeline rate.
     */
    class resampler_speex : public resampler {
        public:
            /*!
             * \param quality
             *      Speex quality level from 0 to 10, clamped.
             */
            explicit resampler_speex(int quality = 5);
            ~resampler_speex() override;

            [[nodiscard]] int quality() const noexcept;
            void set_quality(int quality);

        protected:
            void do_resampling(float dst[], const float src[], std::size_t& dst_len, std::size_t& src_len) override;
            int adjust_for_output_spec(sample_rate_t dst_rate, sample_rate_t src_rate, channels_t channels) override;
            void do_discard_pending_samples() override;

        private:
            struct impl;
            const std::unique_ptr <impl> m_pimpl;
    };
} // namespace audiopipe

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
