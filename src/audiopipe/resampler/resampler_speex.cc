// This is copyrighted software. More information is at the end of this file.
#include "resampler_speex.hh"

#include <speex/speex_resampler.h>
#include <failsafe/failsafe.hh>

#include <algorithm>

namespace audiopipe {
    struct resampler_speex::impl final {
        explicit impl(int quality)
            : m_quality(quality) {
        }

        using resampler_ptr_t = std::unique_ptr <SpeexResamplerState, decltype(&speex_resampler_destroy)>;
        resampler_ptr_t m_resampler{nullptr, &speex_resampler_destroy};
        int m_quality;
    };

    static int clamp_quality(int quality) {
        return std::min(std::max(SPEEX_RESAMPLER_QUALITY_MIN, quality), SPEEX_RESAMPLER_QUALITY_MAX);
    }

    resampler_speex::resampler_speex(int quality)
        : m_pimpl(std::make_unique <impl>(clamp_quality(quality))) {
    }

    resampler_speex::~resampler_speex() = default;

    int resampler_speex::quality() const noexcept {
        return m_pimpl->m_quality;
    }

    void resampler_speex::set_quality(int quality) {
        m_pimpl->m_quality = clamp_quality(quality);
        if (m_pimpl->m_resampler) {
            speex_resampler_set_quality(m_pimpl->m_resampler.get(), m_pimpl->m_quality);
        }
    }

    void resampler_speex::do_resampling(float dst[], const float src[], std::size_t& dst_len, std::size_t& src_len) {
        const unsigned int channels = get_current_channels();
        if (!m_pimpl->m_resampler || channels == 0) {
            dst_len = src_len = 0;
            return;
        }

        auto spx_in_len = static_cast <spx_uint32_t>(src_len / channels);
        auto spx_out_len = static_cast <spx_uint32_t>(dst_len / channels);
        if (spx_in_len == 0 || spx_out_len == 0) {
            dst_len = src_len = 0;
            return;
        }
        const int err = speex_resampler_process_interleaved_float(m_pimpl->m_resampler.get(), src, &spx_in_len, dst,
                                                                  &spx_out_len);
        if (err != RESAMPLER_ERR_SUCCESS) {
            THROW_RUNTIME("speex resampler:", speex_resampler_strerror(err));
        }
        dst_len = spx_out_len * channels;
        src_len = spx_in_len * channels;
    }

    int resampler_speex::adjust_for_output_spec(sample_rate_t dst_rate, sample_rate_t src_rate, channels_t channels) {
        int err = RESAMPLER_ERR_SUCCESS;
        m_pimpl->m_resampler.reset(speex_resampler_init(channels, src_rate, dst_rate, m_pimpl->m_quality, &err));
        if (err != RESAMPLER_ERR_SUCCESS || !m_pimpl->m_resampler) {
            LOG_ERROR("resampler_speex", "speex_resampler_init failed:", speex_resampler_strerror(err));
            m_pimpl->m_resampler.reset();
            return -1;
        }
        // skip the filter's leading zeros so a seek does not shift the output
        speex_resampler_skip_zeros(m_pimpl->m_resampler.get());
        return 0;
    }

    void resampler_speex::do_discard_pending_samples() {
        // speex_resampler_reset_mem() leaves the phase state behind, so a
        // fresh handle is the only clean way to drop history.
        if (m_pimpl->m_resampler &&
            adjust_for_output_spec(get_current_rate(), get_source_rate(), get_current_channels()) != 0) {
            THROW_RUNTIME("speex resampler: cannot recreate state");
        }
    }
}

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
