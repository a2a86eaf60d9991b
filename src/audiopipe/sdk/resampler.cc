// This is copyrighted software. More information is at the end of this file.
#include <audiopipe/sdk/resampler.hh>

#include <audiopipe/sdk/decoder.hh>
#include <audiopipe/sdk/buffer.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

static void relocate_buffer(float* buf, std::size_t& pos, std::size_t& end) {
    if (pos >= end) {
        pos = end = 0;
        return;
    }
    if (pos < 1) {
        return;
    }
    auto len = end - pos;
    std::memmove(buf, buf + pos, len * sizeof(*buf));
    pos = 0;
    end = len;
}

namespace audiopipe {
    struct resampler::impl final {
        resampler* m_owner;

        explicit impl(resampler* pub)
            : m_owner(pub) {
        }

        std::shared_ptr <decoder> m_decoder = nullptr;
        sample_rate_t m_dst_rate = 0;
        sample_rate_t m_src_rate = 0;
        channels_t m_channels = 0;
        std::size_t m_chunk_size = 0;
        buffer <float> m_out_buffer{0};
        buffer <float> m_input_buffer{0};
        std::size_t m_out_buffer_pos = 0;
        std::size_t m_out_buffer_end = 0;
        std::size_t m_in_buffer_pos = 0;
        std::size_t m_in_buffer_end = 0;
        bool m_decoder_eof = false;

        std::size_t move_from_out_buffer(float dst[], std::size_t dst_len);
        void adjust_buffer_sizes();

        // Returns true if any input was consumed or output produced
        bool resample_from_in_buffer();
        void fill_input();
    };

    std::size_t resampler::impl::move_from_out_buffer(float dst[], std::size_t dst_len) {
        if (m_out_buffer_pos >= m_out_buffer_end) {
            m_out_buffer_pos = m_out_buffer_end = 0;
            return 0;
        }
        auto len = std::min(m_out_buffer_end - m_out_buffer_pos, dst_len);
        std::memcpy(dst, m_out_buffer.data() + m_out_buffer_pos, len * sizeof(float));
        m_out_buffer_pos += len;
        if (m_out_buffer_pos >= m_out_buffer_end) {
            m_out_buffer_end = m_out_buffer_pos = 0;
        }
        return len;
    }

    void resampler::impl::adjust_buffer_sizes() {
        const std::size_t out_buf_siz = m_channels * m_chunk_size;
        std::size_t in_buf_siz = out_buf_siz;

        if (m_dst_rate != m_src_rate) {
            in_buf_siz = static_cast <std::size_t>(std::ceil(
                static_cast <double>(out_buf_siz) * m_src_rate / m_dst_rate));
            auto remainder = in_buf_siz % m_channels;
            if (remainder != 0) {
                in_buf_siz += m_channels - remainder;
            }
        }

        m_out_buffer.reset(out_buf_siz);
        m_input_buffer.reset(in_buf_siz);
        m_out_buffer_pos = m_out_buffer_end = m_in_buffer_pos = m_in_buffer_end = 0;
    }

    bool resampler::impl::resample_from_in_buffer() {
        auto in_len = m_in_buffer_end - m_in_buffer_pos;
        if (in_len == 0) {
            return false;
        }
        float* from = m_input_buffer.data() + m_in_buffer_pos;
        float* to = m_out_buffer.data() + m_out_buffer_end;
        std::size_t out_len = m_out_buffer.size() - m_out_buffer_end;
        if (m_src_rate == m_dst_rate) {
            out_len = std::min(out_len, in_len);
            std::memcpy(to, from, out_len * sizeof(float));
            in_len = out_len;
        } else {
            m_owner->do_resampling(to, from, out_len, in_len);
        }
        m_out_buffer_end += out_len;
        m_in_buffer_pos += in_len;
        relocate_buffer(m_input_buffer.data(), m_in_buffer_pos, m_in_buffer_end);
        return out_len > 0 || in_len > 0;
    }

    void resampler::impl::fill_input() {
        if (m_decoder_eof) {
            return;
        }
        auto space = m_input_buffer.size() - m_in_buffer_end;
        space -= space % m_channels;
        if (space == 0) {
            return;
        }
        auto got = m_decoder->decode(m_input_buffer.data() + m_in_buffer_end, space, m_channels);
        if (got == 0) {
            m_decoder_eof = true;
        } else {
            m_in_buffer_end += got;
        }
    }

    resampler::resampler()
        : m_pimpl(std::make_unique <impl>(this)) {
    }

    resampler::~resampler() = default;

    void resampler::set_decoder(std::shared_ptr <decoder> decoder) {
        m_pimpl->m_decoder = std::move(decoder);
        m_pimpl->m_decoder_eof = false;
    }

    void resampler::set_spec(sample_rate_t dst_rate, channels_t channels, size_t chunk_size) {
        if (!m_pimpl->m_decoder) {
            THROW_RUNTIME("resampler: no decoder set");
        }
        if (dst_rate == 0 || channels == 0 || chunk_size == 0) {
            THROW_RUNTIME("resampler: invalid output spec");
        }
        m_pimpl->m_dst_rate = dst_rate;
        m_pimpl->m_channels = channels;
        m_pimpl->m_chunk_size = chunk_size;
        m_pimpl->m_src_rate = std::min(std::max(4000u, m_pimpl->m_decoder->get_rate()), 192000u);
        m_pimpl->m_decoder_eof = false;
        m_pimpl->adjust_buffer_sizes();
        if (m_pimpl->m_src_rate != m_pimpl->m_dst_rate &&
            adjust_for_output_spec(m_pimpl->m_dst_rate, m_pimpl->m_src_rate, m_pimpl->m_channels) != 0) {
            THROW_RUNTIME("resampler: cannot convert", m_pimpl->m_src_rate, "Hz to", m_pimpl->m_dst_rate, "Hz");
        }
    }

    sample_rate_t resampler::get_current_rate() const {
        return m_pimpl->m_dst_rate;
    }

    sample_rate_t resampler::get_source_rate() const {
        return m_pimpl->m_src_rate;
    }

    channels_t resampler::get_current_channels() const {
        return m_pimpl->m_channels;
    }

    size_t resampler::get_current_chunk_size() const {
        return m_pimpl->m_chunk_size;
    }

    std::size_t resampler::resample(float dst[], std::size_t dst_len) {
        std::size_t total_samples = 0;
        while (total_samples < dst_len) {
            total_samples += m_pimpl->move_from_out_buffer(dst + total_samples, dst_len - total_samples);
            if (total_samples >= dst_len) {
                break;
            }
            m_pimpl->fill_input();
            const bool progressed = m_pimpl->resample_from_in_buffer();
            if (!progressed && m_pimpl->m_decoder_eof) {
                break;
            }
        }
        return total_samples;
    }

    void resampler::discard_pending_samples() {
        m_pimpl->m_out_buffer_pos = m_pimpl->m_out_buffer_end = m_pimpl->m_in_buffer_pos = m_pimpl->m_in_buffer_end = 0;
        m_pimpl->m_decoder_eof = false;
        if (m_pimpl->m_src_rate != m_pimpl->m_dst_rate) {
            do_discard_pending_samples();
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
