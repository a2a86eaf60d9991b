// This is copyrighted software. More information is at the end of this file.
#include <audiopipe/sdk/decoder.hh>
#include <audiopipe/sdk/buffer.hh>
#include <audiopipe/error.hh>

#include <memory>
#include <string>

namespace audiopipe {
    struct decoder::impl final {
        buffer <float> m_stereo_buf{0};
        bool m_is_open = false;
    };

    decoder::decoder()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder::~decoder() = default;

    bool decoder::is_open() const {
        return m_pimpl->m_is_open;
    }

    // In-place; buf must hold 2 * frames samples.
    static void mono_to_stereo(float buf[], size_t frames) {
        for (size_t i = frames; i-- > 0;) {
            buf[2 * i + 1] = buf[i];
            buf[2 * i] = buf[i];
        }
    }

    static void stereo_to_mono(float dst[], const float src[], size_t frames) {
        for (size_t i = 0; i < frames; ++i) {
            dst[i] = (src[2 * i] + src[2 * i + 1]) * 0.5f;
        }
    }

    size_t decoder::decode(float buf[], size_t len, channels_t out_channels) {
        const channels_t src_channels = get_channels();
        if (src_channels == 0 || out_channels == 0) {
            throw format_error("decoder: zero channel layout");
        }
        const size_t frames = len / out_channels;
        if (frames == 0) {
            return 0;
        }

        if (src_channels == out_channels) {
            return do_decode(buf, frames * out_channels);
        }

        if (src_channels == 1 && out_channels == 2) {
            const auto got = do_decode(buf, frames);
            mono_to_stereo(buf, got);
            return got * 2;
        }

        if (src_channels == 2 && out_channels == 1) {
            if (m_pimpl->m_stereo_buf.size() < frames * 2) {
                m_pimpl->m_stereo_buf.reset(frames * 2);
            }
            const auto got = do_decode(m_pimpl->m_stereo_buf.data(), frames * 2);
            stereo_to_mono(buf, m_pimpl->m_stereo_buf.data(), got / 2);
            return got / 2;
        }

        throw format_error(std::string(get_name()) + ": cannot map " + std::to_string(src_channels) +
                           " channels to " + std::to_string(out_channels));
    }

    bool decoder::rewind() {
        return seek_to_frame(0);
    }

    std::chrono::microseconds decoder::duration() const {
        const auto frames = total_frames();
        if (!frames || get_rate() == 0) {
            return {};
        }
        return std::chrono::duration_cast <std::chrono::microseconds>(
            std::chrono::duration <double>(static_cast <double>(*frames) / get_rate()));
    }

    void decoder::set_is_open(bool f) {
        m_pimpl->m_is_open = f;
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
