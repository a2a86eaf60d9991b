// This is copyrighted software. More information is at the end of this file.
#include <audiopipe/codecs/decoder_drmp3.hh>
#include <audiopipe/error.hh>
#include <failsafe/failsafe.hh>

#include "dr_io_callbacks.hh"

#define DRMP3_API static
#define DR_MP3_NO_STDIO
#define DR_MP3_IMPLEMENTATION

#include <dr_mp3.h>

extern "C" {
static size_t drmp3_read_callback(void* const user, void* const dst, const size_t len) {
    return audiopipe::detail::dr_read(user, dst, len);
}

static drmp3_bool32 drmp3_seek_callback(void* const user, const int offset, const drmp3_seek_origin origin) {
    switch (origin) {
        case drmp3_seek_origin_start:
            return audiopipe::detail::dr_seek(user, offset, false);
        case drmp3_seek_origin_current:
            return audiopipe::detail::dr_seek(user, offset, true);
        default:
            return false;
    }
}
} // extern "C"

namespace audiopipe {
    struct decoder_drmp3::impl final {
        drmp3 m_handle{};
        std::optional<frame_index_t> m_total_frames;
        bool m_eof = false;
    };

    decoder_drmp3::decoder_drmp3()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drmp3::~decoder_drmp3() {
        if (!is_open()) {
            return;
        }
        drmp3_uninit(&m_pimpl->m_handle);
    }

    bool decoder_drmp3::accept(io_stream* stream) {
        if (!stream) {
            return false;
        }
        const auto original_pos = stream->tell();
        if (original_pos < 0) {
            return false;
        }

        drmp3 probe;
        const bool result = drmp3_init(&probe, drmp3_read_callback, drmp3_seek_callback, stream, nullptr);
        if (result) {
            drmp3_uninit(&probe);
        }

        stream->seek(original_pos, seek_origin::set);
        return result;
    }

    const char* decoder_drmp3::get_name() const {
        return "MP3 (dr_mp3)";
    }

    void decoder_drmp3::open(io_stream* const stream) {
        if (is_open()) {
            return;
        }

        if (!drmp3_init(&m_pimpl->m_handle, drmp3_read_callback, drmp3_seek_callback, stream, nullptr)) {
            throw decoder_error("drmp3_init failed: not a supported MP3 stream");
        }
        // Counting frames walks the whole stream, which only works when its size is known
        if (stream->get_size() > 0) {
            const auto frames = drmp3_get_pcm_frame_count(&m_pimpl->m_handle);
            if (frames > 0) {
                m_pimpl->m_total_frames = frames;
            }
        }
        set_is_open(true);
    }

    size_t decoder_drmp3::do_decode(float* const buf, size_t len) {
        if (m_pimpl->m_eof || !is_open()) {
            return 0;
        }

        const auto channels = get_channels();
        const auto wanted = static_cast <drmp3_uint64>(len / channels);
        const auto frames = drmp3_read_pcm_frames_f32(&m_pimpl->m_handle, wanted, buf);
        if (frames < wanted) {
            m_pimpl->m_eof = true;
        }
        return static_cast <size_t>(frames * channels);
    }

    channels_t decoder_drmp3::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drmp3::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    std::optional<frame_index_t> decoder_drmp3::total_frames() const {
        return m_pimpl->m_total_frames;
    }

    bool decoder_drmp3::seek_to_frame(frame_index_t frame) {
        if (!is_open()) {
            return false;
        }
        if (!drmp3_seek_to_pcm_frame(&m_pimpl->m_handle, frame)) {
            LOG_DEBUG("decoder_drmp3", "seek to frame", frame, "failed");
            return false;
        }
        m_pimpl->m_eof = false;
        return true;
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
