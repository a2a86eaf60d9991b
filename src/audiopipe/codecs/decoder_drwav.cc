#include <audiopipe/codecs/decoder_drwav.hh>
#include <audiopipe/error.hh>
#include <failsafe/failsafe.hh>

#include "dr_io_callbacks.hh"

#define DR_WAV_NO_STDIO
#define DR_WAV_IMPLEMENTATION
#define DRWAV_API static
#define DRWAV_PRIVATE static
#include <dr_wav.h>

#include <string>

extern "C" {
static size_t drwav_read_callback(void* const user, void* const dst, const size_t len) {
    return audiopipe::detail::dr_read(user, dst, len);
}

static drwav_bool32 drwav_seek_callback(void* const user, const int offset, const drwav_seek_origin origin) {
    switch (origin) {
        case drwav_seek_origin_start:
            return audiopipe::detail::dr_seek(user, offset, false);
        case drwav_seek_origin_current:
            return audiopipe::detail::dr_seek(user, offset, true);
        default:
            return false;
    }
}
} // extern "C"

namespace audiopipe {
    struct decoder_drwav::impl final {
        drwav m_handle{};
        bool m_eof = false;
    };

    decoder_drwav::decoder_drwav()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drwav::~decoder_drwav() {
        if (!is_open()) {
            return;
        }
        drwav_uninit(&m_pimpl->m_handle);
    }

    bool decoder_drwav::accept(io_stream* stream) {
        if (!stream) {
            return false;
        }
        const auto original_pos = stream->tell();
        if (original_pos < 0) {
            return false;
        }

        drwav probe;
        const bool result = drwav_init(&probe, drwav_read_callback, drwav_seek_callback, stream, nullptr);
        if (result) {
            drwav_uninit(&probe);
        }

        stream->seek(original_pos, seek_origin::set);
        return result;
    }

    const char* decoder_drwav::get_name() const {
        return "WAV (dr_wav)";
    }

    void decoder_drwav::open(io_stream* const stream) {
        if (is_open()) {
            return;
        }
        if (!drwav_init(&m_pimpl->m_handle, drwav_read_callback, drwav_seek_callback, stream, nullptr)) {
            throw decoder_error("drwav_init failed: not a supported WAV stream");
        }
        set_is_open(true);
    }

    size_t decoder_drwav::do_decode(float* const buf, size_t len) {
        if (m_pimpl->m_eof || !is_open()) {
            return 0;
        }

        const auto channels = get_channels();
        const auto wanted = static_cast <drwav_uint64>(len / channels);
        const auto frames = drwav_read_pcm_frames_f32(&m_pimpl->m_handle, wanted, buf);
        if (frames < wanted) {
            m_pimpl->m_eof = true;
            auto& h = m_pimpl->m_handle;
            if (h.totalPCMFrameCount > 0 && h.readCursorInPCMFrames < h.totalPCMFrameCount) {
                throw decoder_error("WAV stream truncated at frame " + std::to_string(h.readCursorInPCMFrames) +
                                    " of " + std::to_string(h.totalPCMFrameCount));
            }
        }
        return static_cast <size_t>(frames * channels);
    }

    channels_t decoder_drwav::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drwav::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    std::optional<frame_index_t> decoder_drwav::total_frames() const {
        if (!is_open() || m_pimpl->m_handle.totalPCMFrameCount == 0) {
            return std::nullopt;
        }
        return m_pimpl->m_handle.totalPCMFrameCount;
    }

    bool decoder_drwav::seek_to_frame(frame_index_t frame) {
        if (!is_open() || !drwav_seek_to_pcm_frame(&m_pimpl->m_handle, frame)) {
            LOG_DEBUG("decoder_drwav", "seek to frame", frame, "failed");
            return false;
        }
        m_pimpl->m_eof = false;
        return true;
    }
}
