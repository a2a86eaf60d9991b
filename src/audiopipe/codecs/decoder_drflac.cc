#include <audiopipe/codecs/decoder_drflac.hh>
#include <audiopipe/error.hh>
#include <failsafe/failsafe.hh>

#include "dr_io_callbacks.hh"

#define DR_FLAC_NO_STDIO
#define DR_FLAC_IMPLEMENTATION
#define DRFLAC_API static
#include <dr_flac.h>

#include <string>

extern "C" {
static size_t drflac_read_callback(void* const user, void* const dst, const size_t len) {
    return audiopipe::detail::dr_read(user, dst, len);
}

static drflac_bool32 drflac_seek_callback(void* const user, const int offset, const drflac_seek_origin origin) {
    switch (origin) {
        case drflac_seek_origin_start:
            return audiopipe::detail::dr_seek(user, offset, false);
        case drflac_seek_origin_current:
            return audiopipe::detail::dr_seek(user, offset, true);
        default:
            return false;
    }
}
} // extern "C"

namespace audiopipe {
    struct decoder_drflac::impl final {
        std::unique_ptr <drflac, decltype(&drflac_close)> m_handle{nullptr, drflac_close};
        bool m_eof = false;
    };

    decoder_drflac::decoder_drflac()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drflac::~decoder_drflac() = default;

    bool decoder_drflac::accept(io_stream* stream) {
        if (!stream) {
            return false;
        }
        const auto original_pos = stream->tell();
        if (original_pos < 0) {
            return false;
        }

        // The "fLaC" marker is enough; a full drflac_open would parse every metadata block
        char magic[4] = {};
        const bool result = stream->read(magic, sizeof(magic)) == sizeof(magic) &&
                            magic[0] == 'f' && magic[1] == 'L' && magic[2] == 'a' && magic[3] == 'C';

        stream->seek(original_pos, seek_origin::set);
        return result;
    }

    const char* decoder_drflac::get_name() const {
        return "FLAC (dr_flac)";
    }

    void decoder_drflac::open(io_stream* const stream) {
        if (is_open()) {
            return;
        }
        m_pimpl->m_handle = {drflac_open(drflac_read_callback, drflac_seek_callback, stream, nullptr), drflac_close};
        if (!m_pimpl->m_handle) {
            throw decoder_error("drflac_open failed: not a supported FLAC stream");
        }
        set_is_open(true);
    }

    size_t decoder_drflac::do_decode(float* const buf, size_t len) {
        if (m_pimpl->m_eof || !is_open()) {
            return 0;
        }

        auto* h = m_pimpl->m_handle.get();
        const auto channels = get_channels();
        const auto wanted = static_cast <drflac_uint64>(len / channels);
        const auto frames = drflac_read_pcm_frames_f32(h, wanted, buf);
        if (frames < wanted) {
            m_pimpl->m_eof = true;
            if (h->totalPCMFrameCount > 0 && h->currentPCMFrame < h->totalPCMFrameCount) {
                throw decoder_error("FLAC stream truncated at frame " + std::to_string(h->currentPCMFrame) +
                                    " of " + std::to_string(h->totalPCMFrameCount));
            }
        }
        return static_cast <size_t>(frames * channels);
    }

    channels_t decoder_drflac::get_channels() const {
        if (!is_open()) {
            return 0;
        }
        return static_cast <channels_t>(m_pimpl->m_handle->channels);
    }

    sample_rate_t decoder_drflac::get_rate() const {
        if (!is_open()) {
            return 0;
        }
        return m_pimpl->m_handle->sampleRate;
    }

    std::optional<frame_index_t> decoder_drflac::total_frames() const {
        if (!is_open() || m_pimpl->m_handle->totalPCMFrameCount == 0) {
            return std::nullopt;
        }
        return m_pimpl->m_handle->totalPCMFrameCount;
    }

    bool decoder_drflac::seek_to_frame(frame_index_t frame) {
        if (!is_open() || !drflac_seek_to_pcm_frame(m_pimpl->m_handle.get(), frame)) {
            LOG_DEBUG("decoder_drflac", "seek to frame", frame, "failed");
            return false;
        }
        m_pimpl->m_eof = false;
        return true;
    }
}
