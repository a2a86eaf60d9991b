#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/error.hh>
#include "resampler/resampler_speex.hh"

#include <failsafe/failsafe.hh>

#include <algorithm>

namespace audiopipe {

    namespace {
        frame_index_t rescale(frame_index_t frames, sample_rate_t from, sample_rate_t to) {
            if (from == to || from == 0) {
                return frames;
            }
            return (frames * to + from / 2) / from;
        }
    }

    track::track(std::string id, std::unique_ptr<io_stream> stream, const decoders_registry& registry)
        : m_id(std::move(id)),
          m_stream(std::move(stream)) {
        if (!m_stream || !m_stream->is_open()) {
            throw io_error("track " + m_id + ": source is not open");
        }
        auto dec = registry.find_decoder(m_stream.get());
        if (!dec) {
            throw decoder_error("track " + m_id + ": no codec accepts this source");
        }
        m_decoder = std::move(dec);
        open();
    }

    track::track(std::string id, std::unique_ptr<io_stream> stream, std::unique_ptr<decoder> dec)
        : m_id(std::move(id)),
          m_stream(std::move(stream)),
          m_decoder(std::move(dec)) {
        if (!m_stream || !m_stream->is_open()) {
            throw io_error("track " + m_id + ": source is not open");
        }
        if (!m_decoder) {
            throw decoder_error("track " + m_id + ": no decoder");
        }
        open();
    }

    track::~track() = default;

    void track::open() {
        try {
            m_decoder->open(m_stream.get());
        } catch (const audiopipe_error&) {
            throw;
        } catch (const std::exception& e) {
            throw decoder_error("track " + m_id + ": " + e.what());
        }
        if (!m_decoder->is_open()) {
            throw decoder_error("track " + m_id + ": codec " + m_decoder->get_name() + " failed to open");
        }
        m_rate = m_decoder->get_rate();
        m_channels = m_decoder->get_channels();
        m_total_frames = m_decoder->total_frames();
        if (m_rate == 0 || m_channels == 0) {
            throw decoder_error("track " + m_id + ": codec reported an empty format");
        }
        LOG_INFO("decoder_adapter", "opened", m_id, "with", m_decoder->get_name(),
                 m_rate, "Hz", static_cast<int>(m_channels), "ch");
    }

    const char* track::codec_name() const {
        return m_decoder->get_name();
    }

    struct decoder_adapter::impl {
        std::unique_ptr<track> m_track;
        resampler_speex m_resampler;
        sample_rate_t m_rate;
        channels_t m_channels;
        std::size_t m_block_frames;
        frame_index_t m_position = 0;
        bool m_at_end = false;

        impl(std::unique_ptr<track> trk, sample_rate_t rate, channels_t channels,
             std::size_t block_frames, int quality)
            : m_track(std::move(trk)),
              m_resampler(quality),
              m_rate(rate),
              m_channels(channels),
              m_block_frames(block_frames) {
        }
    };

    decoder_adapter::decoder_adapter(std::unique_ptr<track> trk, sample_rate_t out_rate, channels_t out_channels,
                                     std::size_t block_frames, int resampler_quality)
        : m_pimpl(std::make_unique<impl>(std::move(trk), out_rate, out_channels, block_frames, resampler_quality)) {
        if (!m_pimpl->m_track) {
            throw decoder_error("decoder adapter: no track");
        }
        try {
            m_pimpl->m_resampler.set_decoder(m_pimpl->m_track->get_decoder());
            m_pimpl->m_resampler.set_spec(out_rate, out_channels, block_frames);
        } catch (const std::runtime_error& e) {
            throw decoder_error(m_pimpl->m_track->id() + ": " + e.what());
        }
        if (m_pimpl->m_track->rate() != out_rate) {
            LOG_DEBUG("decoder_adapter", "resampling", m_pimpl->m_track->id(), "from",
                      m_pimpl->m_track->rate(), "Hz to", out_rate, "Hz");
        }
    }

    decoder_adapter::~decoder_adapter() = default;

    block_status decoder_adapter::next_block(pcm_block& block) {
        const std::size_t want = std::min(m_pimpl->m_block_frames, block.capacity()) * m_pimpl->m_channels;
        float* out = block.data();
        std::size_t got = 0;

        while (!m_pimpl->m_at_end && got < want) {
            const auto n = m_pimpl->m_resampler.resample(out + got, want - got);
            if (n == 0) {
                break;
            }
            got += n;
        }

        const std::size_t frames = got / m_pimpl->m_channels;
        block.set_source_position(m_pimpl->m_position);
        block.set_frames(frames);
        block.set_source_frames(frames);
        if (frames == 0) {
            return block_status::end_of_stream;
        }
        m_pimpl->m_position += frames;
        return block_status::ok;
    }

    frame_index_t decoder_adapter::seek(frame_index_t frame) {
        const auto src_rate = m_pimpl->m_track->rate();
        frame_index_t native = rescale(frame, m_pimpl->m_rate, src_rate);
        const auto total = m_pimpl->m_track->total_frames();

        if (total && native >= *total) {
            // Codecs refuse to seek onto the end itself; the stream simply has nothing left
            native = *total;
            m_pimpl->m_at_end = true;
        } else {
            if (!m_pimpl->m_track->get_decoder()->seek_to_frame(native)) {
                throw decoder_error(m_pimpl->m_track->id() + ": cannot seek to frame " + std::to_string(native));
            }
            m_pimpl->m_at_end = false;
        }
        m_pimpl->m_resampler.discard_pending_samples();
        m_pimpl->m_position = rescale(native, src_rate, m_pimpl->m_rate);
        LOG_DEBUG("decoder_adapter", "seek", m_pimpl->m_track->id(), "to", m_pimpl->m_position);
        return m_pimpl->m_position;
    }

    frame_index_t decoder_adapter::position() const noexcept {
        return m_pimpl->m_position;
    }

    std::optional<frame_index_t> decoder_adapter::total_frames() const {
        const auto total = m_pimpl->m_track->total_frames();
        if (!total) {
            return std::nullopt;
        }
        return rescale(*total, m_pimpl->m_track->rate(), m_pimpl->m_rate);
    }

    std::size_t decoder_adapter::block_frames() const noexcept {
        return m_pimpl->m_block_frames;
    }

    sample_rate_t decoder_adapter::rate() const noexcept {
        return m_pimpl->m_rate;
    }

    channels_t decoder_adapter::channels() const noexcept {
        return m_pimpl->m_channels;
    }

    const track& decoder_adapter::get_track() const noexcept {
        return *m_pimpl->m_track;
    }

} // namespace audiopipe
