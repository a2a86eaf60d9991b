/**
 * @file decoder_adapter.hh
 * @brief Opened tracks and their conversion to the pipeline format
 */

#ifndef AUDIOPIPE_DECODER_ADAPTER_HH
#define AUDIOPIPE_DECODER_ADAPTER_HH

#include <audiopipe/pcm_block.hh>
#include <audiopipe/sdk/decoder.hh>
#include <audiopipe/sdk/decoders_registry.hh>
#include <audiopipe/sdk/io_stream.hh>
#include <audiopipe/export_audiopipe.h>

#include <memory>
#include <optional>
#include <string>

namespace audiopipe {

    /**
     * @class track
     * @brief An opened audio source: stream, decoder and native format
     *
     * The format is fixed once the constructor returns. The track owns the
     * stream; the decoder only borrows it.
     */
    class AUDIOPIPE_EXPORT track {
        public:
            /**
             * @brief Open @p stream with the first codec of @p registry that accepts it
             * @throws decoder_error if no codec accepts the stream or opening fails
             */
            track(std::string id, std::unique_ptr<io_stream> stream, const decoders_registry& registry);

            /**
             * @brief Open @p stream with an explicitly chosen decoder
             * @throws decoder_error if opening fails
             */
            track(std::string id, std::unique_ptr<io_stream> stream, std::unique_ptr<decoder> dec);

            ~track();

            track(const track&) = delete;
            track& operator=(const track&) = delete;

            [[nodiscard]] const std::string& id() const noexcept { return m_id; }
            [[nodiscard]] sample_rate_t rate() const noexcept { return m_rate; }
            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }

            /// Length in native frames; empty when the codec cannot tell
            [[nodiscard]] std::optional<frame_index_t> total_frames() const noexcept { return m_total_frames; }

            [[nodiscard]] const char* codec_name() const;

            [[nodiscard]] const std::shared_ptr<decoder>& get_decoder() const noexcept { return m_decoder; }

        private:
            void open();

            std::string m_id;
            std::unique_ptr<io_stream> m_stream;
            std::shared_ptr<decoder> m_decoder;
            sample_rate_t m_rate = 0;
            channels_t m_channels = 0;
            std::optional<frame_index_t> m_total_frames;
    };

    enum class block_status {
        ok,
        end_of_stream
    };

    /**
     * @class decoder_adapter
     * @brief Pulls fixed-size blocks at the pipeline rate from a track
     *
     * Channel mapping is done by decoder::decode(), rate conversion by a
     * speex resampler, so every block leaves here in the pipeline format.
     * All positions are frames at the pipeline rate.
     *
     * @code
     * decoder_adapter adapter(std::move(trk), 44100, 2, 1024);
     * pcm_block block(1024, 2, 44100);
     * while (adapter.next_block(block) == block_status::ok) {
     *     consume(block);
     * }
     * @endcode
     */
    class AUDIOPIPE_EXPORT decoder_adapter {
        public:
            /**
             * @throws decoder_error if the resampler rejects the track format
             */
            decoder_adapter(std::unique_ptr<track> trk, sample_rate_t out_rate, channels_t out_channels,
                            std::size_t block_frames, int resampler_quality = 5);
            ~decoder_adapter();

            decoder_adapter(const decoder_adapter&) = delete;
            decoder_adapter& operator=(const decoder_adapter&) = delete;

            /**
             * @brief Fill @p block with the next block_frames() frames
             *
             * Every block is full except the last one of the stream. The
             * block's source position is set to the frame index of its first
             * frame.
             *
             * @return end_of_stream once nothing is left (block is empty)
             * @throws decoder_error on a read failure; the track cannot continue
             */
            block_status next_block(pcm_block& block);

            /**
             * @brief Reposition to @p frame and drop buffered resampler state
             * @return Frame actually reached, clamped to the track length
             * @throws decoder_error if the codec cannot seek
             */
            frame_index_t seek(frame_index_t frame);

            /// Index of the frame the next block starts with
            [[nodiscard]] frame_index_t position() const noexcept;

            /// Track length at the pipeline rate, when known
            [[nodiscard]] std::optional<frame_index_t> total_frames() const;

            [[nodiscard]] std::size_t block_frames() const noexcept;
            [[nodiscard]] sample_rate_t rate() const noexcept;
            [[nodiscard]] channels_t channels() const noexcept;
            [[nodiscard]] const track& get_track() const noexcept;

        private:
            struct impl;
            const std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_DECODER_ADAPTER_HH
