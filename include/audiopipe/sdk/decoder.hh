/**
 * @file decoder.hh
 * @brief Base class for audio format decoders
 * @ingroup decoder_interface
 */

// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <audiopipe/sdk/io_stream.hh>
#include <audiopipe/sdk/export_audiopipe_sdk.h>
#include <audiopipe/sdk/types.hh>
#include <chrono>
#include <memory>
#include <optional>

namespace audiopipe {
    /**
     * @class decoder
     * @brief Capability interface every codec implements
     * @ingroup decoder_interface
     *
     * A decoder turns the bytes of an io_stream into interleaved float
     * frames at the source's native rate and channel count. The concrete
     * variant is chosen when a track is opened, by probing the registered
     * codecs (see decoders_registry).
     *
     * ## Implementing a Decoder
     *
     * @code
     * class my_decoder : public decoder {
     * public:
     *     const char* get_name() const override { return "My Format"; }
     *
     *     void open(io_stream* stream) override {
     *         m_stream = stream;
     *         if (!parse_header()) {
     *             throw decoder_error("my_decoder: bad header");
     *         }
     *         set_is_open(true);
     *     }
     *
     *     channels_t get_channels() const override { return m_channels; }
     *     sample_rate_t get_rate() const override { return m_rate; }
     *     std::optional<frame_index_t> total_frames() const override { return m_frames; }
     *     bool seek_to_frame(frame_index_t frame) override { ... }
     *
     * protected:
     *     size_t do_decode(float* buf, size_t len) override {
     *         // Fill up to len samples, return 0 at the end of the stream,
     *         // throw decoder_error when the data cannot be read.
     *     }
     * };
     * @endcode
     *
     * ## Error Contract
     *
     * - open() throws decoder_error for unsupported or malformed input.
     * - do_decode() returns 0 only at the real end of the stream. A read
     *   failure before the declared end throws decoder_error, it is never
     *   reported as a short stream.
     *
     * @see io_stream, decoders_registry, decoder_adapter
     */
    class AUDIOPIPE_SDK_EXPORT decoder {
        public:
            decoder();
            virtual ~decoder();

            decoder(const decoder&) = delete;
            decoder& operator=(const decoder&) = delete;

            /**
             * @brief Check if decoder is open and ready
             */
            [[nodiscard]] bool is_open() const;

            /**
             * @brief Decode interleaved float samples for a given channel layout
             *
             * Converts mono sources to stereo output and stereo sources to
             * mono output. Any other mismatch between the source layout and
             * @p out_channels is a format_error.
             *
             * @param[out] buf Buffer to fill
             * @param len Capacity of @p buf in samples (frames * out_channels)
             * @param out_channels Channel count the caller expects
             * @return Samples written, always a multiple of @p out_channels;
             *         0 at the end of the stream
             * @throws decoder_error on read failure
             * @throws format_error on unsupported channel conversion
             */
            [[nodiscard]] size_t decode(float buf[], size_t len, channels_t out_channels);

            /**
             * @brief Human-readable name of this decoder (e.g. "WAV (dr_wav)")
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Parse the header and prepare for decoding
             * @param stream Source data; the decoder does not take ownership
             * @throws decoder_error if the format is invalid or unsupported
             */
            virtual void open(io_stream* stream) = 0;

            /**
             * @pre Decoder must be open
             */
            [[nodiscard]] virtual channels_t get_channels() const = 0;

            /**
             * @pre Decoder must be open
             */
            [[nodiscard]] virtual sample_rate_t get_rate() const = 0;

            /**
             * @brief Length of the stream in native frames, if known
             */
            [[nodiscard]] virtual std::optional<frame_index_t> total_frames() const = 0;

            /**
             * @brief Reposition to a native frame
             * @return true on success, false if the position is not reachable
             */
            virtual bool seek_to_frame(frame_index_t frame) = 0;

            /**
             * @brief Return to the first frame
             */
            bool rewind();

            /**
             * @brief Duration derived from total_frames(), zero when unknown
             */
            [[nodiscard]] std::chrono::microseconds duration() const;

        protected:
            /**
             * @brief Mark the decoder open; call at the end of a successful open()
             */
            void set_is_open(bool f);

            /**
             * @brief Decode up to @p len native-layout samples into @p buf
             * @return Samples written (multiple of get_channels()), 0 at end
             * @throws decoder_error on read failure
             */
            virtual size_t do_decode(float* buf, size_t len) = 0;

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
