// This is copyrighted software. More information is at the end of this file.

#pragma once

#include <audiopipe/sdk/decoder.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/codecs/export_audiopipe_codecs.h>
namespace audiopipe {
    /*!
     * \brief dr_mp3 decoder for MP3 streams.
     */
    class AUDIOPIPE_CODECS_EXPORT decoder_drmp3 : public decoder {
        public:
            decoder_drmp3();
            ~decoder_drmp3() override;

            /*!
             * \brief Probe whether \p stream holds MP3 data; the position is restored.
             */
            static bool accept(io_stream* stream);

            [[nodiscard]] const char* get_name() const override;
            void open(io_stream* stream) override;
            [[nodiscard]] channels_t get_channels() const override;
            [[nodiscard]] sample_rate_t get_rate() const override;
            [[nodiscard]] std::optional<frame_index_t> total_frames() const override;
            bool seek_to_frame(frame_index_t frame) override;

        protected:
            size_t do_decode(float* buf, size_t len) override;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
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
