// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace audiopipe {

/**
 * @brief Base exception class for all audiopipe errors
 *
 * Flow-control conditions (a full ring buffer, an underrun) are never
 * exceptions. They are reported through status values and counters.
 */
class audiopipe_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Output device errors
 *
 * Thrown when:
 * - the device cannot be opened with the requested format
 * - the device reports itself lost while a track is playing
 * - the obtained sample format has no converter
 */
class device_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
};

/**
 * @brief Audio format errors
 *
 * Thrown when a sample format or channel layout cannot be handled.
 */
class format_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
};

/**
 * @brief Decoder errors
 *
 * Thrown when:
 * - no registered codec accepts the source
 * - the codec fails to parse the header
 * - reading stops before the declared end of the stream
 *
 * Mid-stream decoder errors are terminal for the track.
 */
class decoder_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
};

/**
 * @brief I/O stream errors
 */
class io_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
};

/**
 * @brief Invalid transport or pipeline command for the current state
 *
 * For example resuming a stopped transport or seeking a pipeline that has
 * not been quiesced.
 */
class state_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
};

/**
 * @brief Invalid pipeline configuration
 */
class config_error : public audiopipe_error {
public:
    using audiopipe_error::audiopipe_error;
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
