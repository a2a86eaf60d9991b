/**
 * @file example_common.hh
 * @brief Common utilities for audiopipe examples
 */

#ifndef AUDIOPIPE_EXAMPLE_COMMON_HH
#define AUDIOPIPE_EXAMPLE_COMMON_HH

#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/error.hh>
#include <audiopipe/sdk/audio_backend.hh>
#include <audiopipe/sdk/decoders_registry.hh>
#include <audiopipe/sdk/io_stream.hh>
#include <audiopipe_backends/sdl3/sdl3_backend.hh>

#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace audiopipe::examples {
    inline std::shared_ptr<audio_backend> create_default_backend() {
        return std::shared_ptr<audio_backend>(create_sdl3_backend());
    }

    /**
     * @brief Open a file as a track, probing the registered codecs
     * @throws io_error if the file cannot be opened
     * @throws decoder_error if no codec understands it
     */
    inline std::unique_ptr<track> open_track(const std::string& path, const decoders_registry& registry) {
        auto io = io_from_file(path);
        if (!io) {
            throw io_error("cannot open " + path);
        }
        return std::make_unique<track>(path, std::move(io), registry);
    }

    inline std::string format_time(std::chrono::milliseconds t) {
        const auto total = t.count() / 1000;
        std::ostringstream os;
        os << total / 60 << ':' << std::setw(2) << std::setfill('0') << total % 60;
        return os.str();
    }
} // namespace audiopipe::examples

#endif // AUDIOPIPE_EXAMPLE_COMMON_HH
