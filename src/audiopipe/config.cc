#include <audiopipe/config.hh>
#include <audiopipe/effects/equalizer_stage.hh>
#include <audiopipe/effects/time_stretch_stage.hh>
#include <audiopipe/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace audiopipe {

    namespace {
        constexpr sample_rate_t k_min_rate = 8000;
        constexpr sample_rate_t k_max_rate = 192000;
        constexpr std::size_t k_max_block_frames = 16384;
        constexpr std::size_t k_max_channels = 8;

        const char* env(const char* name) {
            const char* v = std::getenv(name);
            return (v && *v) ? v : nullptr;
        }

        long long parse_integer(const char* name, const char* value, long long lo, long long hi) {
            std::size_t used = 0;
            long long result = 0;
            try {
                result = std::stoll(value, &used);
            } catch (const std::logic_error&) {
                throw config_error(std::string(name) + ": not a number: " + value);
            }
            if (value[used] != '\0') {
                throw config_error(std::string(name) + ": trailing characters in " + value);
            }
            if (result < lo || result > hi) {
                throw config_error(std::string(name) + ": " + value + " out of range [" +
                                   std::to_string(lo) + ", " + std::to_string(hi) + "]");
            }
            return result;
        }

        frame_index_t ms_to_frames(std::chrono::milliseconds ms, sample_rate_t rate) {
            return static_cast<frame_index_t>(ms.count()) * rate / 1000;
        }
    }

    track_end_policy track_end_policy_from_string(const std::string& name) {
        if (name == "stop") {
            return track_end_policy::stop;
        }
        if (name == "repeat") {
            return track_end_policy::repeat;
        }
        if (name == "advance") {
            return track_end_policy::advance;
        }
        throw config_error("unknown track end policy: " + name);
    }

    void pipeline_config::validate() const {
        if (sample_rate < k_min_rate || sample_rate > k_max_rate) {
            throw config_error("sample rate " + std::to_string(sample_rate) + " Hz is not supported");
        }
        if (channels == 0 || channels > k_max_channels) {
            throw config_error("channel count " + std::to_string(channels) + " is not supported");
        }
        if (block_frames == 0 || block_frames > k_max_block_frames) {
            throw config_error("block size of " + std::to_string(block_frames) + " frames is not supported");
        }
        if (ring_latency.count() <= 0) {
            throw config_error("ring buffer latency must be positive");
        }
        if (write_timeout.count() <= 0) {
            throw config_error("write timeout must be positive");
        }
        if (visualization_blocks == 0) {
            throw config_error("visualization needs at least one block");
        }
        if (!(eq_q > 0.0)) {
            throw config_error("equalizer Q must be positive");
        }
        for (auto c : band_centres_hz) {
            if (!(c > 0.0f)) {
                throw config_error("equalizer band centres must be positive");
            }
        }
        if (resampler_quality < 0 || resampler_quality > 10) {
            throw config_error("resampler quality must be within [0, 10]");
        }
        if (device_format == audio_format::unknown) {
            throw config_error("unknown device sample format");
        }
        if (fade_duration.count() < 0 || skip_step.count() <= 0) {
            throw config_error("fade duration must be >= 0 and skip step > 0");
        }
    }

    std::size_t pipeline_config::ring_capacity_frames() const {
        const auto frames = static_cast<std::size_t>(ms_to_frames(ring_latency, sample_rate));
        // A stretched block can be four times the input block
        return std::max(frames, 2 * time_stretch_stage::max_output_frames(block_frames));
    }

    frame_index_t pipeline_config::fade_frames() const {
        return ms_to_frames(fade_duration, sample_rate);
    }

    frame_index_t pipeline_config::skip_frames() const {
        return ms_to_frames(skip_step, sample_rate);
    }

    std::vector<float> pipeline_config::effective_band_centres() const {
        return band_centres_hz.empty() ? default_band_centres() : band_centres_hz;
    }

    audio_spec pipeline_config::device_spec() const {
        return {device_format, channels, sample_rate};
    }

    pipeline_config config_from_environment(pipeline_config base) {
        if (auto v = env("AUDIOPIPE_SAMPLE_RATE")) {
            base.sample_rate = static_cast<sample_rate_t>(parse_integer("AUDIOPIPE_SAMPLE_RATE", v, k_min_rate, k_max_rate));
        }
        if (auto v = env("AUDIOPIPE_CHANNELS")) {
            base.channels = static_cast<channels_t>(parse_integer("AUDIOPIPE_CHANNELS", v, 1, k_max_channels));
        }
        if (auto v = env("AUDIOPIPE_BLOCK_FRAMES")) {
            base.block_frames = static_cast<std::size_t>(parse_integer("AUDIOPIPE_BLOCK_FRAMES", v, 1, k_max_block_frames));
        }
        if (auto v = env("AUDIOPIPE_LATENCY_MS")) {
            base.ring_latency = std::chrono::milliseconds(parse_integer("AUDIOPIPE_LATENCY_MS", v, 1, 10000));
        }
        if (auto v = env("AUDIOPIPE_WRITE_TIMEOUT_MS")) {
            base.write_timeout = std::chrono::milliseconds(parse_integer("AUDIOPIPE_WRITE_TIMEOUT_MS", v, 1, 10000));
        }
        if (auto v = env("AUDIOPIPE_VIS_BLOCKS")) {
            base.visualization_blocks = static_cast<std::size_t>(parse_integer("AUDIOPIPE_VIS_BLOCKS", v, 1, 1024));
        }
        if (auto v = env("AUDIOPIPE_RESAMPLER_QUALITY")) {
            base.resampler_quality = static_cast<int>(parse_integer("AUDIOPIPE_RESAMPLER_QUALITY", v, 0, 10));
        }
        if (auto v = env("AUDIOPIPE_DEVICE")) {
            base.device_id = v;
        }
        if (auto v = env("AUDIOPIPE_DEVICE_FORMAT")) {
            const auto fmt = audio_format_from_string(v);
            if (fmt == audio_format::unknown) {
                throw config_error(std::string("AUDIOPIPE_DEVICE_FORMAT: unknown format ") + v);
            }
            base.device_format = fmt;
        }
        if (auto v = env("AUDIOPIPE_FADE_MS")) {
            base.fade_duration = std::chrono::milliseconds(parse_integer("AUDIOPIPE_FADE_MS", v, 0, 60000));
        }
        if (auto v = env("AUDIOPIPE_SKIP_MS")) {
            base.skip_step = std::chrono::milliseconds(parse_integer("AUDIOPIPE_SKIP_MS", v, 1, 600000));
        }
        if (auto v = env("AUDIOPIPE_END_POLICY")) {
            base.end_policy = track_end_policy_from_string(v);
        }
        LOG_DEBUG("config", base.sample_rate, "Hz", static_cast<int>(base.channels), "ch, block",
                  base.block_frames, "frames, latency", base.ring_latency.count(), "ms");
        return base;
    }

} // namespace audiopipe
