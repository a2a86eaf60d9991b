#ifndef AUDIOPIPE_MOCK_COMPONENTS_HH
#define AUDIOPIPE_MOCK_COMPONENTS_HH

#include <audiopipe/sdk/decoder.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/sdk/io_stream.hh>
#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/error.hh>
#include <cstring>
#include <vector>
#include <cmath>
#include <atomic>
#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>
#include <thread>

namespace audiopipe::test {

// io_stream over an owned byte vector
class memory_io_stream : public audiopipe::io_stream {
public:
    explicit memory_io_stream(std::vector<uint8_t> data)
        : m_data(std::move(data)), m_position(0), m_is_open(true) {}

    memory_io_stream() : m_position(0), m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open) return 0;
        if (m_fail_reads_after && m_position >= *m_fail_reads_after) return 0;

        size_t available = m_data.size() - m_position;
        size_t to_read = std::min(available, size_bytes);
        if (to_read > 0) {
            std::memcpy(ptr, m_data.data() + m_position, to_read);
            m_position += to_read;
        }
        return to_read;
    }

    int64_t seek(int64_t offset, audiopipe::seek_origin whence) override {
        if (!m_is_open) return -1;

        int64_t new_pos = static_cast<int64_t>(m_position);
        switch (whence) {
            case audiopipe::seek_origin::set:
                new_pos = offset;
                break;
            case audiopipe::seek_origin::cur:
                new_pos = static_cast<int64_t>(m_position) + offset;
                break;
            case audiopipe::seek_origin::end:
                new_pos = static_cast<int64_t>(m_data.size()) + offset;
                break;
        }
        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_data.size())) {
            return -1;
        }
        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_data.size()) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

    // Simulates a device that stops delivering bytes at @p offset
    void fail_reads_after(size_t offset) { m_fail_reads_after = offset; }

private:
    std::vector<uint8_t> m_data;
    size_t m_position;
    bool m_is_open;
    std::optional<size_t> m_fail_reads_after;
};

// Ramp samples encode their own frame index exactly: frame / 2^20
inline float ramp_value(frame_index_t frame) {
    return static_cast<float>(frame) / 1048576.0f;
}

inline frame_index_t ramp_frame(float value) {
    return static_cast<frame_index_t>(std::llround(static_cast<double>(value) * 1048576.0));
}

// Decoder producing a synthetic signal
class test_decoder : public decoder {
public:
    enum class pattern {
        silence,
        constant,
        ramp,
        sine_440hz
    };

    explicit test_decoder(frame_index_t total_frames = 44100, pattern p = pattern::silence,
                          channels_t channels = 2, sample_rate_t rate = 44100)
        : m_total_frames(total_frames),
          m_pattern(p),
          m_channels(channels),
          m_sample_rate(rate) {}

    void open(audiopipe::io_stream* /*stream*/) override {
        if (m_fail_open) {
            throw decoder_error("test decoder: refusing to open");
        }
        set_is_open(true);
    }

    channels_t get_channels() const override { return m_channels; }
    sample_rate_t get_rate() const override { return m_sample_rate; }

    std::optional<frame_index_t> total_frames() const override {
        if (m_unknown_length) {
            return std::nullopt;
        }
        return m_total_frames;
    }

    bool seek_to_frame(frame_index_t frame) override {
        if (!m_seekable || frame >= m_total_frames) {
            return false;
        }
        m_current_frame = frame;
        m_seek_count++;
        return true;
    }

    const char* get_name() const override {
        return "Test Decoder";
    }

    // Test controls
    void set_constant(float v) { m_constant = v; }
    void set_seekable(bool f) { m_seekable = f; }
    void set_unknown_length(bool f) { m_unknown_length = f; }
    void set_fail_open(bool f) { m_fail_open = f; }
    void fail_at_frame(frame_index_t frame) { m_fail_at = frame; }
    void set_decode_delay(std::chrono::milliseconds d) { m_delay = d; }

    frame_index_t current_frame() const { return m_current_frame; }
    size_t read_count() const { return m_read_count; }
    size_t seek_count() const { return m_seek_count; }

protected:
    size_t do_decode(float* buf, size_t len) override {
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }
        const frame_index_t frames_requested = len / m_channels;
        frame_index_t frames_to_read = std::min(frames_requested, m_total_frames - m_current_frame);
        if (m_fail_at && m_current_frame + frames_to_read > *m_fail_at) {
            if (m_current_frame >= *m_fail_at) {
                throw decoder_error("test decoder: read failed at frame " + std::to_string(m_current_frame));
            }
            frames_to_read = *m_fail_at - m_current_frame;
        }

        for (frame_index_t i = 0; i < frames_to_read; ++i) {
            const frame_index_t frame = m_current_frame + i;
            float sample = 0.0f;
            switch (m_pattern) {
                case pattern::silence:
                    break;
                case pattern::constant:
                    sample = m_constant;
                    break;
                case pattern::ramp:
                    sample = ramp_value(frame);
                    break;
                case pattern::sine_440hz:
                    sample = static_cast<float>(std::sin(2.0 * M_PI * 440.0 * static_cast<double>(frame) /
                                                         static_cast<double>(m_sample_rate)) * 0.5);
                    break;
            }
            for (channels_t ch = 0; ch < m_channels; ++ch) {
                buf[i * m_channels + ch] = sample;
            }
        }

        m_current_frame += frames_to_read;
        m_read_count++;
        return static_cast<size_t>(frames_to_read * m_channels);
    }

private:
    frame_index_t m_total_frames;
    pattern m_pattern;
    channels_t m_channels;
    sample_rate_t m_sample_rate;
    frame_index_t m_current_frame = 0;
    float m_constant = 0.5f;
    bool m_seekable = true;
    bool m_unknown_length = false;
    bool m_fail_open = false;
    std::optional<frame_index_t> m_fail_at;
    std::chrono::milliseconds m_delay{0};
    size_t m_read_count = 0;
    size_t m_seek_count = 0;
};

inline std::unique_ptr<track> make_test_track(const std::string& id, std::unique_ptr<test_decoder> dec) {
    return std::make_unique<track>(id, std::make_unique<memory_io_stream>(), std::move(dec));
}

inline std::unique_ptr<track> make_test_track(const std::string& id, frame_index_t frames,
                                              test_decoder::pattern p = test_decoder::pattern::ramp,
                                              channels_t channels = 2, sample_rate_t rate = 44100) {
    return make_test_track(id, std::make_unique<test_decoder>(frames, p, channels, rate));
}

// Canonical 16-bit PCM WAV file in memory
inline std::vector<uint8_t> make_wav_pcm16(frame_index_t frames, channels_t channels, sample_rate_t rate,
                                           const std::function<int16_t(frame_index_t, channels_t)>& sample) {
    std::vector<uint8_t> out;
    auto put32 = [&out](uint32_t v) {
        for (int i = 0; i < 4; i++) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    };
    auto put16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    };
    auto tag = [&out](const char* t) { out.insert(out.end(), t, t + 4); };

    const auto data_bytes = static_cast<uint32_t>(frames * channels * 2);
    tag("RIFF");
    put32(36 + data_bytes);
    tag("WAVE");
    tag("fmt ");
    put32(16);
    put16(1);
    put16(channels);
    put32(rate);
    put32(rate * channels * 2);
    put16(static_cast<uint16_t>(channels * 2));
    put16(16);
    tag("data");
    put32(data_bytes);
    for (frame_index_t f = 0; f < frames; f++) {
        for (channels_t c = 0; c < channels; c++) {
            put16(static_cast<uint16_t>(sample(f, c)));
        }
    }
    return out;
}

} // namespace audiopipe::test

#endif // AUDIOPIPE_MOCK_COMPONENTS_HH
