#include <audiopipe/effects/time_stretch_stage.hh>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace audiopipe {

    time_stretch_stage::time_stretch_stage(channels_t channels, std::size_t max_input_frames)
        : m_channels(channels),
          m_max_input(max_input_frames),
          m_ext((max_input_frames + 1) * channels) {
    }

    std::size_t time_stretch_stage::max_output_frames(std::size_t input_frames) noexcept {
        return static_cast<std::size_t>(std::ceil(static_cast<double>(input_frames) / k_min_speed)) + 2;
    }

    void time_stretch_stage::reset() {
        m_ext.zero();
        m_position = 1.0;
    }

    void time_stretch_stage::process(pcm_block& block, const effect_params& params) {
        const std::size_t n = std::min(block.frames(), m_max_input);
        if (n == 0) {
            return;
        }
        const channels_t ch = m_channels;
        float* data = block.data();
        const double speed = params.speed;

        if (speed == 1.0 && m_position == 1.0) {
            // Keep the history current so a later speed change interpolates from real audio
            std::memcpy(m_ext.data(), data + (n - 1) * ch, ch * sizeof(float));
            block.set_frames(n);
            return;
        }

        std::memcpy(m_ext.data() + ch, data, n * ch * sizeof(float));

        const std::size_t capacity = block.capacity();
        std::size_t out = 0;
        double pos = m_position;
        while (out < capacity) {
            const auto i = static_cast<std::size_t>(pos);
            const double frac = pos - static_cast<double>(i);
            if (i > n || (i == n && frac > 0.0)) {
                break;
            }
            const float* a = m_ext.data() + i * ch;
            if (i == n) {
                std::memcpy(data + out * ch, a, ch * sizeof(float));
            } else {
                const float* b = a + ch;
                const auto t = static_cast<float>(frac);
                for (channels_t c = 0; c < ch; c++) {
                    data[out * ch + c] = a[c] + (b[c] - a[c]) * t;
                }
            }
            out++;
            pos += speed;
        }

        m_position = pos - static_cast<double>(n);
        std::memcpy(m_ext.data(), m_ext.data() + n * ch, ch * sizeof(float));
        block.set_frames(out);
    }

} // namespace audiopipe
