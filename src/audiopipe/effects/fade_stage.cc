#include <audiopipe/effects/fade_stage.hh>

#include <algorithm>

namespace audiopipe {

    void fade_stage::arm(const fade_command& cmd) noexcept {
        m_serial = cmd.serial;
        m_direction = cmd.direction;
        m_curve = cmd.curve;
        m_duration = cmd.duration_frames;
        m_start = cmd.progress;
        m_counter = 0;
    }

    void fade_stage::reset() {
        m_direction = fade_direction::none;
        m_counter = 0;
        m_start = 0.0f;
        m_duration = 0;
    }

    float fade_stage::phase_at(frame_index_t k) const noexcept {
        if (m_duration == 0) {
            return 1.0f;
        }
        const double p = static_cast<double>(m_start) + static_cast<double>(k) / static_cast<double>(m_duration);
        return p >= 1.0 ? 1.0f : static_cast<float>(p);
    }

    float fade_stage::gain_for_phase(float phase) const noexcept {
        switch (m_direction) {
            case fade_direction::in:
                if (phase >= 1.0f) {
                    return 1.0f;
                }
                return m_curve == fade_curve::cubic ? phase * phase * phase : phase;
            case fade_direction::out: {
                if (phase >= 1.0f) {
                    return 0.0f;
                }
                const float inv = 1.0f - phase;
                return m_curve == fade_curve::cubic ? inv * inv * inv : inv;
            }
            case fade_direction::none:
                break;
        }
        return 1.0f;
    }

    float fade_stage::progress() const noexcept {
        if (m_direction == fade_direction::none) {
            return 1.0f;
        }
        return phase_at(m_counter);
    }

    float fade_stage::multiplier() const noexcept {
        return gain_for_phase(progress());
    }

    bool fade_stage::is_active() const noexcept {
        return m_direction != fade_direction::none && phase_at(m_counter) < 1.0f;
    }

    void fade_stage::process(pcm_block& block, const effect_params& params) {
        if (params.fade.serial != m_serial) {
            arm(params.fade);
        }
        if (m_direction == fade_direction::none) {
            return;
        }

        const std::size_t frames = block.frames();
        const channels_t ch = block.channels();
        float* data = block.data();

        if (phase_at(m_counter) >= 1.0f) {
            if (m_direction == fade_direction::out) {
                std::fill_n(data, frames * ch, 0.0f);
            }
            return;
        }

        for (std::size_t f = 0; f < frames; f++) {
            const float g = gain_for_phase(phase_at(m_counter + f));
            for (channels_t c = 0; c < ch; c++) {
                data[f * ch + c] *= g;
            }
        }
        // Past the end the counter no longer matters
        m_counter = std::min<frame_index_t>(m_counter + frames, m_duration);
    }

} // namespace audiopipe
