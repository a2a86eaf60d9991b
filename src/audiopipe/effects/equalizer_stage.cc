#include <audiopipe/effects/equalizer_stage.hh>
#include <audiopipe/error.hh>

#include <algorithm>
#include <cmath>

namespace audiopipe {

    namespace {
        constexpr double k_pi = 3.14159265358979323846;
    }

    const std::vector<float>& default_band_centres() {
        static const std::vector<float> centres = {
            31.25f, 62.5f, 125.0f, 250.0f, 500.0f,
            1000.0f, 2000.0f, 4000.0f, 8000.0f, 16000.0f
        };
        return centres;
    }

    equalizer_stage::equalizer_stage(sample_rate_t rate, channels_t channels,
                                     std::vector<float> centres_hz, double q)
        : m_rate(rate),
          m_channels(channels),
          m_centres(std::move(centres_hz)),
          m_q(q),
          m_gains(m_centres.size(), 0.0f),
          m_coeffs(m_centres.size()),
          m_state(m_centres.size() * channels) {
        if (rate == 0 || channels == 0) {
            throw config_error("equalizer needs a non-zero rate and channel count");
        }
        if (!(q > 0.0)) {
            throw config_error("equalizer Q must be positive");
        }
        for (auto c : m_centres) {
            if (!(c > 0.0f)) {
                throw config_error("equalizer band centres must be positive");
            }
        }
    }

    equalizer_stage::coefficients equalizer_stage::peaking(double centre, double gain_db) const {
        coefficients c;
        if (gain_db == 0.0 || centre >= m_rate / 2.0) {
            return c;
        }
        const double A = std::pow(10.0, gain_db / 40.0);
        const double w0 = 2.0 * k_pi * centre / m_rate;
        const double cosw0 = std::cos(w0);
        const double alpha = std::sin(w0) / (2.0 * m_q);

        const double b0 = 1.0 + alpha * A;
        const double b1 = -2.0 * cosw0;
        const double b2 = 1.0 - alpha * A;
        const double a0 = 1.0 + alpha / A;
        const double a1 = -2.0 * cosw0;
        const double a2 = 1.0 - alpha / A;

        c.b0 = b0 / a0;
        c.b1 = b1 / a0;
        c.b2 = b2 / a0;
        c.a1 = a1 / a0;
        c.a2 = a2 / a0;
        return c;
    }

    void equalizer_stage::update_coefficients(const std::vector<float>& gains_db) {
        for (std::size_t band = 0; band < m_centres.size(); band++) {
            const float g = band < gains_db.size() ? gains_db[band] : 0.0f;
            if (g != m_gains[band]) {
                m_gains[band] = g;
                m_coeffs[band] = peaking(m_centres[band], g);
            }
        }
    }

    void equalizer_stage::process(pcm_block& block, const effect_params& params) {
        update_coefficients(params.band_gains_db);

        const std::size_t frames = block.frames();
        const channels_t ch = std::min(block.channels(), m_channels);
        const channels_t stride = block.channels();
        float* data = block.data();

        for (std::size_t band = 0; band < m_centres.size(); band++) {
            const auto& c = m_coeffs[band];
            for (channels_t j = 0; j < ch; j++) {
                auto& s = m_state[band * m_channels + j];
                for (std::size_t f = 0; f < frames; f++) {
                    const double x = data[f * stride + j];
                    const double y = c.b0 * x + s.s1;
                    s.s1 = c.b1 * x - c.a1 * y + s.s2;
                    s.s2 = c.b2 * x - c.a2 * y;
                    data[f * stride + j] = static_cast<float>(y);
                }
            }
        }
    }

    void equalizer_stage::reset() {
        for (auto& s : m_state) {
            s = state{};
        }
    }

} // namespace audiopipe
