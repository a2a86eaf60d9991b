#pragma once

#include <audiopipe/effects/effect_stage.hh>

#include <vector>

namespace audiopipe {

    /// ISO octave band centres used when no other layout is configured
    AUDIOPIPE_EXPORT const std::vector<float>& default_band_centres();

    /**
     * @class equalizer_stage
     * @brief Bank of peaking biquads, one per band, with per-channel state
     * @ingroup effects
     *
     * Coefficients follow the RBJ audio EQ cookbook peaking filter. Filters
     * run in double precision in transposed direct form II. When a band gain
     * changes the coefficients are recomputed before the block is processed,
     * the filter memory is kept. Bands whose centre lies at or above Nyquist
     * are left as identity.
     *
     * A band at 0 dB is an exact identity, so a flat equalizer leaves the
     * signal bit-for-bit unchanged.
     */
    class AUDIOPIPE_EXPORT equalizer_stage : public effect_stage {
        public:
            /**
             * @param rate Pipeline sample rate
             * @param channels Pipeline channel count
             * @param centres_hz Band centre frequencies, in band order
             * @param q Quality factor shared by all bands
             */
            equalizer_stage(sample_rate_t rate, channels_t channels,
                            std::vector<float> centres_hz = default_band_centres(),
                            double q = 1.41);

            [[nodiscard]] const char* get_name() const override { return "equalizer"; }
            void process(pcm_block& block, const effect_params& params) override;
            void reset() override;

            [[nodiscard]] std::size_t bands() const noexcept { return m_centres.size(); }
            [[nodiscard]] const std::vector<float>& centres() const noexcept { return m_centres; }

            /// Gains the current coefficients were computed for
            [[nodiscard]] const std::vector<float>& applied_gains() const noexcept { return m_gains; }

        private:
            struct coefficients {
                double b0 = 1.0, b1 = 0.0, b2 = 0.0, a1 = 0.0, a2 = 0.0;
            };

            struct state {
                double s1 = 0.0, s2 = 0.0;
            };

            void update_coefficients(const std::vector<float>& gains_db);
            [[nodiscard]] coefficients peaking(double centre, double gain_db) const;

            sample_rate_t m_rate;
            channels_t m_channels;
            std::vector<float> m_centres;
            double m_q;
            std::vector<float> m_gains;
            std::vector<coefficients> m_coeffs;
            std::vector<state> m_state;     ///< band-major, channel-minor
    };

} // namespace audiopipe
