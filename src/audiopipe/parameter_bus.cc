#include <audiopipe/parameter_bus.hh>

#include <mutex>
#include <stdexcept>
#include <string>

namespace audiopipe {

    struct parameter_bus::impl {
        mutable std::mutex m_swap_mutex;
        std::mutex m_edit_mutex;
        snapshot_ptr m_current;
        uint64_t m_last_version = 0;
        uint32_t m_fade_serial = 0;

        uint64_t swap_in(effect_params params) {
            params = clamp_params(std::move(params));
            // m_last_version is only touched under the editor mutex
            params.version = ++m_last_version;
            auto fresh = std::make_shared<const effect_params>(std::move(params));
            std::lock_guard<std::mutex> lock(m_swap_mutex);
            m_current.swap(fresh);
            return m_current->version;
        }

        snapshot_ptr load() const {
            std::lock_guard<std::mutex> lock(m_swap_mutex);
            return m_current;
        }
    };

    parameter_bus::parameter_bus(effect_params initial)
        : m_pimpl(std::make_unique<impl>()) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_edit_mutex);
        m_pimpl->m_fade_serial = initial.fade.serial;
        m_pimpl->swap_in(std::move(initial));
    }

    parameter_bus::~parameter_bus() = default;

    parameter_bus::snapshot_ptr parameter_bus::current() const {
        return m_pimpl->load();
    }

    uint64_t parameter_bus::version() const {
        return m_pimpl->load()->version;
    }

    uint64_t parameter_bus::publish(effect_params params) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_edit_mutex);
        return m_pimpl->swap_in(std::move(params));
    }

    uint64_t parameter_bus::update(const editor_t& edit) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_edit_mutex);
        effect_params next = *m_pimpl->load();
        edit(next);
        return m_pimpl->swap_in(std::move(next));
    }

    uint64_t parameter_bus::set_volume(float volume) {
        return update([volume](effect_params& p) { p.volume = volume; });
    }

    uint64_t parameter_bus::set_muted(bool muted) {
        return update([muted](effect_params& p) { p.muted = muted; });
    }

    uint64_t parameter_bus::set_band_gain(std::size_t band, float gain_db) {
        return update([band, gain_db](effect_params& p) {
            if (band >= p.band_gains_db.size()) {
                throw std::out_of_range("equalizer band " + std::to_string(band) + " out of range");
            }
            p.band_gains_db[band] = gain_db;
        });
    }

    uint64_t parameter_bus::set_band_gains(const std::vector<float>& gains_db) {
        return update([&gains_db](effect_params& p) {
            if (gains_db.size() != p.band_gains_db.size()) {
                throw std::invalid_argument("expected " + std::to_string(p.band_gains_db.size()) +
                                            " band gains, got " + std::to_string(gains_db.size()));
            }
            p.band_gains_db = gains_db;
        });
    }

    uint64_t parameter_bus::set_speed(float speed) {
        return update([speed](effect_params& p) { p.speed = speed; });
    }

    uint64_t parameter_bus::trigger_fade(fade_direction direction, frame_index_t duration_frames,
                                         fade_curve curve, float start_progress) {
        return update([this, direction, duration_frames, curve, start_progress](effect_params& p) {
            p.fade.direction = direction;
            p.fade.duration_frames = duration_frames;
            p.fade.curve = curve;
            p.fade.progress = start_progress;
            p.fade.serial = ++m_pimpl->m_fade_serial;
        });
    }

} // namespace audiopipe
