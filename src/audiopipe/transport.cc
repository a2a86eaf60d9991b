#include <audiopipe/transport.hh>
#include <audiopipe/error.hh>
#include <audiopipe/parameter_bus.hh>
#include <audiopipe/pipeline.hh>
#include <audiopipe/effects/time_stretch_stage.hh>
#include <audiopipe/ring_buffer.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <thread>

namespace audiopipe {

    namespace {
        constexpr auto k_prime_poll = std::chrono::milliseconds(1);

        effect_params initial_params(const pipeline_config& config) {
            effect_params p;
            p.band_gains_db.assign(config.effective_band_centres().size(), 0.0f);
            return p;
        }

        const pipeline_config& validated(const pipeline_config& config) {
            config.validate();
            return config;
        }
    }

    const char* to_string(transport_state s) noexcept {
        switch (s) {
            case transport_state::stopped: return "stopped";
            case transport_state::playing: return "playing";
            case transport_state::paused: return "paused";
            case transport_state::seeking: return "seeking";
            case transport_state::track_ended: return "track_ended";
        }
        return "unknown";
    }

    struct transport::impl {
        impl(const pipeline_config& config, std::shared_ptr<audio_backend> backend)
            : m_config(validated(config)),
              m_centres(config.effective_band_centres()),
              m_bus(initial_params(config)),
              m_ring(config.ring_capacity_frames(), config.channels),
              m_tap(config.visualization_blocks, time_stretch_max_frames(config), config.channels),
              m_sink(std::move(backend), m_ring, m_config),
              m_pipeline(m_config, m_bus, m_ring, m_tap) {
        }

        static std::size_t time_stretch_max_frames(const pipeline_config& config);

        void require(bool ok, const char* command) const;
        void prime();
        void start_fade(bool fade_in);
        void start_output(transport_state on_failure);
        frame_index_t do_seek(frame_index_t frame, bool start_playing);
        void restart(bool fade_in);
        void fail(const std::string& message, std::vector<transport_event>& events);
        void on_track_end(std::vector<transport_event>& events);

        const pipeline_config m_config;
        const std::vector<float> m_centres;
        parameter_bus m_bus;
        output_ring_buffer m_ring;
        visualization_tap m_tap;
        device_sink m_sink;
        processing_pipeline m_pipeline;

        transport_state m_state = transport_state::stopped;
        std::optional<std::string> m_track_id;
        next_track_provider m_next_track;
        std::string m_last_error;
        // The track finished while paused; resume() resolves it
        bool m_end_pending = false;
        std::vector<transport_event> m_deferred;
    };

    std::size_t transport::impl::time_stretch_max_frames(const pipeline_config& config) {
        return time_stretch_stage::max_output_frames(config.block_frames);
    }

    void transport::impl::require(bool ok, const char* command) const {
        if (!ok) {
            throw state_error(std::string(command) + " is not allowed while " + to_string(m_state));
        }
    }

    // Let the producer put something in front of the device before it starts pulling
    void transport::impl::prime() {
        const auto want = std::min(m_config.block_frames, m_ring.capacity());
        const auto deadline = std::chrono::steady_clock::now() + m_config.ring_latency;
        while (m_ring.size() < want &&
               m_pipeline.state() == pipeline_state::decoding &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(k_prime_poll);
        }
    }

    void transport::impl::start_fade(bool fade_in) {
        const auto frames = m_config.fade_frames();
        if (fade_in && frames > 0) {
            m_bus.trigger_fade(fade_direction::in, frames);
        } else {
            m_bus.trigger_fade(fade_direction::none, 0);
        }
    }

    // The producer stays parked with its track when the device refuses to
    // start, so a later play() can rewind it
    void transport::impl::start_output(transport_state on_failure) {
        try {
            m_sink.start();
        } catch (const device_error& e) {
            LOG_ERROR("transport", e.what());
            m_pipeline.pause();
            m_state = on_failure;
            throw;
        }
        m_state = transport_state::playing;
    }

    frame_index_t transport::impl::do_seek(frame_index_t frame, bool start_playing) {
        if (const auto total = m_pipeline.total_frames()) {
            frame = std::min(frame, *total);
        }
        const auto previous = m_state;
        m_state = transport_state::seeking;

        frame_index_t reached = 0;
        m_pipeline.quiesce();
        try {
            reached = m_pipeline.seek(frame);
        } catch (const audiopipe_error&) {
            m_pipeline.release();
            m_state = previous;
            throw;
        }
        m_pipeline.release();
        m_end_pending = false;
        LOG_INFO("transport", "seek to frame", reached);

        if (start_playing) {
            m_pipeline.resume();
            prime();
            start_output(transport_state::stopped);
        } else {
            m_state = previous;
        }
        return reached;
    }

    // Replays a track whose producer is still alive: finished, or left behind
    // by a device that failed to start
    void transport::impl::restart(bool fade_in) {
        start_fade(fade_in);
        do_seek(0, true);
        LOG_INFO("transport", "playing", m_track_id.value_or(""), "from the start");
    }

    void transport::impl::fail(const std::string& message, std::vector<transport_event>& events) {
        LOG_ERROR("transport", "playback stopped:", message);
        m_sink.stop();
        m_pipeline.stop();
        m_track_id.reset();
        m_state = transport_state::stopped;
        m_end_pending = false;
        m_last_error = message;
        events.push_back({transport_event::kind::error, message});
    }

    void transport::impl::on_track_end(std::vector<transport_event>& events) {
        m_state = transport_state::track_ended;
        events.push_back({transport_event::kind::track_ended, m_track_id.value_or("")});
        LOG_INFO("transport", "track ended:", m_track_id.value_or(""));

        switch (m_config.end_policy) {
            case track_end_policy::stop:
                // The track stays loaded; play() starts it over
                m_sink.stop();
                m_state = transport_state::stopped;
                break;

            case track_end_policy::repeat:
                do_seek(0, true);
                events.push_back({transport_event::kind::track_repeated, m_track_id.value_or("")});
                break;

            case track_end_policy::advance: {
                std::unique_ptr<track> next;
                if (m_next_track) {
                    next = m_next_track();
                }
                m_sink.stop();
                m_pipeline.stop();
                m_track_id.reset();
                m_state = transport_state::stopped;
                if (!next) {
                    events.push_back({transport_event::kind::stopped, {}});
                    break;
                }
                const std::string id = next->id();
                m_pipeline.set_source(std::make_unique<decoder_adapter>(
                    std::move(next), m_config.sample_rate, m_config.channels,
                    m_config.block_frames, m_config.resampler_quality));
                m_track_id = id;
                start_fade(false);
                m_pipeline.start();
                prime();
                start_output(transport_state::stopped);
                events.push_back({transport_event::kind::track_changed, id});
                break;
            }
        }
    }

    transport::transport(const pipeline_config& config, std::shared_ptr<audio_backend> backend)
        : m_pimpl(std::make_unique<impl>(config, std::move(backend))) {
        LOG_INFO("transport", "session ready:", config.sample_rate, "Hz", static_cast<int>(config.channels),
                 "ch, ring", m_pimpl->m_ring.capacity(), "frames");
    }

    transport::~transport() {
        m_pimpl->m_sink.stop();
        m_pimpl->m_pipeline.stop();
    }

    void transport::load(std::unique_ptr<track> trk) {
        if (!trk) {
            throw decoder_error("load: no track");
        }
        stop();
        const std::string id = trk->id();
        m_pimpl->m_pipeline.set_source(std::make_unique<decoder_adapter>(
            std::move(trk), m_pimpl->m_config.sample_rate, m_pimpl->m_config.channels,
            m_pimpl->m_config.block_frames, m_pimpl->m_config.resampler_quality));
        m_pimpl->m_track_id = id;
        m_pimpl->m_last_error.clear();
        LOG_INFO("transport", "loaded", id);
    }

    void transport::play(bool fade_in) {
        auto& d = *m_pimpl;
        d.require(d.m_state == transport_state::stopped || d.m_state == transport_state::track_ended, "play");

        if (d.m_state == transport_state::track_ended || d.m_pipeline.is_running()) {
            d.restart(fade_in);
            return;
        }

        if (!d.m_pipeline.has_source()) {
            throw state_error("play: no track loaded");
        }
        d.start_fade(fade_in);
        d.m_pipeline.start();
        d.prime();
        d.start_output(transport_state::stopped);
        LOG_INFO("transport", "playing", d.m_track_id.value_or(""), fade_in ? "with fade-in" : "");
    }

    void transport::pause() {
        auto& d = *m_pimpl;
        d.require(d.m_state == transport_state::playing, "pause");
        d.m_pipeline.pause();
        d.m_sink.stop();
        d.m_state = transport_state::paused;
        LOG_DEBUG("transport", "paused at frame", d.m_pipeline.position());
    }

    void transport::resume() {
        auto& d = *m_pimpl;
        d.require(d.m_state == transport_state::paused, "resume");
        if (d.m_end_pending) {
            d.m_end_pending = false;
            try {
                d.on_track_end(d.m_deferred);
            } catch (const audiopipe_error& e) {
                d.fail(e.what(), d.m_deferred);
            }
            return;
        }
        d.m_pipeline.resume();
        d.start_output(transport_state::paused);
        LOG_DEBUG("transport", "resumed");
    }

    void transport::stop() {
        auto& d = *m_pimpl;
        if (d.m_state == transport_state::stopped && !d.m_pipeline.has_source()) {
            return;
        }
        d.m_sink.stop();
        d.m_pipeline.stop();
        d.m_track_id.reset();
        d.m_state = transport_state::stopped;
        d.m_end_pending = false;
        LOG_INFO("transport", "stopped");
    }

    frame_index_t transport::seek(frame_index_t frame) {
        auto& d = *m_pimpl;
        d.require(d.m_state == transport_state::playing ||
                  d.m_state == transport_state::paused ||
                  d.m_state == transport_state::track_ended, "seek");
        return d.do_seek(frame, d.m_state == transport_state::track_ended);
    }

    frame_index_t transport::seek_time(std::chrono::milliseconds t) {
        const auto ms = std::max<std::chrono::milliseconds::rep>(t.count(), 0);
        return seek(static_cast<frame_index_t>(ms) * m_pimpl->m_config.sample_rate / 1000);
    }

    frame_index_t transport::skip(std::chrono::milliseconds delta) {
        const auto rate = static_cast<int64_t>(m_pimpl->m_config.sample_rate);
        const auto target = static_cast<int64_t>(position()) + delta.count() * rate / 1000;
        return seek(static_cast<frame_index_t>(std::max<int64_t>(target, 0)));
    }

    void transport::set_volume(float volume) {
        m_pimpl->m_bus.set_volume(volume);
    }

    void transport::set_muted(bool muted) {
        m_pimpl->m_bus.set_muted(muted);
    }

    void transport::set_band_gain(std::size_t band, float gain_db) {
        m_pimpl->m_bus.set_band_gain(band, gain_db);
    }

    void transport::set_band_gains(const std::vector<float>& gains_db) {
        m_pimpl->m_bus.set_band_gains(gains_db);
    }

    void transport::set_equalizer_preset(eq_preset preset) {
        m_pimpl->m_bus.set_band_gains(preset_band_gains(preset, m_pimpl->m_centres));
    }

    void transport::set_speed(float speed) {
        m_pimpl->m_bus.set_speed(speed);
    }

    void transport::fade(fade_direction direction, std::optional<std::chrono::milliseconds> duration,
                         fade_curve curve) {
        const auto& cfg = m_pimpl->m_config;
        const auto ms = duration ? duration->count() : cfg.fade_duration.count();
        const auto frames = static_cast<frame_index_t>(std::max<std::chrono::milliseconds::rep>(ms, 0)) *
                            cfg.sample_rate / 1000;
        m_pimpl->m_bus.trigger_fade(direction, frames, curve);
    }

    void transport::set_visualization_enabled(bool enabled) {
        m_pimpl->m_tap.set_enabled(enabled);
        if (!enabled) {
            m_pimpl->m_tap.clear();
        }
    }

    bool transport::is_visualization_enabled() const {
        return m_pimpl->m_tap.is_enabled();
    }

    void transport::set_next_track_provider(next_track_provider provider) {
        m_pimpl->m_next_track = std::move(provider);
    }

    std::vector<transport_event> transport::process_events() {
        auto& d = *m_pimpl;
        std::vector<transport_event> events;
        events.swap(d.m_deferred);

        for (const auto& ev : d.m_pipeline.drain_events()) {
            switch (ev.type) {
                case pipeline_event::kind::decode_error:
                    d.fail("decoding " + d.m_track_id.value_or("track") + " failed: " + ev.message, events);
                    break;
                case pipeline_event::kind::track_complete:
                    if (d.m_state == transport_state::playing) {
                        try {
                            d.on_track_end(events);
                        } catch (const audiopipe_error& e) {
                            d.fail(e.what(), events);
                        }
                    } else if (d.m_state == transport_state::paused) {
                        d.m_end_pending = true;
                    }
                    break;
            }
        }

        if ((d.m_state == transport_state::playing || d.m_state == transport_state::paused) &&
            !d.m_sink.is_healthy()) {
            d.fail("output device lost", events);
        }
        return events;
    }

    transport_state transport::state() const noexcept {
        return m_pimpl->m_state;
    }

    frame_index_t transport::position() const noexcept {
        return m_pimpl->m_pipeline.position();
    }

    std::chrono::milliseconds transport::position_time() const noexcept {
        const auto rate = m_pimpl->m_config.sample_rate;
        return std::chrono::milliseconds(static_cast<int64_t>(position() * 1000 / rate));
    }

    std::optional<frame_index_t> transport::duration_frames() const {
        return m_pimpl->m_pipeline.total_frames();
    }

    std::optional<std::string> transport::current_track() const {
        return m_pimpl->m_track_id;
    }

    visualization_snapshot transport::visualization() const {
        return m_pimpl->m_tap.snapshot();
    }

    std::vector<channel_levels> transport::levels() const {
        return compute_levels(m_pimpl->m_tap.snapshot());
    }

    std::shared_ptr<const effect_params> transport::parameters() const {
        return m_pimpl->m_bus.current();
    }

    transport_stats transport::stats() const {
        const auto& d = *m_pimpl;
        transport_stats s;
        s.ring_frames = d.m_ring.size();
        s.ring_capacity = d.m_ring.capacity();
        s.underruns = d.m_ring.underruns();
        s.blocks_processed = d.m_pipeline.blocks_processed();
        s.visualization_dropped = d.m_tap.dropped_blocks();
        s.params_version = d.m_bus.version();
        s.sink = d.m_sink.stats();
        return s;
    }

    const std::string& transport::last_error() const noexcept {
        return m_pimpl->m_last_error;
    }

    const pipeline_config& transport::config() const noexcept {
        return m_pimpl->m_config;
    }

} // namespace audiopipe
