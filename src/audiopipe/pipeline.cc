#include <audiopipe/pipeline.hh>
#include <audiopipe/effects/equalizer_stage.hh>
#include <audiopipe/effects/fade_stage.hh>
#include <audiopipe/effects/gain_stage.hh>
#include <audiopipe/effects/time_stretch_stage.hh>
#include <audiopipe/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace audiopipe {

    namespace {
        constexpr auto k_drain_poll = std::chrono::milliseconds(2);
    }

    const char* to_string(pipeline_state s) noexcept {
        switch (s) {
            case pipeline_state::idle: return "idle";
            case pipeline_state::decoding: return "decoding";
            case pipeline_state::paused: return "paused";
            case pipeline_state::draining: return "draining";
        }
        return "unknown";
    }

    struct processing_pipeline::impl {
        impl(const pipeline_config& config, parameter_bus& bus, output_ring_buffer& ring, visualization_tap& tap)
            : m_config(config),
              m_bus(bus),
              m_ring(ring),
              m_tap(tap),
              m_stretch(config.channels, config.block_frames),
              m_eq(config.sample_rate, config.channels, config.effective_band_centres(), config.eq_q),
              m_chain{&m_stretch, &m_eq, &m_fade, &m_gain},
              m_block(time_stretch_stage::max_output_frames(config.block_frames), config.channels, config.sample_rate) {
        }

        void run();
        void decode_step();
        void drain_step();
        void report_underruns();
        void push_event(pipeline_event::kind type, std::string message);
        void reset_history();

        const pipeline_config m_config;
        parameter_bus& m_bus;
        output_ring_buffer& m_ring;
        visualization_tap& m_tap;

        time_stretch_stage m_stretch;
        equalizer_stage m_eq;
        fade_stage m_fade;
        gain_stage m_gain;
        const std::array<effect_stage*, 4> m_chain;

        pcm_block m_block;
        std::unique_ptr<decoder_adapter> m_source;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        pipeline_state m_state = pipeline_state::idle;
        pipeline_state m_paused_from = pipeline_state::decoding;
        bool m_quiesce_requested = false;
        bool m_quiesced = false;
        bool m_stop_requested = false;
        std::thread m_thread;

        std::atomic<bool> m_abort_write{false};
        std::atomic<frame_index_t> m_position{0};
        std::atomic<uint64_t> m_blocks{0};

        // Producer side; touched by the control thread only while parked
        bool m_block_pending = false;
        std::size_t m_pending_offset = 0;
        frame_index_t m_next_position = 0;
        uint64_t m_seen_underruns = 0;

        std::mutex m_events_mutex;
        std::deque<pipeline_event> m_events;
    };

    void processing_pipeline::impl::push_event(pipeline_event::kind type, std::string message) {
        std::lock_guard<std::mutex> lock(m_events_mutex);
        m_events.push_back({type, std::move(message), m_position.load(std::memory_order_acquire)});
    }

    void processing_pipeline::impl::reset_history() {
        m_stretch.reset();
        m_eq.reset();
        m_block_pending = false;
        m_pending_offset = 0;
        m_block.clear();
    }

    void processing_pipeline::impl::report_underruns() {
        const auto total = m_ring.underruns();
        if (total > m_seen_underruns) {
            LOG_WARN("pipeline", "output underrun:", total - m_seen_underruns, "new,", total, "total");
            m_seen_underruns = total;
        }
    }

    void processing_pipeline::impl::run() {
        LOG_DEBUG("pipeline", "producer started");
        for (;;) {
            pipeline_state current;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                for (;;) {
                    if (m_stop_requested) {
                        LOG_DEBUG("pipeline", "producer stopped");
                        return;
                    }
                    if (m_quiesce_requested) {
                        m_quiesced = true;
                        m_cv.notify_all();
                        m_cv.wait(lock, [this] { return !m_quiesce_requested || m_stop_requested; });
                        m_quiesced = false;
                        continue;
                    }
                    if (m_state == pipeline_state::decoding || m_state == pipeline_state::draining) {
                        break;
                    }
                    m_cv.wait(lock);
                }
                current = m_state;
            }

            if (current == pipeline_state::draining) {
                drain_step();
            } else {
                decode_step();
            }
        }
    }

    void processing_pipeline::impl::drain_step() {
        if (m_ring.empty()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state == pipeline_state::draining) {
                m_state = pipeline_state::idle;
                LOG_INFO("pipeline", "track complete at frame", m_position.load());
                push_event(pipeline_event::kind::track_complete, {});
            }
            return;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, k_drain_poll, [this] {
            return m_stop_requested || m_quiesce_requested || m_state != pipeline_state::draining;
        });
    }

    void processing_pipeline::impl::decode_step() {
        report_underruns();

        if (!m_block_pending) {
            // One snapshot per block: a change lands exactly on the next block boundary
            const auto params = m_bus.current();

            block_status status;
            try {
                status = m_source->next_block(m_block);
            } catch (const std::exception& e) {
                LOG_ERROR("pipeline", "decoder failed at frame", m_position.load(), ":", e.what());
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_state = pipeline_state::idle;
                }
                push_event(pipeline_event::kind::decode_error, e.what());
                return;
            }

            if (status == block_status::end_of_stream) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_state == pipeline_state::decoding) {
                    LOG_DEBUG("pipeline", "end of stream, draining", m_ring.size(), "frames");
                    m_state = pipeline_state::draining;
                }
                return;
            }

            m_next_position = m_block.source_position() + m_block.source_frames();
            for (auto* stage : m_chain) {
                stage->process(m_block, *params);
            }
            m_block_pending = true;
            m_pending_offset = 0;
        }

        const auto ch = m_block.channels();
        while (m_pending_offset < m_block.frames()) {
            const auto res = m_ring.write(m_block.data() + m_pending_offset * ch,
                                          m_block.frames() - m_pending_offset,
                                          m_config.write_timeout,
                                          [this] { return m_abort_write.load(std::memory_order_acquire); });
            m_pending_offset += res.frames_written;
            if (res.status == write_status::aborted) {
                // The rest goes out after release() unless a seek drops it
                return;
            }
            if (res.status == write_status::buffer_full) {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_state != pipeline_state::decoding) {
                    return;
                }
            }
        }

        m_block_pending = false;
        m_tap.push(m_block);
        m_position.store(m_next_position, std::memory_order_release);
        m_blocks.fetch_add(1, std::memory_order_relaxed);
    }

    processing_pipeline::processing_pipeline(const pipeline_config& config, parameter_bus& bus,
                                             output_ring_buffer& ring, visualization_tap& tap)
        : m_pimpl(std::make_unique<impl>(config, bus, ring, tap)) {
    }

    processing_pipeline::~processing_pipeline() {
        stop();
    }

    void processing_pipeline::set_source(std::unique_ptr<decoder_adapter> source) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        if (m_pimpl->m_thread.joinable()) {
            throw state_error("cannot replace the source while the pipeline runs");
        }
        m_pimpl->m_source = std::move(source);
        m_pimpl->reset_history();
        m_pimpl->m_fade.reset();
        m_pimpl->m_position.store(m_pimpl->m_source ? m_pimpl->m_source->position() : 0);
    }

    bool processing_pipeline::has_source() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_source != nullptr;
    }

    void processing_pipeline::start() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        if (m_pimpl->m_thread.joinable()) {
            throw state_error("pipeline already running");
        }
        if (!m_pimpl->m_source) {
            throw state_error("pipeline has no source");
        }
        m_pimpl->m_stop_requested = false;
        m_pimpl->m_quiesce_requested = false;
        m_pimpl->m_quiesced = false;
        m_pimpl->m_abort_write.store(false);
        m_pimpl->m_state = pipeline_state::decoding;
        m_pimpl->m_seen_underruns = m_pimpl->m_ring.underruns();
        m_pimpl->m_blocks.store(0);
        m_pimpl->m_thread = std::thread([this] { m_pimpl->run(); });
        LOG_INFO("pipeline", "started", m_pimpl->m_source->get_track().id());
    }

    void processing_pipeline::stop() {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            m_pimpl->m_stop_requested = true;
            m_pimpl->m_abort_write.store(true, std::memory_order_release);
        }
        m_pimpl->m_cv.notify_all();
        if (m_pimpl->m_thread.joinable()) {
            m_pimpl->m_thread.join();
            LOG_INFO("pipeline", "stopped at frame", m_pimpl->m_position.load());
        }

        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        m_pimpl->m_state = pipeline_state::idle;
        m_pimpl->m_quiesce_requested = false;
        m_pimpl->m_quiesced = false;
        m_pimpl->m_source.reset();
        m_pimpl->reset_history();
        m_pimpl->m_fade.reset();
        m_pimpl->m_ring.request_flush();
        m_pimpl->m_tap.clear();
        m_pimpl->m_position.store(0);
    }

    void processing_pipeline::pause() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        const auto s = m_pimpl->m_state;
        if (s == pipeline_state::decoding || s == pipeline_state::draining) {
            m_pimpl->m_paused_from = s;
            m_pimpl->m_state = pipeline_state::paused;
            LOG_DEBUG("pipeline", "paused while", to_string(s));
        }
    }

    void processing_pipeline::resume() {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            if (m_pimpl->m_state != pipeline_state::paused) {
                return;
            }
            m_pimpl->m_state = m_pimpl->m_paused_from;
            LOG_DEBUG("pipeline", "resumed to", to_string(m_pimpl->m_state));
        }
        m_pimpl->m_cv.notify_all();
    }

    void processing_pipeline::quiesce() {
        std::unique_lock<std::mutex> lock(m_pimpl->m_mutex);
        if (!m_pimpl->m_thread.joinable()) {
            return;
        }
        m_pimpl->m_quiesce_requested = true;
        m_pimpl->m_abort_write.store(true, std::memory_order_release);
        m_pimpl->m_cv.notify_all();
        m_pimpl->m_cv.wait(lock, [this] { return m_pimpl->m_quiesced; });
    }

    void processing_pipeline::release() {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
            m_pimpl->m_quiesce_requested = false;
            m_pimpl->m_abort_write.store(false, std::memory_order_release);
        }
        m_pimpl->m_cv.notify_all();
    }

    bool processing_pipeline::is_quiesced() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_quiesced;
    }

    frame_index_t processing_pipeline::seek(frame_index_t frame) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        if (m_pimpl->m_thread.joinable() && !m_pimpl->m_quiesced) {
            throw state_error("seek requires a quiesced pipeline");
        }
        if (!m_pimpl->m_source) {
            throw state_error("seek without a source");
        }

        const auto reached = m_pimpl->m_source->seek(frame);
        m_pimpl->reset_history();
        m_pimpl->m_ring.request_flush();
        m_pimpl->m_tap.clear();
        m_pimpl->m_position.store(reached, std::memory_order_release);
        {
            // A completion reported before the jump no longer applies
            std::lock_guard<std::mutex> events_lock(m_pimpl->m_events_mutex);
            auto& ev = m_pimpl->m_events;
            ev.erase(std::remove_if(ev.begin(), ev.end(), [](const pipeline_event& e) {
                return e.type == pipeline_event::kind::track_complete;
            }), ev.end());
        }

        switch (m_pimpl->m_state) {
            case pipeline_state::idle:
            case pipeline_state::draining:
                if (m_pimpl->m_thread.joinable()) {
                    m_pimpl->m_state = pipeline_state::decoding;
                }
                break;
            case pipeline_state::paused:
                m_pimpl->m_paused_from = pipeline_state::decoding;
                break;
            case pipeline_state::decoding:
                break;
        }
        LOG_DEBUG("pipeline", "seek to", frame, "reached", reached);
        return reached;
    }

    pipeline_state processing_pipeline::state() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_state;
    }

    bool processing_pipeline::is_running() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        return m_pimpl->m_thread.joinable();
    }

    frame_index_t processing_pipeline::position() const noexcept {
        return m_pimpl->m_position.load(std::memory_order_acquire);
    }

    std::optional<frame_index_t> processing_pipeline::total_frames() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_mutex);
        if (!m_pimpl->m_source) {
            return std::nullopt;
        }
        return m_pimpl->m_source->total_frames();
    }

    uint64_t processing_pipeline::blocks_processed() const noexcept {
        return m_pimpl->m_blocks.load(std::memory_order_relaxed);
    }

    std::vector<pipeline_event> processing_pipeline::drain_events() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_events_mutex);
        std::vector<pipeline_event> out(m_pimpl->m_events.begin(), m_pimpl->m_events.end());
        m_pimpl->m_events.clear();
        return out;
    }

} // namespace audiopipe
