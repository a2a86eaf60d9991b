#include <audiopipe/device_sink.hh>
#include <audiopipe/error.hh>
#include <audiopipe/sdk/buffer.hh>
#include <audiopipe/sdk/from_float_converter.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <atomic>
#include <cstring>

namespace audiopipe {

    namespace {
        constexpr std::size_t k_scratch_frames = 4096;
    }

    struct device_sink::impl {
        impl(std::shared_ptr<audio_backend> backend, output_ring_buffer& ring, const pipeline_config& config)
            : m_backend(std::move(backend)),
              m_ring(ring),
              m_requested(config.device_spec()),
              m_scratch(k_scratch_frames * config.channels) {
        }

        std::shared_ptr<audio_backend> m_backend;
        output_ring_buffer& m_ring;
        const audio_spec m_requested;
        audio_spec m_obtained{};
        uint32_t m_device = 0;
        bool m_device_open = false;
        std::unique_ptr<audio_stream_interface> m_stream;
        from_float_converter_func_t m_converter = nullptr;
        buffer<float> m_scratch;
        std::size_t m_frame_bytes = 0;
        uint8_t m_silence = 0;
        bool m_started = false;

        std::atomic<uint64_t> m_callbacks{0};
        std::atomic<uint64_t> m_bytes{0};
        std::atomic<uint64_t> m_underruns{0};

        void close() noexcept;
    };

    void device_sink::impl::close() noexcept {
        if (m_stream) {
            m_stream->pause();
            m_stream->unbind_from_device();
            m_stream.reset();
        }
        if (m_device_open) {
            m_backend->close_device(m_device);
            m_device_open = false;
        }
    }

    device_sink::device_sink(std::shared_ptr<audio_backend> backend, output_ring_buffer& ring,
                             const pipeline_config& config)
        : m_pimpl(std::make_unique<impl>(std::move(backend), ring, config)) {
        auto& d = *m_pimpl;
        if (!d.m_backend) {
            throw device_error("no audio backend");
        }
        if (ring.channels() != config.channels) {
            throw device_error("ring buffer and device channel counts differ");
        }

        try {
            if (!d.m_backend->is_initialized()) {
                d.m_backend->init();
            }
            d.m_device = d.m_backend->open_device(config.device_id, d.m_requested, d.m_obtained);
            d.m_device_open = true;
        } catch (const std::runtime_error& e) {
            throw device_error(std::string("cannot open output device: ") + e.what());
        }

        // The stream converts to the device format, the callback always sees the requested one
        d.m_converter = get_from_float_converter(d.m_requested.format);
        if (!d.m_converter) {
            d.close();
            throw device_error("no converter for the device sample format");
        }
        d.m_frame_bytes = static_cast<std::size_t>(audio_format_byte_size(d.m_requested.format)) * d.m_requested.channels;
        d.m_silence = d.m_requested.format == audio_format::u8 ? 0x80 : 0x00;

        try {
            d.m_stream = d.m_backend->create_stream(d.m_device, d.m_requested, &device_sink::audio_callback, this);
            d.m_stream->pause();
        } catch (const std::runtime_error& e) {
            d.close();
            throw device_error(std::string("cannot create device stream: ") + e.what());
        }

        LOG_INFO("device_sink", d.m_backend->get_name(), "device opened:", d.m_obtained.freq, "Hz",
                 static_cast<int>(d.m_obtained.channels), "ch, requested", d.m_requested.format);
        if (d.m_obtained.freq != d.m_requested.freq || d.m_obtained.channels != d.m_requested.channels) {
            LOG_DEBUG("device_sink", "backend stream converts to the device format");
        }
    }

    device_sink::~device_sink() {
        m_pimpl->close();
    }

    void device_sink::audio_callback(void* userdata, uint8_t* stream, int len) {
        if (len > 0) {
            static_cast<device_sink*>(userdata)->render(stream, static_cast<std::size_t>(len));
        }
    }

    void device_sink::render(uint8_t* out, std::size_t len) noexcept {
        auto& d = *m_pimpl;
        d.m_callbacks.fetch_add(1, std::memory_order_relaxed);

        const std::size_t channels = d.m_requested.channels;
        const std::size_t whole_frames = len / d.m_frame_bytes;
        const std::size_t scratch_frames = d.m_scratch.size() / channels;

        std::size_t done = 0;
        while (done < whole_frames) {
            const std::size_t n = std::min(whole_frames - done, scratch_frames);
            const auto res = d.m_ring.read(d.m_scratch.data(), n);
            d.m_converter(out + done * d.m_frame_bytes, n * d.m_frame_bytes, d.m_scratch.data(), n * channels);
            done += n;
            if (res.underrun) {
                // One underrun per callback; audio arriving meanwhile waits for the next one
                d.m_underruns.fetch_add(1, std::memory_order_relaxed);
                std::memset(out + done * d.m_frame_bytes, d.m_silence, (whole_frames - done) * d.m_frame_bytes);
                break;
            }
        }

        const std::size_t tail = len - whole_frames * d.m_frame_bytes;
        if (tail > 0) {
            std::memset(out + whole_frames * d.m_frame_bytes, d.m_silence, tail);
        }
        d.m_bytes.fetch_add(len, std::memory_order_relaxed);
    }

    void device_sink::start() {
        if (!m_pimpl->m_stream->resume()) {
            throw device_error("cannot start the output device");
        }
        m_pimpl->m_started = true;
        LOG_DEBUG("device_sink", "started");
    }

    void device_sink::stop() {
        if (!m_pimpl->m_stream->pause()) {
            LOG_WARN("device_sink", "device refused to pause");
        }
        m_pimpl->m_started = false;
        LOG_DEBUG("device_sink", "stopped");
    }

    bool device_sink::is_started() const {
        return m_pimpl->m_started;
    }

    bool device_sink::is_healthy() const {
        return !m_pimpl->m_backend->is_device_lost(m_pimpl->m_device);
    }

    sink_stats device_sink::stats() const noexcept {
        sink_stats s;
        s.callbacks = m_pimpl->m_callbacks.load(std::memory_order_relaxed);
        s.bytes_rendered = m_pimpl->m_bytes.load(std::memory_order_relaxed);
        s.underruns = m_pimpl->m_underruns.load(std::memory_order_relaxed);
        return s;
    }

    const audio_spec& device_sink::obtained_spec() const noexcept {
        return m_pimpl->m_obtained;
    }

    const audio_backend& device_sink::backend() const noexcept {
        return *m_pimpl->m_backend;
    }

} // namespace audiopipe
