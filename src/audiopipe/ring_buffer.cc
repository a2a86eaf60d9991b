#include <audiopipe/ring_buffer.hh>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace audiopipe {

    namespace {
        constexpr auto k_poll_interval = std::chrono::microseconds(500);
    }

    output_ring_buffer::output_ring_buffer(std::size_t capacity_frames, channels_t channels)
        : m_data(capacity_frames * channels),
          m_capacity(capacity_frames),
          m_channels(channels) {
        if (capacity_frames == 0 || channels == 0) {
            throw std::invalid_argument("ring buffer needs a non-zero capacity and channel count");
        }
    }

    uint64_t output_ring_buffer::effective_read_index() const noexcept {
        const uint64_t rd = m_read_index.load(std::memory_order_acquire);
        if (m_flush_pending.load(std::memory_order_acquire)) {
            return std::max(rd, m_flush_target.load(std::memory_order_acquire));
        }
        return rd;
    }

    // Flushed slots are free for the writer only while no read is in flight.
    // Both flags are sequentially consistent: a read that begins after this
    // check sees the pending flush and skips the slots being overwritten.
    uint64_t output_ring_buffer::writer_read_index() const noexcept {
        const uint64_t rd = m_read_index.load(std::memory_order_acquire);
        if (m_flush_pending.load(std::memory_order_seq_cst) && !m_reading.load(std::memory_order_seq_cst)) {
            return std::max(rd, m_flush_target.load(std::memory_order_acquire));
        }
        return rd;
    }

    std::size_t output_ring_buffer::size() const noexcept {
        const uint64_t wr = m_write_index.load(std::memory_order_acquire);
        const uint64_t rd = effective_read_index();
        return wr > rd ? static_cast<std::size_t>(wr - rd) : 0;
    }

    std::size_t output_ring_buffer::available() const noexcept {
        return m_capacity - std::min(size(), m_capacity);
    }

    std::size_t output_ring_buffer::try_write(const float* frames, std::size_t count) {
        const uint64_t wr = m_write_index.load(std::memory_order_relaxed);
        // A stale read index only under-reports free space
        const uint64_t rd = writer_read_index();
        const std::size_t used = static_cast<std::size_t>(wr - rd);
        const std::size_t n = std::min(count, m_capacity - used);
        if (n == 0) {
            return 0;
        }

        const std::size_t start = static_cast<std::size_t>(wr % m_capacity);
        const std::size_t first = std::min(n, m_capacity - start);
        std::memcpy(m_data.data() + start * m_channels, frames, first * m_channels * sizeof(float));
        if (n > first) {
            std::memcpy(m_data.data(), frames + first * m_channels, (n - first) * m_channels * sizeof(float));
        }

        m_write_index.store(wr + n, std::memory_order_release);
        return n;
    }

    write_result output_ring_buffer::write(const float* frames, std::size_t count,
                                           std::chrono::milliseconds timeout,
                                           const abort_predicate_t& abort) {
        write_result result;
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (result.frames_written < count) {
            result.frames_written += try_write(frames + result.frames_written * m_channels,
                                               count - result.frames_written);
            if (result.frames_written == count) {
                break;
            }
            if (abort && abort()) {
                result.status = write_status::aborted;
                return result;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.status = write_status::buffer_full;
                return result;
            }
            std::this_thread::sleep_for(k_poll_interval);
        }
        result.status = write_status::ok;
        return result;
    }

    read_result output_ring_buffer::read(float* out, std::size_t count) noexcept {
        read_result result;

        m_reading.store(true, std::memory_order_seq_cst);
        uint64_t rd = m_read_index.load(std::memory_order_relaxed);
        if (m_flush_pending.exchange(false, std::memory_order_seq_cst)) {
            // The flush target never decreases, max() keeps a re-applied
            // target from moving the reader backwards
            rd = std::max(rd, m_flush_target.load(std::memory_order_acquire));
            m_read_index.store(rd, std::memory_order_release);
        }

        const uint64_t wr = m_write_index.load(std::memory_order_acquire);
        const std::size_t readable = static_cast<std::size_t>(wr - rd);
        const std::size_t n = std::min(count, readable);

        if (n > 0) {
            const std::size_t start = static_cast<std::size_t>(rd % m_capacity);
            const std::size_t first = std::min(n, m_capacity - start);
            std::memcpy(out, m_data.data() + start * m_channels, first * m_channels * sizeof(float));
            if (n > first) {
                std::memcpy(out + first * m_channels, m_data.data(), (n - first) * m_channels * sizeof(float));
            }
            m_read_index.store(rd + n, std::memory_order_release);
            m_frames_delivered.fetch_add(n, std::memory_order_relaxed);
        }
        m_reading.store(false, std::memory_order_release);

        if (n < count) {
            std::fill_n(out + n * m_channels, (count - n) * m_channels, 0.0f);
            m_underruns.fetch_add(1, std::memory_order_relaxed);
            result.underrun = true;
        }
        result.frames_read = n;
        return result;
    }

    void output_ring_buffer::request_flush() noexcept {
        m_flush_target.store(m_write_index.load(std::memory_order_acquire), std::memory_order_release);
        m_flush_pending.store(true, std::memory_order_release);
    }

    void output_ring_buffer::reset() noexcept {
        m_write_index.store(0, std::memory_order_relaxed);
        m_read_index.store(0, std::memory_order_relaxed);
        m_flush_target.store(0, std::memory_order_relaxed);
        m_flush_pending.store(false, std::memory_order_relaxed);
        m_reading.store(false, std::memory_order_relaxed);
        m_frames_delivered.store(0, std::memory_order_relaxed);
        m_underruns.store(0, std::memory_order_release);
    }

    uint64_t output_ring_buffer::written_frames() const noexcept {
        return m_write_index.load(std::memory_order_acquire);
    }

    uint64_t output_ring_buffer::read_frames() const noexcept {
        return effective_read_index();
    }

    uint64_t output_ring_buffer::delivered_frames() const noexcept {
        return m_frames_delivered.load(std::memory_order_acquire);
    }

    uint64_t output_ring_buffer::underruns() const noexcept {
        return m_underruns.load(std::memory_order_acquire);
    }

} // namespace audiopipe
