#include <audiopipe/visualization_tap.hh>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace audiopipe {

    namespace {
        struct slot {
            explicit slot(std::size_t samples)
                : data(samples) {
            }

            buffer<float> data;
            std::size_t frames = 0;
            sample_rate_t rate = 0;
            frame_index_t position = 0;
            uint64_t sequence = 0;              ///< 0 means empty
            std::atomic_flag busy = ATOMIC_FLAG_INIT;
        };
    }

    struct visualization_tap::impl {
        impl(std::size_t slot_count, std::size_t max_frames, channels_t ch)
            : m_max_frames(max_frames),
              m_channels(ch) {
            m_slots.reserve(slot_count);
            for (std::size_t i = 0; i < slot_count; i++) {
                m_slots.push_back(std::make_unique<slot>(max_frames * ch));
            }
        }

        std::vector<std::unique_ptr<slot>> m_slots;
        const std::size_t m_max_frames;
        const channels_t m_channels;
        uint64_t m_next_sequence = 1;           // producer only
        std::atomic<bool> m_enabled{true};
        std::atomic<uint64_t> m_dropped{0};
    };

    visualization_tap::visualization_tap(std::size_t slots, std::size_t max_block_frames, channels_t channels) {
        if (slots == 0 || max_block_frames == 0 || channels == 0) {
            throw std::invalid_argument("visualization tap needs non-zero slots, block size and channels");
        }
        m_pimpl = std::make_unique<impl>(slots, max_block_frames, channels);
    }

    visualization_tap::~visualization_tap() = default;

    bool visualization_tap::push(const pcm_block& block) noexcept {
        if (!m_pimpl->m_enabled.load(std::memory_order_relaxed) || block.empty()) {
            return false;
        }

        const uint64_t seq = m_pimpl->m_next_sequence++;
        auto& s = *m_pimpl->m_slots[seq % m_pimpl->m_slots.size()];
        if (s.busy.test_and_set(std::memory_order_acquire)) {
            m_pimpl->m_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        const std::size_t frames = std::min(block.frames(), m_pimpl->m_max_frames);
        if (block.channels() == m_pimpl->m_channels) {
            std::memcpy(s.data.data(), block.data(), frames * m_pimpl->m_channels * sizeof(float));
        } else {
            const channels_t ch = std::min(block.channels(), m_pimpl->m_channels);
            s.data.zero();
            for (std::size_t f = 0; f < frames; f++) {
                for (channels_t c = 0; c < ch; c++) {
                    s.data[f * m_pimpl->m_channels + c] = block.sample(f, c);
                }
            }
        }
        s.frames = frames;
        s.rate = block.rate();
        s.position = block.source_position();
        s.sequence = seq;

        s.busy.clear(std::memory_order_release);
        return true;
    }

    visualization_snapshot visualization_tap::snapshot() const {
        visualization_snapshot out;
        out.channels = m_pimpl->m_channels;

        std::vector<std::pair<uint64_t, std::vector<float>>> copies;
        copies.reserve(m_pimpl->m_slots.size());
        uint64_t newest = 0;

        for (auto& sp : m_pimpl->m_slots) {
            auto& s = *sp;
            while (s.busy.test_and_set(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            if (s.sequence != 0 && s.frames > 0) {
                copies.emplace_back(s.sequence,
                                    std::vector<float>(s.data.data(), s.data.data() + s.frames * out.channels));
                if (s.sequence > newest) {
                    newest = s.sequence;
                    out.rate = s.rate;
                    out.position = s.position;
                }
            }
            s.busy.clear(std::memory_order_release);
        }

        std::sort(copies.begin(), copies.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        std::size_t total = 0;
        for (const auto& c : copies) {
            total += c.second.size();
        }
        out.samples.reserve(total);
        for (const auto& c : copies) {
            out.samples.insert(out.samples.end(), c.second.begin(), c.second.end());
        }
        out.blocks = copies.size();
        return out;
    }

    void visualization_tap::clear() noexcept {
        for (auto& sp : m_pimpl->m_slots) {
            auto& s = *sp;
            while (s.busy.test_and_set(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            s.sequence = 0;
            s.frames = 0;
            s.busy.clear(std::memory_order_release);
        }
    }

    void visualization_tap::set_enabled(bool enabled) noexcept {
        m_pimpl->m_enabled.store(enabled, std::memory_order_relaxed);
    }

    bool visualization_tap::is_enabled() const noexcept {
        return m_pimpl->m_enabled.load(std::memory_order_relaxed);
    }

    std::size_t visualization_tap::slots() const noexcept {
        return m_pimpl->m_slots.size();
    }

    uint64_t visualization_tap::dropped_blocks() const noexcept {
        return m_pimpl->m_dropped.load(std::memory_order_relaxed);
    }

    std::vector<channel_levels> compute_levels(const visualization_snapshot& snapshot) {
        std::vector<channel_levels> levels;
        const std::size_t frames = snapshot.frames();
        if (frames == 0) {
            return levels;
        }
        levels.resize(snapshot.channels);

        std::vector<double> sum_sq(snapshot.channels, 0.0);
        for (std::size_t f = 0; f < frames; f++) {
            for (channels_t c = 0; c < snapshot.channels; c++) {
                const float v = snapshot.samples[f * snapshot.channels + c];
                levels[c].peak = std::max(levels[c].peak, std::fabs(v));
                sum_sq[c] += static_cast<double>(v) * v;
            }
        }
        for (channels_t c = 0; c < snapshot.channels; c++) {
            levels[c].rms = static_cast<float>(std::sqrt(sum_sq[c] / static_cast<double>(frames)));
        }
        return levels;
    }

} // namespace audiopipe
