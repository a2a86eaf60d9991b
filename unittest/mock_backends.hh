#ifndef AUDIOPIPE_MOCK_BACKENDS_HH
#define AUDIOPIPE_MOCK_BACKENDS_HH

#include <audiopipe/sdk/audio_backend.hh>
#include <audiopipe/sdk/audio_stream_interface.hh>
#include <audiopipe/sdk/audio_format.hh>
#include <memory>
#include <vector>
#include <map>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <cstring>

namespace audiopipe::test {

    // Stream that never runs on its own: tests call pump() in place of the
    // platform audio thread.
    class mock_stream : public audio_stream_interface {
        private:
            audio_spec m_spec;
            audio_callback_t m_callback;
            void* m_userdata;
            std::atomic<bool> m_paused{true};
            std::atomic<bool> m_bound{true};

        public:
            std::atomic<int> clear_calls{0};
            std::atomic<int> pause_calls{0};
            std::atomic<int> resume_calls{0};
            std::atomic<bool> fail_resume{false};

            mock_stream(const audio_spec& spec, audio_callback_t callback, void* userdata)
                : m_spec(spec), m_callback(callback), m_userdata(userdata) {}

            void clear() override {
                clear_calls++;
            }

            bool pause() override {
                pause_calls++;
                m_paused = true;
                return true;
            }

            bool resume() override {
                resume_calls++;
                if (fail_resume) {
                    return false;
                }
                m_paused = false;
                return true;
            }

            bool is_paused() const override {
                return m_paused;
            }

            size_t get_queued_size() const override {
                return 0;
            }

            void unbind_from_device() override {
                m_bound = false;
            }

            // Ask the callback for @p bytes, the way a device would
            std::vector<uint8_t> pump(size_t bytes) {
                std::vector<uint8_t> out(bytes, 0xAB);
                if (m_bound && !m_paused && m_callback) {
                    m_callback(m_userdata, out.data(), static_cast<int>(bytes));
                }
                return out;
            }

            // Pull @p frames float frames; only meaningful for f32 specs
            std::vector<float> pump_frames(size_t frames) {
                const auto bytes = pump(frames * m_spec.channels * sizeof(float));
                std::vector<float> out(frames * m_spec.channels);
                std::memcpy(out.data(), bytes.data(), bytes.size());
                return out;
            }

            [[nodiscard]] bool is_bound() const { return m_bound; }
            [[nodiscard]] const audio_spec& spec() const { return m_spec; }
    };

    class mock_backend : public audio_backend {
        private:
            bool m_initialized{false};
            std::vector<device_info> m_devices;
            std::map<uint32_t, audio_spec> m_device_specs;
            std::map<uint32_t, bool> m_device_paused;
            uint32_t m_next_handle{1};
            mutable std::mutex m_mutex;
            mock_stream* m_last_stream{nullptr};

        public:
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};
            std::atomic<int> open_device_calls{0};
            std::atomic<int> close_device_calls{0};
            std::atomic<int> create_stream_calls{0};

            // Error injection
            bool fail_init{false};
            bool fail_open_device{false};
            bool fail_create_stream{false};
            std::atomic<bool> device_lost{false};

            mock_backend() {
                device_info default_device;
                default_device.id = "mock_default";
                default_device.name = "Mock Default Device";
                default_device.channels = 2;
                default_device.sample_rate = 44100;
                default_device.is_default = true;
                m_devices.push_back(default_device);

                device_info secondary_device;
                secondary_device.id = "mock_secondary";
                secondary_device.name = "Mock Secondary Device";
                secondary_device.channels = 2;
                secondary_device.sample_rate = 48000;
                m_devices.push_back(secondary_device);
            }

            void init() override {
                init_calls++;
                if (fail_init) {
                    throw std::runtime_error("Mock backend init failed");
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                m_initialized = false;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_device_specs.clear();
                m_device_paused.clear();
            }

            bool is_initialized() const override {
                return m_initialized;
            }

            std::string get_name() const override {
                return "mock";
            }

            std::vector<device_info> enumerate_devices() override {
                if (!m_initialized) {
                    throw std::runtime_error("Backend not initialized");
                }
                return m_devices;
            }

            device_info get_default_device() override {
                if (!m_initialized) {
                    throw std::runtime_error("Backend not initialized");
                }
                return m_devices.front();
            }

            uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) override {
                open_device_calls++;
                if (!m_initialized) {
                    throw std::runtime_error("Backend not initialized");
                }
                if (fail_open_device) {
                    throw std::runtime_error("Mock open device failed");
                }
                if (!device_id.empty()) {
                    bool known = false;
                    for (const auto& d : m_devices) {
                        known = known || d.id == device_id;
                    }
                    if (!known) {
                        throw std::runtime_error("Device not found: " + device_id);
                    }
                }

                std::lock_guard<std::mutex> lock(m_mutex);
                uint32_t handle = m_next_handle++;
                m_device_specs[handle] = spec;
                m_device_paused[handle] = true;
                obtained_spec = spec;
                return handle;
            }

            void close_device(uint32_t device_handle) override {
                close_device_calls++;
                std::lock_guard<std::mutex> lock(m_mutex);
                m_device_specs.erase(device_handle);
                m_device_paused.erase(device_handle);
            }

            channels_t get_device_channels(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_specs.find(device_handle);
                return it != m_device_specs.end() ? it->second.channels : 0;
            }

            sample_rate_t get_device_frequency(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_specs.find(device_handle);
                return it != m_device_specs.end() ? it->second.freq : 0;
            }

            audio_format get_device_format(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_specs.find(device_handle);
                return it != m_device_specs.end() ? it->second.format : audio_format::unknown;
            }

            bool pause_device(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_device_paused.count(device_handle)) {
                    m_device_paused[device_handle] = true;
                    return true;
                }
                return false;
            }

            bool resume_device(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_device_paused.count(device_handle)) {
                    m_device_paused[device_handle] = false;
                    return true;
                }
                return false;
            }

            bool is_device_paused(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_device_paused.find(device_handle);
                return it != m_device_paused.end() ? it->second : true;
            }

            bool is_device_lost(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                return device_lost || m_device_specs.count(device_handle) == 0;
            }

            std::unique_ptr<audio_stream_interface> create_stream(
                uint32_t device_handle,
                const audio_spec& spec,
                audio_callback_t callback,
                void* userdata) override {
                create_stream_calls++;
                if (fail_create_stream) {
                    throw std::runtime_error("Mock create stream failed");
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_device_specs.count(device_handle) == 0) {
                    throw std::runtime_error("Invalid device handle");
                }
                auto stream = std::make_unique<mock_stream>(spec, callback, userdata);
                m_last_stream = stream.get();
                return stream;
            }

            // Last stream handed out; owned by whoever created it
            mock_stream* last_stream() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_last_stream;
            }

            size_t open_devices() const {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_device_specs.size();
            }
    };

} // namespace audiopipe::test

#endif // AUDIOPIPE_MOCK_BACKENDS_HH
