/**
 * @file buffer.hh
 * @brief Fixed-size heap buffer for sample data
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace audiopipe {
    /**
     * @class buffer
     * @brief Zero-initialised heap array whose size only changes on request
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * Every scratch area touched by the producer thread or the device
     * callback is a buffer. They are sized once, when a pipeline or sink is
     * built, and never grow implicitly, so the real-time paths never
     * allocate.
     *
     * @code
     * buffer<float> scratch(block_frames * channels);
     * scratch.zero();
     * std::copy_n(src, n, scratch.data());
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        /**
         * @brief Allocate @p size zero-initialised elements
         */
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        buffer(buffer&&) noexcept = default;
        buffer& operator=(buffer&&) noexcept = default;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_size == 0;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Bounds-checked element access
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /**
         * @brief Set every element back to T{}
         */
        void zero() noexcept {
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Discard contents and allocate @p new_size zeroed elements
         */
        void reset(std::size_t new_size) {
            m_data = std::make_unique<T[]>(new_size);
            m_size = new_size;
            zero();
        }

        /**
         * @brief Reallocate keeping the first min(old, new) elements
         *
         * Elements past the old size are zeroed.
         */
        void resize(std::size_t new_size) {
            auto new_data = std::make_unique<T[]>(new_size);
            const auto kept = std::min(new_size, m_size);
            std::memcpy(new_data.get(), m_data.get(), sizeof(T) * kept);
            std::fill(new_data.get() + kept, new_data.get() + new_size, T{});
            m_data.swap(new_data);
            m_size = new_size;
        }

        void swap(buffer& other) noexcept {
            m_data.swap(other.m_data);
            std::swap(m_size, other.m_size);
        }

        /// Unchecked access
        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size;
    };
}
