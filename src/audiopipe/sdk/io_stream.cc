#include <audiopipe/sdk/io_stream.hh>
#include <algorithm>
#include <fstream>
#include <cstring>

namespace audiopipe {

namespace {

class memory_stream : public io_stream {
public:
    memory_stream(const void* data, size_t size_bytes)
        : m_data(static_cast<const uint8_t*>(data)),
          m_size(size_bytes) {
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_size) {
            return 0;
        }
        size_t to_read = std::min(size_bytes, m_size - m_position);
        std::memcpy(ptr, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }
        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set:
                new_pos = offset;
                break;
            case seek_origin::cur:
                new_pos = static_cast<int64_t>(m_position) + offset;
                break;
            case seek_origin::end:
                new_pos = static_cast<int64_t>(m_size) + offset;
                break;
        }
        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_size)) {
            return -1;
        }
        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_size) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_position = 0;
    bool m_is_open = true;
};

class file_stream : public io_stream {
public:
    explicit file_stream(const std::string& filename)
        : m_file(filename, std::ios::binary | std::ios::in) {
        if (m_file.is_open()) {
            m_file.seekg(0, std::ios::end);
            m_size = static_cast<int64_t>(m_file.tellg());
            m_file.seekg(0, std::ios::beg);
        }
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        auto got = static_cast<size_t>(m_file.gcount());
        if (m_file.eof()) {
            // keep the stream seekable after a short read
            m_file.clear();
        }
        return got;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }
        std::ios::seekdir dir = std::ios::beg;
        switch (whence) {
            case seek_origin::set: dir = std::ios::beg; break;
            case seek_origin::cur: dir = std::ios::cur; break;
            case seek_origin::end: dir = std::ios::end; break;
        }
        m_file.clear();
        m_file.seekg(offset, dir);
        if (m_file.fail()) {
            m_file.clear();
            return -1;
        }
        return tell();
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        return is_open() ? m_size : -1;
    }

    void close() override {
        m_file.close();
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    std::ifstream m_file;
    int64_t m_size = -1;
};

} // anonymous namespace

std::unique_ptr<io_stream> io_from_file(const std::string& filename) {
    auto stream = std::make_unique<file_stream>(filename);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
    return std::make_unique<memory_stream>(mem, size_bytes);
}

} // namespace audiopipe
