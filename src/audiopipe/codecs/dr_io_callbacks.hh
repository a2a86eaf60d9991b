#pragma once

#include <audiopipe/sdk/io_stream.hh>

#include <cstddef>
#include <cstdint>

namespace audiopipe::detail {

    /// Shared body of the dr_libs read callbacks
    inline size_t dr_read(void* user, void* dst, size_t len) {
        return static_cast<io_stream*>(user)->read(dst, len);
    }

    /**
     * Shared body of the dr_libs seek callbacks. Seeking at or past the end
     * of the stream is refused, dr_libs treats that as the end of data.
     */
    inline bool dr_seek(void* user, int offset, bool from_current) {
        auto* const stream = static_cast<io_stream*>(user);
        const auto size = stream->get_size();
        const auto cur = stream->tell();
        if (size < 0 || cur < 0) {
            return false;
        }
        const int64_t target = static_cast<int64_t>(offset) + (from_current ? cur : 0);
        if (target < 0 || target >= size) {
            return false;
        }
        return stream->seek(offset, from_current ? seek_origin::cur : seek_origin::set) >= 0;
    }

} // namespace audiopipe::detail
