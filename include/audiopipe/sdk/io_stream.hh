/**
 * @file io_stream.hh
 * @brief Binary input abstraction decoders read from
 * @ingroup sdk_io
 */

#ifndef AUDIOPIPE_SDK_IO_STREAM_H
#define AUDIOPIPE_SDK_IO_STREAM_H

#include <audiopipe/sdk/types.hh>
#include <audiopipe/sdk/export_audiopipe_sdk.h>
#include <memory>
#include <string>

namespace audiopipe {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup sdk_io
 */
enum class seek_origin : int {
    set = 0,  ///< From the beginning of the stream
    cur = 1,  ///< From the current position
    end = 2   ///< From the end of the stream
};

/**
 * @class io_stream
 * @brief Source handle of a track
 * @ingroup sdk_io
 *
 * A track owns exactly one io_stream for its whole lifetime. Codecs read
 * through it from the producer thread only, so implementations need not be
 * thread safe.
 *
 * @code
 * auto io = io_from_file("song.flac");
 * if (!io) {
 *     // file missing or unreadable
 * }
 * @endcode
 *
 * @see io_from_file(), io_from_memory(), decoder
 */
class io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read up to @p size_bytes into @p ptr
     * @return Bytes actually read, 0 on end of stream or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Move the read position
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /**
     * @return Current byte position, or -1 on error
     */
    virtual int64_t tell() = 0;

    /**
     * @return Total size in bytes, or -1 if unknown
     */
    virtual int64_t get_size() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @defgroup io_factory I/O Stream Factory Functions
 * @ingroup sdk_io
 * @{
 */

/**
 * @brief Open a file for binary reading
 * @return New stream, or nullptr if the file cannot be opened
 */
AUDIOPIPE_SDK_EXPORT std::unique_ptr<io_stream> io_from_file(const std::string& filename);

/**
 * @brief Read-only stream over caller owned memory
 * @note The memory must outlive the stream
 */
AUDIOPIPE_SDK_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/** @} */ // end of io_factory group

} // namespace audiopipe

#endif // AUDIOPIPE_SDK_IO_STREAM_H
