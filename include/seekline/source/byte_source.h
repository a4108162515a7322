#ifndef SEEKLINE_SOURCE_BYTE_SOURCE_H
#define SEEKLINE_SOURCE_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>

namespace seekline {

/**
 * Seekable, readable resource backing a Reader.
 *
 * The total length is captured when the source is opened and is treated as
 * immutable for the lifetime of the source. Implementations report failures
 * by throwing ReaderError(FILE_IO_ERROR, ...).
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /**
     * Total length in bytes, captured at open time
     */
    virtual std::uint64_t size() const = 0;

    /**
     * Position the source at an absolute byte offset
     */
    virtual void seek(std::uint64_t offset) = 0;

    /**
     * Read up to `size` bytes at the current position
     * @return number of bytes read, 0 at end of data
     */
    virtual std::size_t read(char *buffer, std::size_t size) = 0;

    /**
     * Seek to `offset` and read until `size` bytes were transferred or the
     * source has no more data.
     * @return number of bytes read
     */
    std::size_t read_at(std::uint64_t offset, char *buffer, std::size_t size);
};

}  // namespace seekline

#endif  // SEEKLINE_SOURCE_BYTE_SOURCE_H
