#ifndef SEEKLINE_READER_BOUNDARY_SCANNER_H
#define SEEKLINE_READER_BOUNDARY_SCANNER_H

#include <seekline/source/byte_source.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace seekline {

/**
 * Locates line boundaries around an offset by reading the source in
 * fixed-size chunks. Only LF terminates a line; a CR directly before the LF
 * is excluded from the line content.
 */
class BoundaryScanner {
   public:
    BoundaryScanner(ByteSource &source, std::size_t chunk_size);

    void set_chunk_size(std::size_t chunk_size);
    std::size_t get_chunk_size() const { return chunk_size_; }

    /**
     * Walk backward from `origin` to the start of the line containing the
     * byte before it. With `skip_origin` the byte right before `origin` is
     * not tested, so a cursor sitting on a line start lands on the previous
     * line instead of finding its own start again.
     */
    std::uint64_t find_start_backward(std::uint64_t origin, bool skip_origin);

    /**
     * Start of the line following the LF found at or after `origin`.
     * Empty if no line follows (no LF, or LF is the last byte).
     */
    std::optional<std::uint64_t> find_start_forward(std::uint64_t origin);

    /**
     * End offset (terminator excluded) of the line starting at `start`
     */
    std::uint64_t find_end(std::uint64_t start);

   private:
    void read_chunk(std::uint64_t offset, std::size_t length);
    char read_byte(std::uint64_t offset);

    ByteSource &source_;
    std::uint64_t file_size_;
    std::size_t chunk_size_;
    std::vector<char> chunk_;
};

}  // namespace seekline

#endif  // SEEKLINE_READER_BOUNDARY_SCANNER_H
